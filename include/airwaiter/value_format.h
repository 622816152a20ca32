#pragma once

#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include "airwaiter/predicates.h"

namespace airwaiter {

namespace detail {

template <typename T, typename = void>
struct IsStreamable : std::false_type {};

template <typename T>
struct IsStreamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

} // namespace detail

/**
 * Text form of a poll result for logs and timeout messages.
 * Falls back to the type name when the value can not be printed.
 */
template <typename T>
std::string FormatValue(const T& value) {
    if constexpr (std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, std::monostate>) {
        return "None";
    } else if constexpr (detail::IsOptional<T>::value) {
        return value.has_value() ? FormatValue(*value) : "None";
    } else if constexpr (detail::IsVariant<T>::value) {
        return std::visit([](const auto& alternative) { return FormatValue(alternative); }, value);
    } else if constexpr (fmt::is_formattable<T>::value) {
        return fmt::format("{}", value);
    } else if constexpr (detail::IsStreamable<T>::value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return fmt::format("<{}>", typeid(T).name());
    }
}

} // namespace airwaiter
