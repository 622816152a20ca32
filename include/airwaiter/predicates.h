#pragma once

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace airwaiter {

namespace detail {

template <typename T>
struct IsOptional : std::false_type {};

template <typename U>
struct IsOptional<std::optional<U>> : std::true_type {};

template <typename T>
struct IsVariant : std::false_type {};

template <typename... Us>
struct IsVariant<std::variant<Us...>> : std::true_type {};

template <typename T, typename = void>
struct HasEmpty : std::false_type {};

template <typename T>
struct HasEmpty<T, std::void_t<decltype(std::declval<const T&>().empty())>> : std::true_type {};

template <typename T, typename = void>
struct IsNullComparable : std::false_type {};

template <typename T>
struct IsNullComparable<T, std::void_t<decltype(std::declval<const T&>() == nullptr)>> : std::true_type {};

template <typename T>
struct AlwaysFalse : std::false_type {};

} // namespace detail

/**
 * Truthiness of a poll result.
 *
 * bool as is, numbers when non-zero, pointer-like values when not null,
 * optionals and variants by their content, ranges and strings when non-empty,
 * anything else through its explicit bool conversion.
 */
template <typename T>
bool IsTruthy(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value;
    } else if constexpr (std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, std::monostate>) {
        return false;
    } else if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T>) {
        return value != T{};
    } else if constexpr (detail::IsOptional<T>::value) {
        return value.has_value() && IsTruthy(*value);
    } else if constexpr (detail::IsVariant<T>::value) {
        return std::visit([](const auto& alternative) { return IsTruthy(alternative); }, value);
    } else if constexpr (std::is_pointer_v<T>) {
        return value != nullptr;
    } else if constexpr (detail::HasEmpty<T>::value) {
        return !value.empty();
    } else if constexpr (std::is_constructible_v<bool, const T&>) {
        return static_cast<bool>(value);
    } else {
        static_assert(detail::AlwaysFalse<T>::value, "Poll result type has no truthiness");
        return false;
    }
}

/**
 * True if the value is the "no value" sentinel: an empty optional, a null
 * pointer or std::monostate. Other types never are.
 */
template <typename T>
bool IsNone(const T& value) {
    if constexpr (std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, std::monostate>) {
        return true;
    } else if constexpr (detail::IsOptional<T>::value) {
        return !value.has_value();
    } else if constexpr (detail::IsVariant<T>::value) {
        return std::visit([](const auto& alternative) { return IsNone(alternative); }, value);
    } else if constexpr (std::is_pointer_v<T>) {
        return value == nullptr;
    } else if constexpr (
        !std::is_arithmetic_v<T> && detail::IsNullComparable<T>::value && std::is_constructible_v<bool, const T&>) {
        // smart pointers, std::function
        return !static_cast<bool>(value);
    } else {
        return false;
    }
}

/**
 * True only for a bool holding `expected`, possibly wrapped in an optional or
 * a variant. Truthy values of other types never match.
 */
template <typename T>
bool IsBoolValue(const T& value, bool expected) {
    if constexpr (std::is_same_v<T, bool>) {
        return value == expected;
    } else if constexpr (detail::IsOptional<T>::value) {
        return value.has_value() && IsBoolValue(*value, expected);
    } else if constexpr (detail::IsVariant<T>::value) {
        return std::visit([expected](const auto& alternative) { return IsBoolValue(alternative, expected); }, value);
    } else {
        return false;
    }
}

template <typename T>
bool IsTrueValue(const T& value) {
    return IsBoolValue(value, true);
}

template <typename T>
bool IsFalseValue(const T& value) {
    return IsBoolValue(value, false);
}

} // namespace airwaiter
