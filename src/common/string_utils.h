#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace airwaiter {

inline std::string ToUpper(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char cha) { return std::toupper(cha); });
    return upper;
}

inline std::string TrimCopy(std::string_view str_view) {
    size_t b = 0;
    size_t e = str_view.size();
    while (b < e && (std::isspace(static_cast<unsigned char>(str_view[b])) != 0)) {
        ++b;
    }
    while (e > b && (std::isspace(static_cast<unsigned char>(str_view[e - 1])) != 0)) {
        --e;
    }
    return std::string(str_view.substr(b, e - b));
}

} // namespace airwaiter
