#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace text {

inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

inline std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(kWhitespace);
    return s.substr(start, end - start + 1);
}

inline std::string trimmed(std::string_view s) {
    return std::string(trim(s));
}

// Counts code points, not bytes, so CJK text is measured like Latin text.
inline size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

} // namespace text
