// src/unicode/unicode_utils.cpp
#include "sid/unicode/unicode_utils.hpp"
#include <unicode/utf8.h>

namespace sid::unicode {

bool is_stop_char(char32_t codepoint) noexcept {
    return codepoint <= 0x0040 ||
           (codepoint >= 0x005B && codepoint <= 0x0060) ||
           (codepoint >= 0x007B && codepoint <= 0x007E);
}

std::u32string to_code_points(const std::string& text) {
    std::u32string code_points;
    code_points.reserve(text.size());

    const char* data = text.data();
    const size_t length = text.size();

    for (size_t i = 0; i < length; ) {
        UChar32 codepoint;
        // Decode UTF-8, advancing i past the sequence
        U8_NEXT(data, i, length, codepoint);

        if (codepoint < 0) {
            // Ill-formed sequence: substitute and keep going
            code_points.push_back(kReplacementChar);
            continue;
        }

        code_points.push_back(static_cast<char32_t>(codepoint));
    }

    return code_points;
}

} // namespace sid::unicode
