//# Unicode Utilities Header File

#pragma once

#include <string>

namespace sid::unicode {

// Replacement character substituted for ill-formed UTF-8
constexpr char32_t kReplacementChar = 0xFFFD;

// Check if a code point is ignored by script classification:
// ASCII controls, whitespace, digits and punctuation
bool is_stop_char(char32_t codepoint) noexcept;

// Decode UTF-8 into code points; ill-formed sequences become U+FFFD
std::u32string to_code_points(const std::string& text);

} // namespace sid::unicode
