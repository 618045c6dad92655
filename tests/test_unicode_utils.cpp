// tests/test_unicode_utils.cpp
#include "sid/unicode/unicode_utils.hpp"
#include <iostream>
#include <string>

namespace {

int failures = 0;

void check(bool condition, const std::string& what) {
    if (!condition) {
        std::cerr << "FAILED: " << what << std::endl;
        ++failures;
    }
}

} // namespace

int main() {
    using namespace sid::unicode;

    std::cout << "=== Test 1: Stop characters ===" << std::endl;
    for (char32_t ch : U" \t\n0123456789!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~") {
        if (ch == 0) continue;
        check(is_stop_char(ch), "ASCII stop character " + std::to_string(static_cast<unsigned>(ch)));
    }
    check(is_stop_char(0x0000), "NUL");
    check(!is_stop_char(U'A') && !is_stop_char(U'Z'), "uppercase letters");
    check(!is_stop_char(U'a') && !is_stop_char(U'z'), "lowercase letters");
    check(!is_stop_char(0x007F), "DEL is not a stop character");
    check(!is_stop_char(0x00A0), "no-break space is not a stop character");
    check(!is_stop_char(0x060C), "arabic comma is not a stop character");
    check(!is_stop_char(0x3000), "ideographic space is not a stop character");

    std::cout << "\n=== Test 2: UTF-8 decoding ===" << std::endl;
    check(to_code_points("").empty(), "empty input");
    check(to_code_points("Hi!") == U"Hi!", "ASCII");
    check(to_code_points("\xD0\x9F\xD1\x80\xD0\xB8") == U"При", "two-byte sequences");
    check(to_code_points("\xE4\xB8\xAD") == U"中", "three-byte sequence");
    check(to_code_points("\xF0\x9F\x98\x8A") == U"\U0001F60A", "four-byte sequence");

    std::cout << "\n=== Test 3: Ill-formed UTF-8 ===" << std::endl;
    check(to_code_points("a\xFF" "b") == std::u32string{U'a', kReplacementChar, U'b'}, "invalid lead byte");
    check(to_code_points("\x80") == std::u32string{kReplacementChar}, "stray continuation byte");
    check(to_code_points("\xE4\xB8") == std::u32string{kReplacementChar}, "truncated sequence");
    check(to_code_points("\xED\xA0\x80").front() == kReplacementChar, "encoded surrogate");

    if (failures > 0) {
        std::cerr << "\n" << failures << " check(s) failed" << std::endl;
        return 1;
    }
    std::cout << "\n=== All tests completed successfully! ===" << std::endl;
    return 0;
}
