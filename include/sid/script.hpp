// include/sid/script.hpp
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

#include <unicode/uscript.h>

namespace sid {

// Writing systems recognized by the detector.
// Keep this in alphabetic order: the ordinal is exchanged with C bindings.
enum class Script : int {
    Arabic,
    Bengali,
    Cyrillic,
    Devanagari,
    Ethiopic,
    Georgian,
    Greek,
    Gujarati,
    Gurmukhi,
    Hangul,
    Hebrew,
    Hiragana,
    Kannada,
    Katakana,
    Khmer,
    Latin,
    Malayalam,
    Mandarin,
    Myanmar,
    Oriya,
    Sinhala,
    Tamil,
    Telugu,
    Thai,
};

constexpr std::size_t kScriptCount = 24;

// English display name, e.g. "Cyrillic"
const char* script_name(Script script) noexcept;

// Exact, case-sensitive lookup by display name
std::optional<Script> script_from_name(std::string_view name) noexcept;

// Stable numeric identity
constexpr int script_ordinal(Script script) noexcept {
    return static_cast<int>(script);
}

std::optional<Script> script_from_ordinal(int ordinal) noexcept;

// All scripts in ordinal order
const std::array<Script, kScriptCount>& all_scripts() noexcept;

// ICU script code of the corresponding Unicode Script property value
UScriptCode to_icu_script(Script script) noexcept;

std::ostream& operator<<(std::ostream& os, Script script);

} // namespace sid
