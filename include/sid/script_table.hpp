// include/sid/script_table.hpp
#pragma once

#include "sid/script.hpp"
#include <array>
#include <optional>

namespace sid {

// Unicode block membership tests, one per script
bool is_latin(char32_t ch) noexcept;
bool is_cyrillic(char32_t ch) noexcept;
bool is_arabic(char32_t ch) noexcept;
bool is_mandarin(char32_t ch) noexcept;
bool is_devanagari(char32_t ch) noexcept;
bool is_hebrew(char32_t ch) noexcept;
bool is_ethiopic(char32_t ch) noexcept;
bool is_georgian(char32_t ch) noexcept;
bool is_bengali(char32_t ch) noexcept;
bool is_hangul(char32_t ch) noexcept;
bool is_hiragana(char32_t ch) noexcept;
bool is_katakana(char32_t ch) noexcept;
bool is_greek(char32_t ch) noexcept;
bool is_kannada(char32_t ch) noexcept;
bool is_tamil(char32_t ch) noexcept;
bool is_thai(char32_t ch) noexcept;
bool is_gujarati(char32_t ch) noexcept;
bool is_gurmukhi(char32_t ch) noexcept;
bool is_telugu(char32_t ch) noexcept;
bool is_malayalam(char32_t ch) noexcept;
bool is_oriya(char32_t ch) noexcept;
bool is_myanmar(char32_t ch) noexcept;
bool is_sinhala(char32_t ch) noexcept;
bool is_khmer(char32_t ch) noexcept;

struct ScriptChecker {
    Script script;
    bool (*matches)(char32_t) noexcept;
};

using ScriptTable = std::array<ScriptChecker, kScriptCount>;

// Ordered predicate table. The order decides which script claims a code
// point matched by more than one predicate, and breaks count ties (last
// entry wins).
const ScriptTable& script_table() noexcept;

// Position of a script in script_table()
std::size_t table_index(Script script) noexcept;

// Whether ch belongs to the given script's blocks
bool matches(Script script, char32_t ch) noexcept;

// Table position of the first predicate that accepts ch
std::optional<std::size_t> classify_index(char32_t ch) noexcept;

// First script in table order whose predicate accepts ch
std::optional<Script> classify(char32_t ch) noexcept;

} // namespace sid
