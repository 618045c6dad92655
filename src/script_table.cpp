// src/script_table.cpp
#include "sid/script_table.hpp"

namespace sid {

namespace {

constexpr bool in(char32_t ch, char32_t first, char32_t last) noexcept {
    return ch >= first && ch <= last;
}

} // anonymous namespace

// https://en.wikipedia.org/wiki/Latin_script_in_Unicode
bool is_latin(char32_t ch) noexcept {
    return in(ch, U'a', U'z') ||
           in(ch, U'A', U'Z') ||
           in(ch, 0x0080, 0x00FF) ||
           in(ch, 0x0100, 0x017F) ||
           in(ch, 0x0180, 0x024F) ||
           in(ch, 0x0250, 0x02AF) ||
           in(ch, 0x1D00, 0x1D7F) ||
           in(ch, 0x1D80, 0x1DBF) ||
           in(ch, 0x1E00, 0x1EFF) ||
           in(ch, 0x2100, 0x214F) ||
           in(ch, 0x2C60, 0x2C7F) ||
           in(ch, 0xA720, 0xA7FF) ||
           in(ch, 0xAB30, 0xAB6F);
}

bool is_cyrillic(char32_t ch) noexcept {
    return in(ch, 0x0400, 0x0484) ||
           in(ch, 0x0487, 0x052F) ||
           in(ch, 0x2DE0, 0x2DFF) ||
           in(ch, 0xA640, 0xA69D) ||
           ch == 0x1D2B ||
           ch == 0x1D78 ||
           ch == 0xA69F;
}

// https://en.wikipedia.org/wiki/Arabic_script_in_Unicode
bool is_arabic(char32_t ch) noexcept {
    return in(ch, 0x0600, 0x06FF) ||
           in(ch, 0x0750, 0x07FF) ||
           in(ch, 0x08A0, 0x08FF) ||
           in(ch, 0xFB50, 0xFDFF) ||
           in(ch, 0xFE70, 0xFEFF) ||
           in(ch, 0x10E60, 0x10E7F) ||
           in(ch, 0x1EE00, 0x1EEFF);
}

// CJK radicals, Kangxi radicals, ideographic iteration/number marks,
// Extension A, unified ideographs and compatibility ideographs
bool is_mandarin(char32_t ch) noexcept {
    return in(ch, 0x2E80, 0x2E99) ||
           in(ch, 0x2E9B, 0x2EF3) ||
           in(ch, 0x2F00, 0x2FD5) ||
           ch == 0x3005 ||
           ch == 0x3007 ||
           in(ch, 0x3021, 0x3029) ||
           in(ch, 0x3038, 0x303B) ||
           in(ch, 0x3400, 0x4DB5) ||
           in(ch, 0x4E00, 0x9FCC) ||
           in(ch, 0xF900, 0xFA6D) ||
           in(ch, 0xFA70, 0xFAD9);
}

// https://en.wikipedia.org/wiki/Devanagari#Unicode
bool is_devanagari(char32_t ch) noexcept {
    return in(ch, 0x0900, 0x097F) ||
           in(ch, 0xA8E0, 0xA8FF) ||
           in(ch, 0x1CD0, 0x1CFF);
}

bool is_hebrew(char32_t ch) noexcept {
    return in(ch, 0x0590, 0x05FF);
}

// Ethiopic, Ethiopic Supplement, Extended and Extended-A
bool is_ethiopic(char32_t ch) noexcept {
    return in(ch, 0x1200, 0x139F) ||
           in(ch, 0x2D80, 0x2DDF) ||
           in(ch, 0xAB00, 0xAB2F);
}

bool is_georgian(char32_t ch) noexcept {
    return in(ch, 0x10A0, 0x10FF);
}

bool is_bengali(char32_t ch) noexcept {
    return in(ch, 0x0980, 0x09FF);
}

// Syllables, Jamo, compatibility Jamo, enclosed CJK letters, Jamo
// Extended-A/B and the halfwidth/fullwidth forms block
bool is_hangul(char32_t ch) noexcept {
    return in(ch, 0xAC00, 0xD7AF) ||
           in(ch, 0x1100, 0x11FF) ||
           in(ch, 0x3130, 0x318F) ||
           in(ch, 0x3200, 0x32FF) ||
           in(ch, 0xA960, 0xA97F) ||
           in(ch, 0xD7B0, 0xD7FF) ||
           in(ch, 0xFF00, 0xFFEF);
}

bool is_hiragana(char32_t ch) noexcept {
    return in(ch, 0x3040, 0x309F);
}

bool is_katakana(char32_t ch) noexcept {
    return in(ch, 0x30A0, 0x30FF);
}

// Greek and Coptic
bool is_greek(char32_t ch) noexcept {
    return in(ch, 0x0370, 0x03FF);
}

bool is_kannada(char32_t ch) noexcept {
    return in(ch, 0x0C80, 0x0CFF);
}

bool is_tamil(char32_t ch) noexcept {
    return in(ch, 0x0B80, 0x0BFF);
}

bool is_thai(char32_t ch) noexcept {
    return in(ch, 0x0E00, 0x0E7F);
}

bool is_gujarati(char32_t ch) noexcept {
    return in(ch, 0x0A80, 0x0AFF);
}

// Gurmukhi is the script for Punjabi
bool is_gurmukhi(char32_t ch) noexcept {
    return in(ch, 0x0A00, 0x0A7F);
}

bool is_telugu(char32_t ch) noexcept {
    return in(ch, 0x0C00, 0x0C7F);
}

bool is_malayalam(char32_t ch) noexcept {
    return in(ch, 0x0D00, 0x0D7F);
}

bool is_oriya(char32_t ch) noexcept {
    return in(ch, 0x0B00, 0x0B7F);
}

bool is_myanmar(char32_t ch) noexcept {
    return in(ch, 0x1000, 0x109F);
}

bool is_sinhala(char32_t ch) noexcept {
    return in(ch, 0x0D80, 0x0DFF);
}

// Khmer and Khmer Symbols
bool is_khmer(char32_t ch) noexcept {
    return in(ch, 0x1780, 0x17FF) ||
           in(ch, 0x19E0, 0x19FF);
}

const ScriptTable& script_table() noexcept {
    static const ScriptTable table = {{
        {Script::Latin,      is_latin},
        {Script::Cyrillic,   is_cyrillic},
        {Script::Arabic,     is_arabic},
        {Script::Mandarin,   is_mandarin},
        {Script::Devanagari, is_devanagari},
        {Script::Hebrew,     is_hebrew},
        {Script::Ethiopic,   is_ethiopic},
        {Script::Georgian,   is_georgian},
        {Script::Bengali,    is_bengali},
        {Script::Hangul,     is_hangul},
        {Script::Hiragana,   is_hiragana},
        {Script::Katakana,   is_katakana},
        {Script::Greek,      is_greek},
        {Script::Kannada,    is_kannada},
        {Script::Tamil,      is_tamil},
        {Script::Thai,       is_thai},
        {Script::Gujarati,   is_gujarati},
        {Script::Gurmukhi,   is_gurmukhi},
        {Script::Telugu,     is_telugu},
        {Script::Malayalam,  is_malayalam},
        {Script::Oriya,      is_oriya},
        {Script::Myanmar,    is_myanmar},
        {Script::Sinhala,    is_sinhala},
        {Script::Khmer,      is_khmer},
    }};
    return table;
}

std::size_t table_index(Script script) noexcept {
    switch (script) {
        case Script::Latin:      return 0;
        case Script::Cyrillic:   return 1;
        case Script::Arabic:     return 2;
        case Script::Mandarin:   return 3;
        case Script::Devanagari: return 4;
        case Script::Hebrew:     return 5;
        case Script::Ethiopic:   return 6;
        case Script::Georgian:   return 7;
        case Script::Bengali:    return 8;
        case Script::Hangul:     return 9;
        case Script::Hiragana:   return 10;
        case Script::Katakana:   return 11;
        case Script::Greek:      return 12;
        case Script::Kannada:    return 13;
        case Script::Tamil:      return 14;
        case Script::Thai:       return 15;
        case Script::Gujarati:   return 16;
        case Script::Gurmukhi:   return 17;
        case Script::Telugu:     return 18;
        case Script::Malayalam:  return 19;
        case Script::Oriya:      return 20;
        case Script::Myanmar:    return 21;
        case Script::Sinhala:    return 22;
        case Script::Khmer:      return 23;
    }
    return kScriptCount;
}

bool matches(Script script, char32_t ch) noexcept {
    switch (script) {
        case Script::Arabic:     return is_arabic(ch);
        case Script::Bengali:    return is_bengali(ch);
        case Script::Cyrillic:   return is_cyrillic(ch);
        case Script::Devanagari: return is_devanagari(ch);
        case Script::Ethiopic:   return is_ethiopic(ch);
        case Script::Georgian:   return is_georgian(ch);
        case Script::Greek:      return is_greek(ch);
        case Script::Gujarati:   return is_gujarati(ch);
        case Script::Gurmukhi:   return is_gurmukhi(ch);
        case Script::Hangul:     return is_hangul(ch);
        case Script::Hebrew:     return is_hebrew(ch);
        case Script::Hiragana:   return is_hiragana(ch);
        case Script::Kannada:    return is_kannada(ch);
        case Script::Katakana:   return is_katakana(ch);
        case Script::Khmer:      return is_khmer(ch);
        case Script::Latin:      return is_latin(ch);
        case Script::Malayalam:  return is_malayalam(ch);
        case Script::Mandarin:   return is_mandarin(ch);
        case Script::Myanmar:    return is_myanmar(ch);
        case Script::Oriya:      return is_oriya(ch);
        case Script::Sinhala:    return is_sinhala(ch);
        case Script::Tamil:      return is_tamil(ch);
        case Script::Telugu:     return is_telugu(ch);
        case Script::Thai:       return is_thai(ch);
    }
    return false;
}

std::optional<std::size_t> classify_index(char32_t ch) noexcept {
    const auto& table = script_table();
    for (std::size_t i = 0; i < table.size(); ++i) {
        if (table[i].matches(ch)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<Script> classify(char32_t ch) noexcept {
    if (auto index = classify_index(ch)) {
        return script_table()[*index].script;
    }
    return std::nullopt;
}

} // namespace sid
