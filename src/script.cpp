// src/script.cpp
#include "sid/script.hpp"

namespace sid {

const char* script_name(Script script) noexcept {
    switch (script) {
        case Script::Latin:      return "Latin";
        case Script::Cyrillic:   return "Cyrillic";
        case Script::Arabic:     return "Arabic";
        case Script::Devanagari: return "Devanagari";
        case Script::Hiragana:   return "Hiragana";
        case Script::Katakana:   return "Katakana";
        case Script::Ethiopic:   return "Ethiopic";
        case Script::Hebrew:     return "Hebrew";
        case Script::Bengali:    return "Bengali";
        case Script::Georgian:   return "Georgian";
        case Script::Mandarin:   return "Mandarin";
        case Script::Hangul:     return "Hangul";
        case Script::Greek:      return "Greek";
        case Script::Kannada:    return "Kannada";
        case Script::Tamil:      return "Tamil";
        case Script::Thai:       return "Thai";
        case Script::Gujarati:   return "Gujarati";
        case Script::Gurmukhi:   return "Gurmukhi";
        case Script::Telugu:     return "Telugu";
        case Script::Malayalam:  return "Malayalam";
        case Script::Oriya:      return "Oriya";
        case Script::Myanmar:    return "Myanmar";
        case Script::Sinhala:    return "Sinhala";
        case Script::Khmer:      return "Khmer";
    }
    // Only reachable through a cast from an out-of-range integer
    return "";
}

std::optional<Script> script_from_name(std::string_view name) noexcept {
    for (Script script : all_scripts()) {
        if (name == script_name(script)) {
            return script;
        }
    }
    return std::nullopt;
}

std::optional<Script> script_from_ordinal(int ordinal) noexcept {
    if (ordinal < 0 || ordinal >= static_cast<int>(kScriptCount)) {
        return std::nullopt;
    }
    return static_cast<Script>(ordinal);
}

const std::array<Script, kScriptCount>& all_scripts() noexcept {
    static const std::array<Script, kScriptCount> scripts = {
        Script::Arabic,   Script::Bengali,   Script::Cyrillic, Script::Devanagari,
        Script::Ethiopic, Script::Georgian,  Script::Greek,    Script::Gujarati,
        Script::Gurmukhi, Script::Hangul,    Script::Hebrew,   Script::Hiragana,
        Script::Kannada,  Script::Katakana,  Script::Khmer,    Script::Latin,
        Script::Malayalam, Script::Mandarin, Script::Myanmar,  Script::Oriya,
        Script::Sinhala,  Script::Tamil,     Script::Telugu,   Script::Thai
    };
    return scripts;
}

UScriptCode to_icu_script(Script script) noexcept {
    switch (script) {
        case Script::Arabic:     return USCRIPT_ARABIC;
        case Script::Bengali:    return USCRIPT_BENGALI;
        case Script::Cyrillic:   return USCRIPT_CYRILLIC;
        case Script::Devanagari: return USCRIPT_DEVANAGARI;
        case Script::Ethiopic:   return USCRIPT_ETHIOPIC;
        case Script::Georgian:   return USCRIPT_GEORGIAN;
        case Script::Greek:      return USCRIPT_GREEK;
        case Script::Gujarati:   return USCRIPT_GUJARATI;
        case Script::Gurmukhi:   return USCRIPT_GURMUKHI;
        case Script::Hangul:     return USCRIPT_HANGUL;
        case Script::Hebrew:     return USCRIPT_HEBREW;
        case Script::Hiragana:   return USCRIPT_HIRAGANA;
        case Script::Kannada:    return USCRIPT_KANNADA;
        case Script::Katakana:   return USCRIPT_KATAKANA;
        case Script::Khmer:      return USCRIPT_KHMER;
        case Script::Latin:      return USCRIPT_LATIN;
        case Script::Malayalam:  return USCRIPT_MALAYALAM;
        case Script::Mandarin:   return USCRIPT_HAN;
        case Script::Myanmar:    return USCRIPT_MYANMAR;
        case Script::Oriya:      return USCRIPT_ORIYA;
        case Script::Sinhala:    return USCRIPT_SINHALA;
        case Script::Tamil:      return USCRIPT_TAMIL;
        case Script::Telugu:     return USCRIPT_TELUGU;
        case Script::Thai:       return USCRIPT_THAI;
    }
    return USCRIPT_INVALID_CODE;
}

std::ostream& operator<<(std::ostream& os, Script script) {
    return os << script_name(script);
}

} // namespace sid
