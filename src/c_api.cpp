// src/c_api.cpp
#include "sid/c_api.h"
#include "sid/detector/script_detector.hpp"
#include <exception>
#include <iostream>
#include <string>

int sid_detect_script(const char* utf8, size_t len) {
    if (utf8 == nullptr || len == 0) {
        return -1;
    }

    try {
        auto script = sid::detect_script(std::string(utf8, len));
        return script ? sid::script_ordinal(*script) : -1;
    } catch (const std::exception& e) {
        // Exceptions must not cross the C boundary
        std::cerr << "sid_detect_script failed: " << e.what() << std::endl;
        return -1;
    }
}

const char* sid_script_name(int ordinal) {
    auto script = sid::script_from_ordinal(ordinal);
    return script ? sid::script_name(*script) : nullptr;
}

int sid_script_count(void) {
    return static_cast<int>(sid::kScriptCount);
}
