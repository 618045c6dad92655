// include/sid/detector/script_detector.hpp
#pragma once

#include "sid/config/detector_config.hpp"
#include "sid/script.hpp"
#include <memory>
#include <optional>
#include <string>

namespace sid {

class ScriptDetector {
public:
    ScriptDetector();
    explicit ScriptDetector(const DetectorConfig& config);
    ~ScriptDetector();

    ScriptDetector(ScriptDetector&&) noexcept;
    ScriptDetector& operator=(ScriptDetector&&) noexcept;

    // Dominant script of UTF-8 text, or none when no character is
    // recognized
    std::optional<Script> detect(const std::string& text) const;
    std::optional<Script> detect(const std::u32string& code_points) const;

    // Number of shards an input of total_code_points is split into
    size_t shard_count(size_t total_code_points) const;

    const DetectorConfig& config() const noexcept;

    // Debug methods
    void enable_debug_logging(bool enable);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

// Shorthands using a process-wide detector with the default configuration
std::optional<Script> detect_script(const std::string& text);
std::optional<Script> detect_script(const std::u32string& code_points);

} // namespace sid
