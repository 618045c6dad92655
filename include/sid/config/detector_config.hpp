#pragma once

#include <string>
#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace sid {

struct DetectorConfig {
    // Worker shards; 0 uses std::thread::hardware_concurrency()
    int threads = 0;

    // Inputs shorter than this many code points are never split
    size_t min_shard_size = 4096;

    // Debug and logging
    bool debug_logging = false;

    // Throws std::runtime_error describing the first invalid field
    void validate() const;

    // Display all parameters
    void print() const;

    // Reads the optional "detector" section; missing keys keep defaults
    static DetectorConfig from_json(const nlohmann::json& json);
    nlohmann::json to_json() const;
};

DetectorConfig load_detector_config(const std::filesystem::path& config_path);
void save_detector_config(const DetectorConfig& config, const std::filesystem::path& config_path);

} // namespace sid
