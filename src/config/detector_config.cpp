// src/config/detector_config.cpp
#include "sid/config/detector_config.hpp"
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace sid {

namespace {

const nlohmann::json& detector_section(const nlohmann::json& json) {
    if (json.contains("detector")) {
        const auto& section = json["detector"];
        if (!section.is_object()) {
            throw std::runtime_error("Config value is not an object: detector");
        }
        return section;
    }
    return json;
}

} // anonymous namespace

void DetectorConfig::validate() const {
    if (threads < 0) {
        throw std::runtime_error("Invalid config: threads must not be negative");
    }
    if (min_shard_size == 0) {
        throw std::runtime_error("Invalid config: min_shard_size must be positive");
    }
}

void DetectorConfig::print() const {
    std::cout << "=== Detector Configuration ===" << std::endl;
    std::cout << "Threads: " << (threads == 0 ? std::string("auto") : std::to_string(threads)) << std::endl;
    std::cout << "Min Shard Size: " << min_shard_size << std::endl;
    std::cout << "Debug Logging: " << (debug_logging ? "true" : "false") << std::endl;
    std::cout << "==============================" << std::endl;
}

DetectorConfig DetectorConfig::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::runtime_error("Invalid config: top level is not an object");
    }

    const auto& section = detector_section(json);
    DetectorConfig config;

    if (section.contains("threads")) {
        const auto& value = section["threads"];
        if (!value.is_number_integer()) {
            throw std::runtime_error("Config value is not an integer: threads");
        }
        if (value.is_number_unsigned()
                ? value.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<int>::max())
                : (value.get<long long>() > std::numeric_limits<int>::max() ||
                   value.get<long long>() < std::numeric_limits<int>::min())) {
            throw std::runtime_error("Invalid config: threads out of range");
        }
        config.threads = value.get<int>();
    }

    if (section.contains("min_shard_size")) {
        const auto& value = section["min_shard_size"];
        if (!value.is_number_integer()) {
            throw std::runtime_error("Config value is not an integer: min_shard_size");
        }
        if (!value.is_number_unsigned() && value.get<long long>() < 0) {
            throw std::runtime_error("Invalid config: min_shard_size must be positive");
        }
        config.min_shard_size = value.get<size_t>();
    }

    if (section.contains("debug_logging")) {
        if (!section["debug_logging"].is_boolean()) {
            throw std::runtime_error("Config value is not a boolean: debug_logging");
        }
        config.debug_logging = section["debug_logging"].get<bool>();
    }

    config.validate();
    return config;
}

nlohmann::json DetectorConfig::to_json() const {
    return nlohmann::json{
        {"detector", {
            {"threads", threads},
            {"min_shard_size", min_shard_size},
            {"debug_logging", debug_logging}
        }}
    };
}

DetectorConfig load_detector_config(const std::filesystem::path& config_path) {
    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + config_path.string());
        }

        nlohmann::json json = nlohmann::json::parse(file);
        return DetectorConfig::from_json(json);

    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load detector config: " + std::string(e.what()));
    }
}

void save_detector_config(const DetectorConfig& config, const std::filesystem::path& config_path) {
    try {
        config.validate();

        std::ofstream file(config_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file for writing: " + config_path.string());
        }

        file << config.to_json().dump(2); // Pretty print with 2-space indentation

    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to save detector config: " + std::string(e.what()));
    }
}

} // namespace sid
