// src/detector/script_detector.cpp
#include "sid/detector/script_detector.hpp"
#include "sid/detector/script_aggregator.hpp"
#include "sid/script_table.hpp"
#include "sid/unicode/unicode_utils.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <string_view>
#include <thread>
#include <vector>

namespace sid {

class ScriptDetector::Impl {
public:
    explicit Impl(const DetectorConfig& config) : config_(config) {
        config_.validate();
    }

    DetectorConfig config_;

    size_t shard_count(size_t total) const;
    std::optional<Script> detect(std::u32string_view text) const;

    // Debug logging methods
    void log_detect_start(size_t total, std::int64_t half, size_t shards) const;
    void log_shard_outcome(size_t index, size_t length, const ShardOutcome& outcome) const;
    void log_result(const std::optional<Script>& result) const;
};

size_t ScriptDetector::Impl::shard_count(size_t total) const {
    size_t threads = static_cast<size_t>(config_.threads);
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }

    size_t by_size = (total + config_.min_shard_size - 1) / config_.min_shard_size;
    return std::max<size_t>(1, std::min(threads, by_size));
}

std::optional<Script> ScriptDetector::Impl::detect(std::u32string_view text) const {
    const size_t total = text.size();
    const std::int64_t half = majority_threshold(total);
    const size_t shards = shard_count(total);

    log_detect_start(total, half, shards);

    std::vector<ShardOutcome> outcomes;
    outcomes.reserve(shards);

    if (shards == 1) {
        outcomes.push_back(fold_shard(text, half));
        log_shard_outcome(0, total, outcomes.back());
    } else {
        const size_t shard_length = (total + shards - 1) / shards;
        auto shard_view = [&](size_t index) {
            size_t begin = std::min(index * shard_length, total);
            size_t end = std::min(begin + shard_length, total);
            return text.substr(begin, end - begin);
        };

        EarlyExitSignal signal;
        std::vector<std::future<ShardOutcome>> pending;
        pending.reserve(shards - 1);

        for (size_t i = 1; i < shards; ++i) {
            pending.push_back(std::async(std::launch::async, [&signal, &half, view = shard_view(i), i]() {
                return fold_shard(view, half, i, &signal);
            }));
        }

        // The calling thread takes the first shard
        outcomes.push_back(fold_shard(shard_view(0), half, 0, &signal));
        for (auto& future : pending) {
            outcomes.push_back(future.get());
        }

        for (size_t i = 0; i < outcomes.size(); ++i) {
            log_shard_outcome(i, shard_view(i).size(), outcomes[i]);
        }
    }

    auto result = reduce_shards(std::move(outcomes), half);
    log_result(result);
    return result;
}

void ScriptDetector::Impl::log_detect_start(size_t total, std::int64_t half, size_t shards) const {
    if (!config_.debug_logging) return;
    std::cout << "[DETECT] " << total << " code points, half = " << half
              << ", shards = " << shards << std::endl;
}

void ScriptDetector::Impl::log_shard_outcome(size_t index, size_t length, const ShardOutcome& outcome) const {
    if (!config_.debug_logging) return;
    std::cout << "[DETECT] Shard " << index << " (" << length << " code points): ";
    if (outcome.abandoned) {
        std::cout << "abandoned" << std::endl;
        return;
    }
    if (outcome.early_winner) {
        std::cout << "early winner " << *outcome.early_winner << std::endl;
        return;
    }
    const auto& table = script_table();
    bool any = false;
    for (size_t i = 0; i < kScriptCount; ++i) {
        auto count = outcome.counts(static_cast<Eigen::Index>(i));
        if (count == 0) continue;
        std::cout << table[i].script << "=" << count << " ";
        any = true;
    }
    if (!any) {
        std::cout << "no recognized characters";
    }
    std::cout << std::endl;
}

void ScriptDetector::Impl::log_result(const std::optional<Script>& result) const {
    if (!config_.debug_logging) return;
    std::cout << "[DETECT] Result: " << (result ? script_name(*result) : "none") << std::endl;
}

ScriptDetector::ScriptDetector() : pimpl_(std::make_unique<Impl>(DetectorConfig{})) {}

ScriptDetector::ScriptDetector(const DetectorConfig& config) : pimpl_(std::make_unique<Impl>(config)) {}

ScriptDetector::~ScriptDetector() = default;

ScriptDetector::ScriptDetector(ScriptDetector&&) noexcept = default;
ScriptDetector& ScriptDetector::operator=(ScriptDetector&&) noexcept = default;

std::optional<Script> ScriptDetector::detect(const std::string& text) const {
    return pimpl_->detect(unicode::to_code_points(text));
}

std::optional<Script> ScriptDetector::detect(const std::u32string& code_points) const {
    return pimpl_->detect(code_points);
}

size_t ScriptDetector::shard_count(size_t total_code_points) const {
    return pimpl_->shard_count(total_code_points);
}

const DetectorConfig& ScriptDetector::config() const noexcept {
    return pimpl_->config_;
}

void ScriptDetector::enable_debug_logging(bool enable) {
    pimpl_->config_.debug_logging = enable;
}

namespace {

const ScriptDetector& default_detector() {
    static const ScriptDetector detector;
    return detector;
}

} // anonymous namespace

std::optional<Script> detect_script(const std::string& text) {
    return default_detector().detect(text);
}

std::optional<Script> detect_script(const std::u32string& code_points) {
    return default_detector().detect(code_points);
}

} // namespace sid
