// src/detector/script_aggregator.cpp
#include "sid/detector/script_aggregator.hpp"
#include "sid/script_table.hpp"
#include "sid/unicode/unicode_utils.hpp"
#include <utility>

namespace sid {

namespace {

// How often a running shard looks at the shared early-exit signal
constexpr size_t kSignalCheckInterval = 1024;

std::optional<Script> first_over_half(const ScriptCounts& counts, std::int64_t half) {
    const auto& table = script_table();
    for (size_t i = 0; i < kScriptCount; ++i) {
        if (counts(static_cast<Eigen::Index>(i)) > half) {
            return table[i].script;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

void EarlyExitSignal::record(size_t shard_index) noexcept {
    size_t current = first_exited_.load(std::memory_order_relaxed);
    while (shard_index < current &&
           !first_exited_.compare_exchange_weak(current, shard_index, std::memory_order_relaxed)) {
    }
}

bool EarlyExitSignal::supersedes(size_t shard_index) const noexcept {
    return first_exited_.load(std::memory_order_relaxed) < shard_index;
}

ShardOutcome fold_shard(std::u32string_view shard, std::int64_t half,
                        size_t shard_index, EarlyExitSignal* signal) {
    ShardOutcome outcome;
    const auto& table = script_table();

    for (size_t pos = 0; pos < shard.size(); ++pos) {
        if (signal && pos % kSignalCheckInterval == 0 && signal->supersedes(shard_index)) {
            outcome.abandoned = true;
            return outcome;
        }

        const char32_t ch = shard[pos];
        if (unicode::is_stop_char(ch)) {
            continue;
        }

        const auto index = classify_index(ch);
        if (!index) {
            continue;
        }

        auto& slot = outcome.counts(static_cast<Eigen::Index>(*index));
        ++slot;
        if (slot > half) {
            outcome.early_winner = table[*index].script;
            if (signal) {
                signal->record(shard_index);
            }
            return outcome;
        }
    }

    return outcome;
}

std::optional<Script> merge_counts(ScriptCounts& lhs, const ScriptCounts& rhs, std::int64_t half) {
    lhs += rhs;
    return first_over_half(lhs, half);
}

std::optional<Script> reduce_shards(std::vector<ShardOutcome> outcomes, std::int64_t half) {
    if (outcomes.empty()) {
        return std::nullopt;
    }

    // Shards after an early exit may have been abandoned, so only the
    // first exit in shard order is meaningful
    for (const auto& outcome : outcomes) {
        if (outcome.early_winner) {
            return outcome.early_winner;
        }
    }

    std::vector<ScriptCounts> level;
    level.reserve(outcomes.size());
    for (auto& outcome : outcomes) {
        level.push_back(std::move(outcome.counts));
    }

    while (level.size() > 1) {
        std::vector<ScriptCounts> next;
        next.reserve((level.size() + 1) / 2);

        for (size_t i = 0; i < level.size(); i += 2) {
            if (i + 1 == level.size()) {
                next.push_back(std::move(level[i]));
                break;
            }

            ScriptCounts merged = level[i];
            if (auto winner = merge_counts(merged, level[i + 1], half)) {
                return winner;
            }
            next.push_back(std::move(merged));
        }

        level = std::move(next);
    }

    return select_winner(level.front());
}

std::optional<Script> select_winner(const ScriptCounts& counts) {
    // Counts are never negative
    if (counts.sum() == 0) {
        return std::nullopt;
    }

    size_t best = 0;
    for (size_t i = 1; i < kScriptCount; ++i) {
        // >= so the last of equal maxima wins
        if (counts(static_cast<Eigen::Index>(i)) >= counts(static_cast<Eigen::Index>(best))) {
            best = i;
        }
    }
    return script_table()[best].script;
}

} // namespace sid
