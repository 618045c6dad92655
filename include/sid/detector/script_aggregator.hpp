// include/sid/detector/script_aggregator.hpp
#pragma once

#include "sid/script.hpp"
#include <Eigen/Dense>
#include <atomic>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

namespace sid {

// Per-script tallies, indexed by position in script_table()
using ScriptCounts = Eigen::Matrix<std::int64_t, static_cast<int>(kScriptCount), 1>;

struct ShardOutcome {
    ScriptCounts counts = ScriptCounts::Zero();
    std::optional<Script> early_winner;
    // Stopped because a lower-index shard already found a winner
    bool abandoned = false;
};

// Shared between the shards of one call. Records the lowest shard index
// that exited early; shards after it can stop.
class EarlyExitSignal {
public:
    void record(size_t shard_index) noexcept;
    bool supersedes(size_t shard_index) const noexcept;

private:
    std::atomic<size_t> first_exited_{std::numeric_limits<size_t>::max()};
};

// Majority threshold for an input of total_code_points characters
constexpr std::int64_t majority_threshold(size_t total_code_points) noexcept {
    return static_cast<std::int64_t>(total_code_points / 2);
}

// Counts one contiguous shard, stopping as soon as a slot exceeds half.
// signal may be null for single-shard runs.
ShardOutcome fold_shard(std::u32string_view shard, std::int64_t half,
                        size_t shard_index = 0, EarlyExitSignal* signal = nullptr);

// Elementwise sum into lhs; returns the script whose combined slot
// exceeds half, if any
std::optional<Script> merge_counts(ScriptCounts& lhs, const ScriptCounts& rhs, std::int64_t half);

// Final decision for shard outcomes given in shard order. The lowest-index
// early winner takes precedence; otherwise counts are merged pairwise
// (adjacent pairs, level by level) with the early-exit check after each
// merge, and the survivor goes to select_winner().
std::optional<Script> reduce_shards(std::vector<ShardOutcome> outcomes, std::int64_t half);

// Script with the highest count, ties going to the later table entry.
// None when every count is zero.
std::optional<Script> select_winner(const ScriptCounts& counts);

} // namespace sid
