#pragma once

#include "checkpoint/checkpoint_manager.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace zkshard {

/**
 * One contiguous cycle range [cycle_start, cycle_end) of a request.
 * Every shard but the first carries the checkpoint it resumes from.
 */
struct ProofShard {
    uint32_t shard_index = 0;
    uint64_t cycle_start = 0;
    uint64_t cycle_end = 0;
    std::optional<CheckpointState> checkpoint;

    uint64_t length() const { return cycle_end - cycle_start; }
};

/**
 * Ordered shards covering [0, total_cycles) with no gap and no overlap.
 * Shard order is the only valid input order to the combiner.
 */
struct ShardPlan {
    uint64_t total_cycles = 0;
    std::vector<ProofShard> shards;

    size_t size() const { return shards.size(); }

    /**
     * True when the shards, in index order, partition [0, total_cycles).
     */
    bool is_partition() const;

    /**
     * Same ranges (checkpoint blobs are not compared)
     */
    bool same_ranges(const ShardPlan& other) const;
};

std::ostream& operator<<(std::ostream& os, const ShardPlan& plan);

} // namespace zkshard
