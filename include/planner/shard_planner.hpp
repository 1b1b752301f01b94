#pragma once

#include "checkpoint/checkpoint_manager.hpp"
#include "config/sharding_config.hpp"
#include "planner/shard_plan.hpp"
#include <cstdint>

namespace zkshard {

/**
 * ShardPlanner - turns (total cycles, ShardingConfig) into a ShardPlan
 *
 * Target count is device_count * shards_per_device. The ideal length
 * total / target is clamped to [min, max]. When the min clamp lengthens
 * shards, fewer shards are produced; no shard ever exceeds max. The last
 * shard takes the remainder. With checkpointing disabled the plan is a
 * single shard covering the whole request.
 *
 * Pure and deterministic: the same inputs always give the same plan.
 */
class ShardPlanner {
public:
    explicit ShardPlanner(const ShardingConfig& config);

    /**
     * Compute the shard ranges. Throws EngineError(InvalidRequest) when
     * total_cycles is 0.
     */
    ShardPlan plan(uint64_t total_cycles) const;

    /**
     * Capture a checkpoint at every interior boundary. A boundary inside a
     * multi-cycle instruction moves to the nearest instruction boundary
     * that keeps the shard before it within [min, max] and the shard after
     * it non-empty. If earlier moves leave the last shard over max it is
     * split again. Throws CheckpointError (Unsupported) when no instruction
     * boundary fits.
     */
    void attach_checkpoints(ShardPlan& plan, CheckpointManager& checkpoints) const;

    /**
     * plan() followed by attach_checkpoints()
     */
    ShardPlan plan_with_checkpoints(uint64_t total_cycles, CheckpointManager& checkpoints) const;

    const ShardingConfig& config() const { return config_; }

private:
    ShardingConfig config_;
};

} // namespace zkshard
