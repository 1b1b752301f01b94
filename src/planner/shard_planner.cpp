#include "planner/shard_planner.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <vector>

namespace zkshard {

namespace {

uint64_t distance(uint64_t a, uint64_t b) {
    return a > b ? a - b : b - a;
}

// Instruction boundary in [lo, hi] closest to target; ties go earlier
std::optional<uint64_t> boundary_within(CheckpointManager& checkpoints, uint64_t target,
                                        uint64_t lo, uint64_t hi) {
    if (lo > hi) {
        return std::nullopt;
    }
    const uint64_t t = std::clamp(target, lo, hi);
    const uint64_t before = checkpoints.boundary_at_or_before(t);
    const uint64_t after = checkpoints.boundary_at_or_after(t);
    const bool before_ok = before >= lo;
    const bool after_ok = after <= hi;
    if (before_ok && after_ok) {
        return distance(target, before) <= distance(target, after) ? before : after;
    }
    if (before_ok) {
        return before;
    }
    if (after_ok) {
        return after;
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// ShardPlan
// ============================================================================

bool ShardPlan::is_partition() const {
    if (shards.empty() || total_cycles == 0) {
        return false;
    }
    uint64_t expected_start = 0;
    for (size_t i = 0; i < shards.size(); ++i) {
        const ProofShard& s = shards[i];
        if (s.shard_index != i || s.cycle_start != expected_start || s.cycle_end <= s.cycle_start) {
            return false;
        }
        expected_start = s.cycle_end;
    }
    return expected_start == total_cycles;
}

bool ShardPlan::same_ranges(const ShardPlan& other) const {
    if (total_cycles != other.total_cycles || shards.size() != other.shards.size()) {
        return false;
    }
    for (size_t i = 0; i < shards.size(); ++i) {
        if (shards[i].shard_index != other.shards[i].shard_index
            || shards[i].cycle_start != other.shards[i].cycle_start
            || shards[i].cycle_end != other.shards[i].cycle_end) {
            return false;
        }
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const ShardPlan& plan) {
    os << "ShardPlan(" << plan.total_cycles << " cycles, " << plan.shards.size() << " shards)";
    for (const auto& s : plan.shards) {
        os << "\n  #" << s.shard_index << " [" << s.cycle_start << ", " << s.cycle_end << ") "
           << s.length() << " cycles" << (s.checkpoint ? " +checkpoint" : "");
    }
    return os;
}

// ============================================================================
// ShardPlanner
// ============================================================================

ShardPlanner::ShardPlanner(const ShardingConfig& config) : config_(config) {
    config_.validate();
}

ShardPlan ShardPlanner::plan(uint64_t total_cycles) const {
    if (total_cycles == 0) {
        throw EngineError(ErrorKind::InvalidRequest, "estimated_total_cycles must be > 0");
    }

    ShardPlan plan;
    plan.total_cycles = total_cycles;

    if (!config_.enable_checkpointing) {
        // No resumable state: the whole request is one shard
        plan.shards.push_back(ProofShard{0, 0, total_cycles, std::nullopt});
        return plan;
    }

    const uint64_t target = config_.target_shard_count();
    const uint64_t ideal = total_cycles / target;
    const uint64_t len = std::clamp(ideal, config_.min_cycles_per_shard, config_.max_cycles_per_shard);

    uint64_t count = std::max<uint64_t>(1, total_cycles / len);
    if (ideal <= config_.max_cycles_per_shard) {
        count = std::min(count, target);
    }

    // The last shard absorbs the remainder; split it further only if it
    // would break the max bound
    uint64_t last = total_cycles - (count - 1) * len;
    while (last > config_.max_cycles_per_shard) {
        ++count;
        last -= len;
    }

    plan.shards.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        ProofShard shard;
        shard.shard_index = static_cast<uint32_t>(i);
        shard.cycle_start = i * len;
        shard.cycle_end = (i + 1 == count) ? total_cycles : (i + 1) * len;
        plan.shards.push_back(shard);
    }

    ZKSHARD_DEBUG_COUT("[planner] " << plan << std::endl);
    return plan;
}

void ShardPlanner::attach_checkpoints(ShardPlan& plan, CheckpointManager& checkpoints) const {
    if (!config_.enable_checkpointing || plan.shards.size() < 2) {
        return;
    }

    const uint64_t min_len = config_.min_cycles_per_shard;
    const uint64_t max_len = config_.max_cycles_per_shard;
    const uint64_t stride = plan.shards.front().length();
    const uint64_t total = plan.total_cycles;

    // Each cut must keep the shard before it within [min, max] and must
    // stay below `limit` so the shard after it is not empty
    std::vector<uint64_t> cuts;
    uint64_t cursor = 0;
    auto cut_near = [&](uint64_t target, uint64_t limit) {
        auto cut = boundary_within(checkpoints, target, cursor + min_len, std::min(cursor + max_len, limit - 1));
        if (!cut) {
            throw CheckpointError::unsupported(target,
                "no instruction boundary keeps shard " + std::to_string(cuts.size()) + " within ["
                + std::to_string(min_len) + ", " + std::to_string(max_len) + "] cycles");
        }
        if (*cut != target) {
            ZKSHARD_DEBUG_COUT("[planner] boundary " << cuts.size() + 1 << " moved " << target
                << " -> " << *cut << std::endl);
        }
        cuts.push_back(*cut);
        cursor = *cut;
    };

    for (size_t i = 1; i < plan.shards.size(); ++i) {
        cut_near(plan.shards[i].cycle_start, plan.shards[i].cycle_end);
    }
    // Cuts rounded earlier can push the last shard past max
    while (total - cursor > max_len) {
        cut_near(cursor + stride, total);
    }

    std::vector<ProofShard> shards;
    shards.reserve(cuts.size() + 1);
    uint64_t start = 0;
    for (size_t i = 0; i <= cuts.size(); ++i) {
        ProofShard shard;
        shard.shard_index = static_cast<uint32_t>(i);
        shard.cycle_start = start;
        shard.cycle_end = (i < cuts.size()) ? cuts[i] : total;
        if (i > 0) {
            shard.checkpoint = checkpoints.capture(start);
        }
        start = shard.cycle_end;
        shards.push_back(std::move(shard));
    }
    plan.shards = std::move(shards);
}

ShardPlan ShardPlanner::plan_with_checkpoints(uint64_t total_cycles, CheckpointManager& checkpoints) const {
    auto start = std::chrono::high_resolution_clock::now();

    ShardPlan plan = this->plan(total_cycles);
    attach_checkpoints(plan, checkpoints);

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    std::cout << "[planner] " << plan.size() << " shard(s) for " << total_cycles
              << " cycles (" << elapsed << " ms)" << std::endl;
    return plan;
}

} // namespace zkshard
