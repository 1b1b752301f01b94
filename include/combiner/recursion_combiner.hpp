#pragma once

#include "backend/backend.hpp"
#include "config/policies.hpp"
#include "executor/shard_executor.hpp"
#include "planner/shard_plan.hpp"
#include <chrono>
#include <memory>
#include <vector>

namespace zkshard {

/**
 * The single artifact returned for a request that fully succeeded.
 */
struct FinalProof {
    Bytes proof;
    uint64_t total_cycles = 0;
    uint32_t num_shards = 0;
    std::chrono::duration<double> combine_duration{0};
};

/**
 * RecursionCombiner - folds ordered partial proofs into one proof
 *
 * Results are re-sorted by shard index before folding, so arrival order
 * never affects the output. Sequential folds left to right. Tree combines
 * adjacent pairs in a balanced tree, both halves in parallel
 * (tbb::parallel_invoke); it needs backend support and otherwise falls
 * back to Sequential.
 */
class RecursionCombiner {
public:
    RecursionCombiner(std::shared_ptr<ProvingBackend> backend, CombineStrategy strategy);

    /**
     * Throws CombineError when the results are not exactly one Success per
     * shard of the plan, or when the backend rejects a combination.
     */
    FinalProof combine(const ShardPlan& plan, std::vector<ShardResult> results) const;

    /**
     * Strategy actually used (Tree degrades to Sequential without
     * backend support)
     */
    CombineStrategy effective_strategy() const { return strategy_; }

private:
    Bytes combine_pair(const Bytes& a, const Bytes& b) const;
    Bytes fold_sequential(const std::vector<ShardResult>& sorted) const;
    Bytes fold_tree(const std::vector<ShardResult>& sorted, size_t lo, size_t hi) const;

    std::shared_ptr<ProvingBackend> backend_;
    CombineStrategy strategy_;
};

} // namespace zkshard
