#include "combiner/recursion_combiner.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

#include <tbb/parallel_invoke.h>

namespace zkshard {

RecursionCombiner::RecursionCombiner(std::shared_ptr<ProvingBackend> backend, CombineStrategy strategy)
    : backend_(std::move(backend)), strategy_(strategy) {
    if (strategy_ == CombineStrategy::Tree && !backend_->supports_tree_combination()) {
        std::cout << "[combiner] backend " << backend_->name()
                  << " has no tree combination, using sequential" << std::endl;
        strategy_ = CombineStrategy::Sequential;
    }
}

Bytes RecursionCombiner::combine_pair(const Bytes& a, const Bytes& b) const {
    try {
        return backend_->combine(a, b);
    } catch (const BackendError& e) {
        throw CombineError(std::string("backend combine failed: ") + e.what());
    }
}

Bytes RecursionCombiner::fold_sequential(const std::vector<ShardResult>& sorted) const {
    Bytes acc = sorted.front().partial_proof;
    for (size_t i = 1; i < sorted.size(); ++i) {
        acc = combine_pair(acc, sorted[i].partial_proof);
    }
    return acc;
}

Bytes RecursionCombiner::fold_tree(const std::vector<ShardResult>& sorted, size_t lo, size_t hi) const {
    if (hi - lo == 1) {
        return sorted[lo].partial_proof;
    }
    const size_t mid = lo + (hi - lo) / 2;
    Bytes left;
    Bytes right;
    tbb::parallel_invoke(
        [&]() { left = fold_tree(sorted, lo, mid); },
        [&]() { right = fold_tree(sorted, mid, hi); }
    );
    return combine_pair(left, right);
}

FinalProof RecursionCombiner::combine(const ShardPlan& plan, std::vector<ShardResult> results) const {
    auto start = std::chrono::steady_clock::now();

    if (results.size() != plan.size()) {
        throw CombineError("expected " + std::to_string(plan.size()) + " shard results, got "
            + std::to_string(results.size()));
    }
    if (results.empty()) {
        throw CombineError("nothing to combine");
    }

    std::sort(results.begin(), results.end(), [](const ShardResult& a, const ShardResult& b) {
        return a.shard_index < b.shard_index;
    });
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].shard_index != i) {
            throw CombineError("shard results are not exactly 0.." + std::to_string(results.size() - 1)
                + " (found index " + std::to_string(results[i].shard_index) + " at position "
                + std::to_string(i) + ")");
        }
        if (!results[i].ok()) {
            throw CombineError("shard " + std::to_string(i) + " did not succeed: " + results[i].failure_reason);
        }
    }

    FinalProof final_proof;
    final_proof.total_cycles = plan.total_cycles;
    final_proof.num_shards = static_cast<uint32_t>(results.size());

    if (results.size() == 1) {
        final_proof.proof = std::move(results.front().partial_proof);
    } else if (strategy_ == CombineStrategy::Tree) {
        final_proof.proof = fold_tree(results, 0, results.size());
    } else {
        final_proof.proof = fold_sequential(results);
    }

    final_proof.combine_duration = std::chrono::steady_clock::now() - start;
    ZKSHARD_PROFILE_COUT("[combiner] " << results.size() << " partial proof(s) combined ("
        << to_string(strategy_) << ") in " << final_proof.combine_duration.count() * 1000.0 << " ms" << std::endl);
    return final_proof;
}

} // namespace zkshard
