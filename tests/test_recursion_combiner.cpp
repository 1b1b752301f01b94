#include <gtest/gtest.h>
#include "combiner/recursion_combiner.hpp"
#include "common/errors.hpp"
#include "support/scripted_backend.hpp"

#include <algorithm>
#include <random>

using namespace zkshard;
using namespace zkshard::testing_support;

class RecursionCombinerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<ScriptedBackend>();
    }

    static ShardPlan plan_of(uint32_t count, uint64_t len) {
        ShardPlan plan;
        plan.total_cycles = count * len;
        for (uint32_t i = 0; i < count; ++i) {
            plan.shards.push_back(ProofShard{i, i * len, (i + 1) * len, std::nullopt});
        }
        return plan;
    }

    static std::vector<ShardResult> results_of(const ShardPlan& plan) {
        std::vector<ShardResult> out;
        for (const auto& s : plan.shards) {
            out.push_back(ShardResult::success(s.shard_index, 0, 0,
                FakeRange{s.cycle_start, s.cycle_end, 1}.encode(), std::chrono::duration<double>(0.01)));
        }
        return out;
    }

    static FakeRange decoded(const FinalProof& fp) {
        auto r = FakeRange::decode(fp.proof);
        EXPECT_TRUE(r.has_value());
        return r.value_or(FakeRange{});
    }

    std::shared_ptr<ScriptedBackend> backend_;
};

// Test arrival order does not matter
TEST_F(RecursionCombinerTest, SortsByShardIndex) {
    ShardPlan plan = plan_of(7, 100);
    auto results = results_of(plan);
    std::mt19937 rng(42);
    std::shuffle(results.begin(), results.end(), rng);

    RecursionCombiner combiner(backend_, CombineStrategy::Sequential);
    FinalProof fp = combiner.combine(plan, results);
    FakeRange r = decoded(fp);
    EXPECT_EQ(r.start, 0u);
    EXPECT_EQ(r.end, 700u);
    EXPECT_EQ(r.segments, 7u);
    EXPECT_EQ(fp.num_shards, 7u);
    EXPECT_EQ(fp.total_cycles, 700u);
    EXPECT_EQ(backend_->combine_calls(), 6);
}

// Test tree and sequential cover the same range
TEST_F(RecursionCombinerTest, TreeMatchesSequentialRange) {
    ShardPlan plan = plan_of(5, 10);
    RecursionCombiner tree(backend_, CombineStrategy::Tree);
    EXPECT_EQ(tree.effective_strategy(), CombineStrategy::Tree);
    FakeRange t = decoded(tree.combine(plan, results_of(plan)));

    RecursionCombiner seq(backend_, CombineStrategy::Sequential);
    FakeRange s = decoded(seq.combine(plan, results_of(plan)));

    EXPECT_EQ(t.start, s.start);
    EXPECT_EQ(t.end, s.end);
    EXPECT_EQ(t.segments, 5u);
    EXPECT_EQ(backend_->combine_calls(), 8);
}

// Test tree falls back to sequential without backend support
TEST_F(RecursionCombinerTest, TreeFallsBackToSequential) {
    backend_->set_tree_support(false);
    ShardPlan plan = plan_of(4, 25);
    RecursionCombiner combiner(backend_, CombineStrategy::Tree);
    EXPECT_EQ(combiner.effective_strategy(), CombineStrategy::Sequential);

    // A sequential-only backend rejects a combined right operand, so
    // success here means the fold went left to right
    FakeRange r = decoded(combiner.combine(plan, results_of(plan)));
    EXPECT_EQ(r.end, 100u);
}

// Test a single shard is passed through without combining
TEST_F(RecursionCombinerTest, SingleShardPassThrough) {
    ShardPlan plan = plan_of(1, 30);
    RecursionCombiner combiner(backend_, CombineStrategy::Tree);
    FinalProof fp = combiner.combine(plan, results_of(plan));
    EXPECT_EQ(decoded(fp).end, 30u);
    EXPECT_EQ(backend_->combine_calls(), 0);
}

// Test missing, duplicate and failed results are rejected
TEST_F(RecursionCombinerTest, RejectsIncompleteResults) {
    ShardPlan plan = plan_of(3, 10);
    RecursionCombiner combiner(backend_, CombineStrategy::Sequential);

    auto missing = results_of(plan);
    missing.pop_back();
    EXPECT_THROW(combiner.combine(plan, missing), CombineError);

    auto duplicate = results_of(plan);
    duplicate[2] = duplicate[1];
    EXPECT_THROW(combiner.combine(plan, duplicate), CombineError);

    auto failed = results_of(plan);
    failed[1] = ShardResult::failed(1, 0, 2, "device lost", std::chrono::duration<double>(0));
    try {
        combiner.combine(plan, failed);
        FAIL() << "expected CombineError";
    } catch (const CombineError& e) {
        EXPECT_NE(std::string(e.what()).find("device lost"), std::string::npos);
        EXPECT_EQ(e.kind(), ErrorKind::CombineError);
    }

    EXPECT_THROW(combiner.combine(plan_of(0, 10), {}), CombineError);
    EXPECT_EQ(backend_->combine_calls(), 0);
}

// Test backend combine errors surface as CombineError
TEST_F(RecursionCombinerTest, BackendFailureIsCombineError) {
    ShardPlan plan = plan_of(2, 10);
    RecursionCombiner combiner(backend_, CombineStrategy::Sequential);

    backend_->set_fail_combine(true);
    EXPECT_THROW(combiner.combine(plan, results_of(plan)), CombineError);

    backend_->set_fail_combine(false);
    auto gap = results_of(plan);
    gap[1].partial_proof = FakeRange{11, 20, 1}.encode();
    EXPECT_THROW(combiner.combine(plan, gap), CombineError);
}
