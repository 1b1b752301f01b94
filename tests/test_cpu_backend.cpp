#include <gtest/gtest.h>
#include "backend/cpu_backend.hpp"
#include "checkpoint/checkpoint_manager.hpp"
#include "common/errors.hpp"
#include "support/scripted_backend.hpp"

#include <thread>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace zkshard;
using namespace zkshard::testing_support;

class CpuBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        program_.emplace(Program::synthetic(3, 24));
        input_ = {4, 4, 2, 1, 0, 9};
    }

    RangeProof prove(const std::optional<ExecutionContext>& start, uint64_t end) {
        RangeResult r = backend_.prove_cycle_range(0, *program_, input_, start, end, false, token_);
        auto proof = RangeProof::decode(r.proof);
        EXPECT_TRUE(proof.has_value());
        return proof.value_or(RangeProof{});
    }

    CpuBackend backend_;
    CancelToken token_;
    std::optional<Program> program_;
    Bytes input_;
};

// Test a proof binds the range and the end state
TEST_F(CpuBackendTest, ProofBindsRange) {
    RangeProof p = prove(std::nullopt, 500);
    EXPECT_EQ(p.start_cycle, 0u);
    EXPECT_EQ(p.end_cycle, 500u);
    EXPECT_EQ(p.segments, 1u);
    EXPECT_EQ(p.program_digest, program_->hash());

    VMState vm(*program_, input_);
    EXPECT_EQ(p.start_state, vm.state_digest());
    vm.run_until(500);
    EXPECT_EQ(p.end_state, vm.state_digest());

    // Deterministic
    EXPECT_TRUE(prove(std::nullopt, 500) == p);
}

// Test two adjacent shards combine into a proof of the whole range
TEST_F(CpuBackendTest, SplitAndCombine) {
    CheckpointManager mgr(*program_, input_, 100);
    uint64_t mid = mgr.nearest_boundary(300);
    ExecutionContext ctx = mgr.restore(mgr.capture(mid));

    RangeProof left = prove(std::nullopt, mid);
    RangeProof right = prove(ctx, 700);
    RangeProof whole = prove(std::nullopt, 700);

    auto combined = RangeProof::decode(backend_.combine(left.encode(), right.encode()));
    ASSERT_TRUE(combined.has_value());
    EXPECT_EQ(combined->start_cycle, 0u);
    EXPECT_EQ(combined->end_cycle, 700u);
    EXPECT_EQ(combined->segments, 2u);
    EXPECT_EQ(combined->start_state, whole.start_state);
    EXPECT_EQ(combined->end_state, whole.end_state);
}

// Test combine rejects non-adjacent or foreign proofs
TEST_F(CpuBackendTest, CombineRejectsMismatches) {
    RangeProof a = prove(std::nullopt, 100);
    RangeProof b = prove(std::nullopt, 200);
    EXPECT_THROW(backend_.combine(a.encode(), b.encode()), BackendError);
    EXPECT_THROW(backend_.combine(a.encode(), Bytes(10, 0)), BackendError);

    RangeProof forged = a;
    forged.start_cycle = 100;
    forged.end_cycle = 200;
    EXPECT_THROW(backend_.combine(a.encode(), forged.encode()), BackendError);  // state mismatch

    Program other = single_cycle_program();
    RangeResult r = backend_.prove_cycle_range(0, other, input_, std::nullopt, 50, false, token_);
    auto foreign = RangeProof::decode(r.proof);
    ASSERT_TRUE(foreign.has_value());
    foreign->start_cycle = 100;
    foreign->end_cycle = 150;
    foreign->start_state = a.end_state;
    EXPECT_THROW(backend_.combine(a.encode(), foreign->encode()), BackendError);
}

// Test tree combination: combined proofs combine again
TEST_F(CpuBackendTest, CombinedProofsCombine) {
    CheckpointManager mgr(*program_, input_, 50);
    std::vector<uint64_t> cuts = {0, mgr.nearest_boundary(100), mgr.nearest_boundary(200),
                                  mgr.nearest_boundary(300), 400};
    std::vector<Bytes> proofs;
    for (size_t i = 0; i + 1 < cuts.size(); ++i) {
        std::optional<ExecutionContext> start;
        if (cuts[i] > 0) {
            start = mgr.restore(mgr.capture(cuts[i]));
        }
        proofs.push_back(backend_.prove_cycle_range(0, *program_, input_, start, cuts[i + 1], false, token_).proof);
    }
    Bytes left = backend_.combine(proofs[0], proofs[1]);
    Bytes right = backend_.combine(proofs[2], proofs[3]);
    auto root = RangeProof::decode(backend_.combine(left, right));
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->segments, 4u);
    EXPECT_EQ(root->end_cycle, 400u);
    EXPECT_TRUE(backend_.supports_tree_combination());
}

// Test the end checkpoint is returned only on a boundary
TEST_F(CpuBackendTest, EndCheckpointAtBoundary) {
    Program hash_only = Program::from_instructions({{Opcode::Hash, 1, 1, 2, 3}});
    RangeResult on = backend_.prove_cycle_range(0, hash_only, input_, std::nullopt, 8, true, token_);
    ASSERT_TRUE(on.end_checkpoint.has_value());
    EXPECT_EQ(on.end_checkpoint->cycle, 8u);
    EXPECT_EQ(CheckpointManager::restore_for(hash_only, *on.end_checkpoint).cycle(), 8u);

    RangeResult off = backend_.prove_cycle_range(0, hash_only, input_, std::nullopt, 10, true, token_);
    EXPECT_FALSE(off.end_checkpoint.has_value());
}

// Test invalid ranges and checkpoints are rejected
TEST_F(CpuBackendTest, RejectsBadRanges) {
    CheckpointManager mgr(*program_, input_, 100);
    uint64_t at = mgr.nearest_boundary(200);
    ExecutionContext ctx = mgr.restore(mgr.capture(at));
    EXPECT_THROW(backend_.prove_cycle_range(0, *program_, input_, ctx, at, false, token_), BackendError);

    Program other = single_cycle_program();
    EXPECT_THROW(backend_.prove_cycle_range(0, other, input_, ctx, at + 10, false, token_), BackendError);
}

// Test a cancelled token stops long ranges
TEST_F(CpuBackendTest, CancelStopsProving) {
    CancelToken cancelled;
    cancelled.cancel();
    EXPECT_THROW(backend_.prove_cycle_range(0, *program_, input_, std::nullopt,
                                            CpuBackend::CANCEL_CHECK_CYCLES + 10, false, cancelled),
                 BackendError);
}

// Test the window commitment depends on every row
TEST_F(CpuBackendTest, CommitWindow) {
    std::vector<uint64_t> rows(CpuBackend::BLOCK_ROWS * 3 + 17);
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i] = i * 0x9E3779B97F4A7C15ULL;
    }
    Digest base = Digest::zero();
    Digest c1 = CpuBackend::commit_window(base, rows);
    EXPECT_EQ(CpuBackend::commit_window(base, rows), c1);

    rows[CpuBackend::BLOCK_ROWS * 2 + 5] ^= 1;
    EXPECT_NE(CpuBackend::commit_window(base, rows), c1);

    EXPECT_EQ(CpuBackend::commit_window(base, {}), base);
}

// Test the commitment does not depend on the thread count
TEST_F(CpuBackendTest, CommitWindowThreadCountIndependent) {
    std::vector<uint64_t> rows(CpuBackend::BLOCK_ROWS * 5 + 3);
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i] = i ^ 0xA5A5A5A5ULL;
    }
    Digest base = Digest::zero();
    int team = 0;
    Digest serial = CpuBackend::commit_window(base, rows, 1, &team);
    EXPECT_EQ(team, 1);
    EXPECT_EQ(CpuBackend::commit_window(base, rows, 4), serial);
}

// Test the configured thread count applies on a shard attempt thread
TEST_F(CpuBackendTest, ThreadCountReachesWorkerThread) {
    CpuBackend backend(3);
    EXPECT_EQ(backend.num_threads(), 3);
    EXPECT_EQ(backend.peak_team_size(), 0);

    std::thread worker([&]() {
#ifdef _OPENMP
        omp_set_dynamic(0);
#endif
        backend.prove_cycle_range(1, *program_, input_, std::nullopt, 200, false, token_);
    });
    worker.join();

#ifdef _OPENMP
    EXPECT_EQ(backend.peak_team_size(), 3);
#else
    EXPECT_EQ(backend.peak_team_size(), 1);
#endif
}

// Test the factory
TEST_F(CpuBackendTest, FactoryCreatesCpu) {
    auto backend = ProvingBackend::create(BackendType::CPU);
    ASSERT_NE(backend, nullptr);
    EXPECT_EQ(backend->type(), BackendType::CPU);
    EXPECT_EQ(backend->name(), "CPU");

    auto configured = ProvingBackend::create(BackendType::CPU, 2);
    auto* cpu = dynamic_cast<CpuBackend*>(configured.get());
    ASSERT_NE(cpu, nullptr);
    EXPECT_EQ(cpu->num_threads(), 2);
}
