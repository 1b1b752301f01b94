#include <gtest/gtest.h>
#include "checkpoint/checkpoint_manager.hpp"
#include "common/errors.hpp"
#include "vm/vm_state.hpp"

#include <sstream>

using namespace zkshard;

class CheckpointManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Cycle layout per pass (9 cycles):
        //   0: load_imm (1)  1-2: mul (2)  3-6: hash (4)  7-8: store (2)
        program_.emplace(Program::from_instructions({
            {Opcode::LoadImm, 1, 0, 0, 3},
            {Opcode::Mul, 2, 1, 2, 0},
            {Opcode::Hash, 3, 2, 1, 11},
            {Opcode::Store, 0, 1, 3, 100},
        }));
        input_ = {9, 8, 7, 6, 5, 4, 3, 2, 1};
    }

    CheckpointState straight_capture(uint64_t cycle) {
        VMState vm(*program_, input_);
        vm.run_until(cycle);
        return CheckpointManager::seal(vm.snapshot(), program_->hash());
    }

    std::optional<Program> program_;
    Bytes input_;
};

// Test capture at a boundary matches straight-line execution
TEST_F(CheckpointManagerTest, CaptureMatchesStraightExecution) {
    CheckpointManager mgr(*program_, input_, 9);
    CheckpointState at_27 = mgr.capture(27);
    EXPECT_EQ(at_27.cycle, 27u);
    EXPECT_EQ(at_27.blob, straight_capture(27).blob);

    // Going backwards rewinds through the cache
    CheckpointState at_10 = mgr.capture(10);
    EXPECT_EQ(at_10.blob, straight_capture(10).blob);
    EXPECT_GE(mgr.cached_snapshots(), 2u);
}

// Test capture inside a multi-cycle instruction
TEST_F(CheckpointManagerTest, CaptureMidInstructionUnsupported) {
    CheckpointManager mgr(*program_, input_, 9);
    try {
        mgr.capture(4);
        FAIL() << "expected CheckpointError";
    } catch (const CheckpointError& e) {
        EXPECT_EQ(e.code(), CheckpointError::Code::Unsupported);
    }
}

// Test nearest boundary rounding (ties go earlier)
TEST_F(CheckpointManagerTest, NearestBoundary) {
    CheckpointManager mgr(*program_, input_, 9);
    EXPECT_EQ(mgr.nearest_boundary(3), 3u);   // start of hash
    EXPECT_EQ(mgr.nearest_boundary(4), 3u);   // 1 after start, 3 before end
    EXPECT_EQ(mgr.nearest_boundary(5), 3u);   // tie
    EXPECT_EQ(mgr.nearest_boundary(6), 7u);
    EXPECT_EQ(mgr.nearest_boundary(2), 1u);   // mul tie
    EXPECT_EQ(mgr.nearest_boundary(12), 12u); // hash of the second pass starts here
    EXPECT_EQ(mgr.nearest_boundary(15), 16u);
}

// Test restore reproduces the captured snapshot
TEST_F(CheckpointManagerTest, RestoreRoundTrip) {
    CheckpointManager mgr(*program_, input_, 5);
    CheckpointState state = mgr.capture(18);
    ExecutionContext ctx = mgr.restore(state);
    EXPECT_EQ(ctx.cycle(), 18u);
    EXPECT_EQ(ctx.program_digest, program_->hash());

    VMState vm(*program_, input_);
    vm.run_until(18);
    EXPECT_TRUE(ctx.snapshot == vm.snapshot());
}

// Test a flipped byte is detected as corruption
TEST_F(CheckpointManagerTest, CorruptBlobDetected) {
    CheckpointManager mgr(*program_, input_, 9);
    CheckpointState state = mgr.capture(9);

    for (size_t pos : {size_t{0}, size_t{40}, state.blob.size() - 1}) {
        CheckpointState bad = state;
        bad.blob[pos] ^= 0x01;
        try {
            mgr.restore(bad);
            FAIL() << "expected corruption at byte " << pos;
        } catch (const CheckpointError& e) {
            EXPECT_EQ(e.code(), CheckpointError::Code::Corrupt);
            EXPECT_EQ(e.kind(), ErrorKind::CheckpointCorrupt);
        }
    }

    CheckpointState truncated = state;
    truncated.blob.resize(10);
    EXPECT_THROW(mgr.restore(truncated), CheckpointError);

    CheckpointState wrong_cycle = state;
    wrong_cycle.cycle = 10;
    EXPECT_THROW(mgr.restore(wrong_cycle), CheckpointError);
}

// Test a checkpoint of another program is rejected
TEST_F(CheckpointManagerTest, RestoreRejectsOtherProgram) {
    CheckpointManager mgr(*program_, input_, 9);
    CheckpointState state = mgr.capture(9);

    Program other = Program::from_instructions({{Opcode::Nop, 0, 0, 0, 0}});
    try {
        CheckpointManager::restore_for(other, state);
        FAIL() << "expected CheckpointError";
    } catch (const CheckpointError& e) {
        EXPECT_EQ(e.code(), CheckpointError::Code::Corrupt);
        // Both program digests are named
        std::string message = e.what();
        EXPECT_NE(message.find(program_->hash().to_hex()), std::string::npos) << message;
        EXPECT_NE(message.find(other.hash().to_hex()), std::string::npos) << message;
    }
    EXPECT_NO_THROW(CheckpointManager::open(state));
}

// Test the enclosing boundaries of a mid-instruction cycle
TEST_F(CheckpointManagerTest, EnclosingBoundaries) {
    CheckpointManager mgr(*program_, input_, 9);
    EXPECT_EQ(mgr.boundary_at_or_before(5), 3u);
    EXPECT_EQ(mgr.boundary_at_or_after(5), 7u);
    EXPECT_EQ(mgr.boundary_at_or_before(7), 7u);
    EXPECT_EQ(mgr.boundary_at_or_after(7), 7u);
    // Rewinds after having advanced further
    EXPECT_EQ(mgr.boundary_at_or_after(2), 3u);
}

// Test the hex form of a digest
TEST_F(CheckpointManagerTest, DigestHex) {
    Digest d(std::array<uint64_t, Digest::LEN>{1, 0xABCDEFULL, 0, ~0ULL});
    EXPECT_EQ(d.to_hex(), "0000000000000001" "0000000000abcdef" "0000000000000000" "ffffffffffffffff");
    std::ostringstream os;
    os << d;
    EXPECT_EQ(os.str(), d.to_hex());
}

// Test snapshots are cached at interval multiples
TEST_F(CheckpointManagerTest, CachesAtIntervals) {
    CheckpointManager mgr(*program_, input_, 9);
    EXPECT_EQ(mgr.cached_snapshots(), 1u);  // cycle 0
    mgr.capture(45);
    // Boundaries 9, 18, 27, 36, 45 are each reached exactly on the interval
    EXPECT_EQ(mgr.cached_snapshots(), 6u);
    EXPECT_EQ(mgr.interval_cycles(), 9u);
}
