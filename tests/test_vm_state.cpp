#include <gtest/gtest.h>
#include "vm/program.hpp"
#include "vm/vm_state.hpp"
#include "common/errors.hpp"

using namespace zkshard;

class ProgramTest : public ::testing::Test {
protected:
    static Bytes encode(const std::vector<Instruction>& instrs) {
        ByteWriter w;
        for (const auto& i : instrs) {
            w.write_u8(static_cast<uint8_t>(i.opcode));
            w.write_u8(i.dst);
            w.write_u8(i.src_a);
            w.write_u8(i.src_b);
            w.write_u32_le(i.imm);
        }
        return w.take();
    }
};

// Test decoding a well-formed binary
TEST_F(ProgramTest, DecodeValidBinary) {
    std::vector<Instruction> instrs = {
        {Opcode::LoadImm, 1, 0, 0, 42},
        {Opcode::Add, 2, 1, 1, 0},
        {Opcode::BranchNonZero, 0, 2, 0, 0},
    };
    Program p = Program::from_binary(encode(instrs));
    ASSERT_EQ(p.len(), 3u);
    EXPECT_EQ(p.at(0).opcode, Opcode::LoadImm);
    EXPECT_EQ(p.at(0).imm, 42u);
    EXPECT_EQ(p.at(2).opcode, Opcode::BranchNonZero);
    EXPECT_EQ(p.to_binary(), encode(instrs));
}

// Test malformed binaries are rejected
TEST_F(ProgramTest, RejectsMalformedBinaries) {
    EXPECT_THROW(Program::from_binary({}), std::invalid_argument);
    EXPECT_THROW(Program::from_binary(Bytes(7, 0)), std::invalid_argument);

    Bytes bad_opcode = encode({{Opcode::Nop, 0, 0, 0, 0}});
    bad_opcode[0] = NUM_OPCODES;
    EXPECT_THROW(Program::from_binary(bad_opcode), std::invalid_argument);

    Bytes bad_register = encode({{Opcode::Add, 16, 0, 0, 0}});
    EXPECT_THROW(Program::from_binary(bad_register), std::invalid_argument);

    Bytes bad_branch = encode({{Opcode::BranchNonZero, 0, 1, 0, 5}});
    EXPECT_THROW(Program::from_binary(bad_branch), std::invalid_argument);
}

// Test the program digest depends on the instructions
TEST_F(ProgramTest, DigestDistinguishesPrograms) {
    Program a = Program::from_instructions({{Opcode::LoadImm, 1, 0, 0, 1}});
    Program b = Program::from_instructions({{Opcode::LoadImm, 1, 0, 0, 2}});
    Program a2 = Program::from_binary(a.to_binary());
    EXPECT_EQ(a.hash(), a2.hash());
    EXPECT_NE(a.hash(), b.hash());
}

// Test synthetic programs are deterministic and valid
TEST_F(ProgramTest, SyntheticIsDeterministic) {
    Program a = Program::synthetic(7, 64);
    Program b = Program::synthetic(7, 64);
    Program c = Program::synthetic(8, 64);
    EXPECT_EQ(a.len(), 64u);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_NE(a.hash(), c.hash());
    EXPECT_NO_THROW(Program::from_binary(a.to_binary()));
    EXPECT_THROW(Program::synthetic(1, 0), std::invalid_argument);
}

// Test instruction cycle costs
TEST_F(ProgramTest, CycleCosts) {
    EXPECT_EQ((Instruction{Opcode::Add, 0, 0, 0, 0}).cycle_cost(), 1u);
    EXPECT_EQ((Instruction{Opcode::Mul, 0, 0, 0, 0}).cycle_cost(), 2u);
    EXPECT_EQ((Instruction{Opcode::Store, 0, 0, 0, 0}).cycle_cost(), 2u);
    EXPECT_EQ((Instruction{Opcode::Hash, 0, 0, 0, 0}).cycle_cost(), 4u);
}

class VMStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        // pc 0: r1 = 5          (1 cycle)
        // pc 1: r2 = r1 * r1    (2 cycles)
        // pc 2: mem[r0 + 3] = r2 (2 cycles)
        // pc 3: r3 = input word (1 cycle)
        // pc 4: r4 = hash(r2, r3) (4 cycles)
        program_.emplace(Program::from_instructions({
            {Opcode::LoadImm, 1, 0, 0, 5},
            {Opcode::Mul, 2, 1, 1, 0},
            {Opcode::Store, 0, 0, 2, 3},
            {Opcode::ReadInput, 3, 0, 0, 0},
            {Opcode::Hash, 4, 2, 3, 9},
        }));
        input_ = {1, 2, 3, 4, 5, 6, 7, 8};
    }

    std::optional<Program> program_;
    Bytes input_;
};

// Test instruction effects appear after the last cycle
TEST_F(VMStateTest, MultiCycleInstructions) {
    VMState vm(*program_, input_);
    vm.run_until(1);
    EXPECT_EQ(vm.registers()[1], 5u);
    EXPECT_TRUE(vm.at_boundary());

    vm.step_cycle();  // first cycle of mul
    EXPECT_FALSE(vm.at_boundary());
    EXPECT_EQ(vm.registers()[2], 0u);
    vm.step_cycle();
    EXPECT_TRUE(vm.at_boundary());
    EXPECT_EQ(vm.registers()[2], 25u);

    vm.run_until(5);
    ASSERT_EQ(vm.memory().count(3), 1u);
    EXPECT_EQ(vm.memory().at(3), 25u);

    vm.run_until(6);
    EXPECT_EQ(vm.registers()[3], 0x0807060504030201ULL);
    EXPECT_EQ(vm.input_cursor(), 0u);  // wrapped

    vm.run_until(10);
    EXPECT_EQ(vm.pc(), 0u);  // wraps to the start
    EXPECT_NE(vm.registers()[4], 0u);
}

// Test snapshots are refused mid-instruction
TEST_F(VMStateTest, SnapshotMidInstructionUnsupported) {
    VMState vm(*program_, input_);
    vm.run_until(2);
    try {
        vm.snapshot();
        FAIL() << "expected CheckpointError";
    } catch (const CheckpointError& e) {
        EXPECT_EQ(e.code(), CheckpointError::Code::Unsupported);
        EXPECT_EQ(e.kind(), ErrorKind::CheckpointUnsupported);
    }
}

// Test resuming from a snapshot continues identically
TEST_F(VMStateTest, ResumeMatchesStraightExecution) {
    VMState straight(*program_, input_);
    straight.run_until(5);
    VmSnapshot snap = straight.snapshot();
    straight.run_until(37);

    VMState resumed = VMState::resume(*program_, input_, snap);
    EXPECT_EQ(resumed.cycle(), 5u);
    resumed.run_until(37);
    EXPECT_EQ(resumed.state_digest(), straight.state_digest());
}

// Test snapshot encoding and strict decoding
TEST_F(VMStateTest, SnapshotDecodeRejectsBadDeltas) {
    VMState vm(*program_, input_);
    vm.run_until(5);
    VmSnapshot snap = vm.snapshot();

    ByteWriter w;
    snap.encode(w);
    ByteReader r(w.data());
    auto decoded = VmSnapshot::decode(r);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(*decoded == snap);
    EXPECT_TRUE(r.at_end());

    VmSnapshot zero_delta = snap;
    zero_delta.memory[7] = 0;
    ByteWriter w2;
    zero_delta.encode(w2);
    ByteReader r2(w2.data());
    EXPECT_FALSE(VmSnapshot::decode(r2).has_value());

    Bytes truncated(w.data().begin(), w.data().end() - 1);
    ByteReader r3(truncated);
    EXPECT_FALSE(VmSnapshot::decode(r3).has_value());
}

// Test the state digest covers the micro-step
TEST_F(VMStateTest, StateDigestIncludesMicroStep) {
    VMState a(*program_, input_);
    VMState b(*program_, input_);
    a.run_until(1);
    b.run_until(2);
    EXPECT_NE(a.state_digest(), b.state_digest());
}

// Test resume rejects a pc outside the program
TEST_F(VMStateTest, ResumeRejectsBadPc) {
    VmSnapshot snap;
    snap.pc = 99;
    EXPECT_THROW(VMState::resume(*program_, input_, snap), std::invalid_argument);
}
