#pragma once

#include "common/byte_io.hpp"
#include "types/digest.hpp"
#include "vm/program.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>

namespace zkshard {

// Word-addressed memory, 16-bit address space
constexpr uint32_t MEMORY_ADDRESS_MASK = 0xFFFF;

/**
 * Minimal resumable state at an instruction boundary.
 *
 * Memory only holds non-zero words (memory deltas against the all-zero
 * initial memory).
 */
struct VmSnapshot {
    uint64_t cycle = 0;
    uint32_t pc = 0;
    uint64_t input_cursor = 0;
    std::array<uint64_t, NUM_REGISTERS> registers{};
    std::map<uint32_t, uint64_t> memory;

    bool operator==(const VmSnapshot& rhs) const;

    void encode(ByteWriter& w) const;
    static std::optional<VmSnapshot> decode(ByteReader& r);
};

/**
 * VMState - cycle-granular execution state of the reference VM
 *
 * The program and input are borrowed and must outlive the state.
 */
class VMState {
public:
    VMState(const Program& program, const Bytes& input);

    /**
     * Resume from a snapshot taken at an instruction boundary.
     * Throws std::invalid_argument if the snapshot pc lies outside the
     * program.
     */
    static VMState resume(const Program& program, const Bytes& input, const VmSnapshot& snapshot);

    /**
     * Advance by one cycle
     */
    void step_cycle();

    /**
     * Step until cycle() == target (no-op if already there or beyond)
     */
    void run_until(uint64_t target);

    /**
     * True when no instruction is partially executed
     */
    bool at_boundary() const { return micro_step_ == 0; }

    /**
     * Snapshot at the current cycle.
     * Throws CheckpointError::Unsupported when mid-instruction.
     */
    VmSnapshot snapshot() const;

    /**
     * Digest of the full state, including the micro-step, so two states
     * compare equal only if they resume identically.
     */
    Digest state_digest() const;

    /**
     * One-word summary of the trace row for the current cycle
     * (cycle, pc, micro-step, opcode and operand registers).
     */
    uint64_t trace_row_word() const;

    // State accessors
    uint64_t cycle() const { return cycle_; }
    uint32_t pc() const { return pc_; }
    uint32_t micro_step() const { return micro_step_; }
    uint64_t input_cursor() const { return input_cursor_; }
    const std::array<uint64_t, NUM_REGISTERS>& registers() const { return registers_; }
    const std::map<uint32_t, uint64_t>& memory() const { return memory_; }

private:
    void execute(const Instruction& instr);
    uint64_t read_input_word();

    const Program* program_;
    const Bytes* input_;

    uint64_t cycle_ = 0;
    uint32_t pc_ = 0;
    uint32_t micro_step_ = 0;
    uint64_t input_cursor_ = 0;
    std::array<uint64_t, NUM_REGISTERS> registers_{};
    std::map<uint32_t, uint64_t> memory_;
};

} // namespace zkshard
