#pragma once

#include "common/byte_io.hpp"
#include "types/digest.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace zkshard {

/**
 * Reference VM instruction set.
 *
 * Every instruction is 8 bytes on the wire:
 *   opcode u8, dst u8, src_a u8, src_b u8, imm u32 (little-endian)
 */
enum class Opcode : uint8_t {
    Nop = 0,
    LoadImm = 1,        // r[dst] = imm
    Add = 2,            // r[dst] = r[a] + r[b]
    Mul = 3,            // r[dst] = r[a] * r[b]
    Xor = 4,            // r[dst] = r[a] ^ r[b]
    RotL = 5,           // r[dst] = rotl(r[a], imm % 64)
    Load = 6,           // r[dst] = mem[r[a] + imm]
    Store = 7,          // mem[r[a] + imm] = r[b]
    ReadInput = 8,      // r[dst] = next 8 input bytes
    Hash = 9,           // r[dst] = mix(r[a], r[b], imm)
    BranchNonZero = 10  // if r[a] != 0: pc = imm
};

constexpr uint8_t NUM_OPCODES = 11;
constexpr size_t NUM_REGISTERS = 16;
constexpr size_t INSTRUCTION_SIZE = 8;

std::string opcode_name(Opcode op);

struct Instruction {
    Opcode opcode = Opcode::Nop;
    uint8_t dst = 0;
    uint8_t src_a = 0;
    uint8_t src_b = 0;
    uint32_t imm = 0;

    /**
     * Number of cycles the instruction occupies. Its effect becomes visible
     * after the last of them; the cycles before are mid-instruction.
     */
    uint32_t cycle_cost() const;

    uint64_t encode_word() const;
};

/**
 * Program - validated reference VM program
 *
 * Immutable once constructed. The program counter wraps around at the end,
 * so a program never halts on its own; the trace length is chosen by the
 * proof request.
 */
class Program {
public:
    /**
     * Decode and validate a program binary.
     * Throws std::invalid_argument on an empty or truncated binary, an
     * unknown opcode, a register index >= NUM_REGISTERS or a branch target
     * outside the program.
     */
    static Program from_binary(const Bytes& binary);

    /**
     * Build a program from already decoded instructions (validated the same
     * way as from_binary).
     */
    static Program from_instructions(std::vector<Instruction> instructions);

    /**
     * Deterministic pseudo-random program used for calibration runs.
     */
    static Program synthetic(uint64_t seed, size_t num_instructions);

    Bytes to_binary() const;

    /**
     * Program digest (hash of the encoded instructions)
     */
    const Digest& hash() const { return digest_; }

    size_t len() const { return instructions_.size(); }

    const Instruction& at(size_t pc) const { return instructions_[pc]; }

    const std::vector<Instruction>& instructions() const { return instructions_; }

private:
    explicit Program(std::vector<Instruction> instructions);

    std::vector<Instruction> instructions_;
    Digest digest_;
};

} // namespace zkshard
