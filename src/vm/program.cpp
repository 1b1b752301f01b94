#include "vm/program.hpp"
#include "hash/sponge.hpp"
#include <stdexcept>
#include <utility>

namespace zkshard {

std::string opcode_name(Opcode op) {
    switch (op) {
        case Opcode::Nop:           return "nop";
        case Opcode::LoadImm:       return "load_imm";
        case Opcode::Add:           return "add";
        case Opcode::Mul:           return "mul";
        case Opcode::Xor:           return "xor";
        case Opcode::RotL:          return "rotl";
        case Opcode::Load:          return "load";
        case Opcode::Store:         return "store";
        case Opcode::ReadInput:     return "read_input";
        case Opcode::Hash:          return "hash";
        case Opcode::BranchNonZero: return "bnz";
    }
    return "unknown";
}

uint32_t Instruction::cycle_cost() const {
    switch (opcode) {
        case Opcode::Mul:
        case Opcode::Load:
        case Opcode::Store:
            return 2;
        case Opcode::Hash:
            return 4;
        default:
            return 1;
    }
}

uint64_t Instruction::encode_word() const {
    return static_cast<uint64_t>(static_cast<uint8_t>(opcode))
        | (static_cast<uint64_t>(dst) << 8)
        | (static_cast<uint64_t>(src_a) << 16)
        | (static_cast<uint64_t>(src_b) << 24)
        | (static_cast<uint64_t>(imm) << 32);
}

Program::Program(std::vector<Instruction> instructions)
    : instructions_(std::move(instructions)) {
    std::vector<uint64_t> words;
    words.reserve(instructions_.size());
    for (const auto& instr : instructions_) {
        words.push_back(instr.encode_word());
    }
    digest_ = Sponge::hash_varlen(words);
}

Program Program::from_instructions(std::vector<Instruction> instructions) {
    if (instructions.empty()) {
        throw std::invalid_argument("program is empty");
    }
    for (size_t pc = 0; pc < instructions.size(); ++pc) {
        const Instruction& instr = instructions[pc];
        if (static_cast<uint8_t>(instr.opcode) >= NUM_OPCODES) {
            throw std::invalid_argument("unknown opcode at pc " + std::to_string(pc));
        }
        if (instr.dst >= NUM_REGISTERS || instr.src_a >= NUM_REGISTERS || instr.src_b >= NUM_REGISTERS) {
            throw std::invalid_argument("register index out of range at pc " + std::to_string(pc));
        }
        if (instr.opcode == Opcode::BranchNonZero && instr.imm >= instructions.size()) {
            throw std::invalid_argument("branch target " + std::to_string(instr.imm)
                + " outside program at pc " + std::to_string(pc));
        }
    }
    return Program(std::move(instructions));
}

Program Program::from_binary(const Bytes& binary) {
    if (binary.empty() || binary.size() % INSTRUCTION_SIZE != 0) {
        throw std::invalid_argument("program binary length must be a positive multiple of "
            + std::to_string(INSTRUCTION_SIZE));
    }

    std::vector<Instruction> instructions;
    instructions.reserve(binary.size() / INSTRUCTION_SIZE);
    for (size_t off = 0; off < binary.size(); off += INSTRUCTION_SIZE) {
        Instruction instr;
        instr.opcode = static_cast<Opcode>(binary[off]);
        instr.dst = binary[off + 1];
        instr.src_a = binary[off + 2];
        instr.src_b = binary[off + 3];
        instr.imm = load_u32_le(binary.data() + off + 4);
        instructions.push_back(instr);
    }
    return from_instructions(std::move(instructions));
}

Bytes Program::to_binary() const {
    ByteWriter w;
    for (const auto& instr : instructions_) {
        w.write_u8(static_cast<uint8_t>(instr.opcode));
        w.write_u8(instr.dst);
        w.write_u8(instr.src_a);
        w.write_u8(instr.src_b);
        w.write_u32_le(instr.imm);
    }
    return w.take();
}

Program Program::synthetic(uint64_t seed, size_t num_instructions) {
    if (num_instructions == 0) {
        throw std::invalid_argument("synthetic program needs at least one instruction");
    }

    uint64_t rng = seed;
    auto next = [&rng]() {
        rng += 0x9e3779b97f4a7c15ULL;
        return Sponge::mix64(rng);
    };

    std::vector<Instruction> instructions;
    instructions.reserve(num_instructions);
    for (size_t pc = 0; pc < num_instructions; ++pc) {
        uint64_t r = next();
        Instruction instr;
        instr.opcode = static_cast<Opcode>(r % NUM_OPCODES);
        instr.dst = static_cast<uint8_t>((r >> 8) % NUM_REGISTERS);
        instr.src_a = static_cast<uint8_t>((r >> 16) % NUM_REGISTERS);
        instr.src_b = static_cast<uint8_t>((r >> 24) % NUM_REGISTERS);
        instr.imm = static_cast<uint32_t>(r >> 32);
        if (instr.opcode == Opcode::BranchNonZero) {
            instr.imm = static_cast<uint32_t>((r >> 32) % num_instructions);
        }
        instructions.push_back(instr);
    }
    return from_instructions(std::move(instructions));
}

} // namespace zkshard
