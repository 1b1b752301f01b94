#include "vm/vm_state.hpp"
#include "common/errors.hpp"
#include "hash/sponge.hpp"
#include <stdexcept>

namespace zkshard {

namespace {

// Upper bound on decoded memory entries (full address space)
constexpr uint32_t MAX_MEMORY_ENTRIES = MEMORY_ADDRESS_MASK + 1;

inline uint64_t rotl64(uint64_t x, uint32_t r) {
    r &= 63;
    if (r == 0) return x;
    return (x << r) | (x >> (64 - r));
}

} // namespace

// ============================================================================
// VmSnapshot
// ============================================================================

bool VmSnapshot::operator==(const VmSnapshot& rhs) const {
    return cycle == rhs.cycle
        && pc == rhs.pc
        && input_cursor == rhs.input_cursor
        && registers == rhs.registers
        && memory == rhs.memory;
}

void VmSnapshot::encode(ByteWriter& w) const {
    w.write_u64_le(cycle);
    w.write_u32_le(pc);
    w.write_u64_le(input_cursor);
    for (uint64_t reg : registers) {
        w.write_u64_le(reg);
    }
    w.write_u32_le(static_cast<uint32_t>(memory.size()));
    for (const auto& entry : memory) {
        w.write_u32_le(entry.first);
        w.write_u64_le(entry.second);
    }
}

std::optional<VmSnapshot> VmSnapshot::decode(ByteReader& r) {
    VmSnapshot snap;

    auto cycle = r.read_u64_le();
    auto pc = r.read_u32_le();
    auto cursor = r.read_u64_le();
    if (!cycle || !pc || !cursor) return std::nullopt;
    snap.cycle = *cycle;
    snap.pc = *pc;
    snap.input_cursor = *cursor;

    for (size_t i = 0; i < NUM_REGISTERS; ++i) {
        auto reg = r.read_u64_le();
        if (!reg) return std::nullopt;
        snap.registers[i] = *reg;
    }

    auto count = r.read_u32_le();
    if (!count || *count > MAX_MEMORY_ENTRIES) return std::nullopt;
    for (uint32_t i = 0; i < *count; ++i) {
        auto addr = r.read_u32_le();
        auto value = r.read_u64_le();
        if (!addr || !value) return std::nullopt;
        // Deltas are strictly ascending, in range and non-zero
        if (*addr > MEMORY_ADDRESS_MASK || *value == 0) return std::nullopt;
        if (!snap.memory.empty() && snap.memory.rbegin()->first >= *addr) return std::nullopt;
        snap.memory.emplace_hint(snap.memory.end(), *addr, *value);
    }
    return snap;
}

// ============================================================================
// VMState
// ============================================================================

VMState::VMState(const Program& program, const Bytes& input)
    : program_(&program), input_(&input) {}

VMState VMState::resume(const Program& program, const Bytes& input, const VmSnapshot& snapshot) {
    if (snapshot.pc >= program.len()) {
        throw std::invalid_argument("snapshot pc " + std::to_string(snapshot.pc)
            + " outside program of length " + std::to_string(program.len()));
    }
    VMState state(program, input);
    state.cycle_ = snapshot.cycle;
    state.pc_ = snapshot.pc;
    state.micro_step_ = 0;
    state.input_cursor_ = snapshot.input_cursor;
    state.registers_ = snapshot.registers;
    state.memory_ = snapshot.memory;
    return state;
}

void VMState::step_cycle() {
    const Instruction& instr = program_->at(pc_);
    if (micro_step_ + 1 >= instr.cycle_cost()) {
        execute(instr);
        micro_step_ = 0;
    } else {
        ++micro_step_;
    }
    ++cycle_;
}

void VMState::run_until(uint64_t target) {
    while (cycle_ < target) {
        step_cycle();
    }
}

uint64_t VMState::read_input_word() {
    const size_t len = input_->size();
    if (len == 0) {
        return 0;
    }
    uint64_t word = 0;
    for (size_t i = 0; i < 8; ++i) {
        uint8_t byte = (*input_)[(input_cursor_ + i) % len];
        word |= static_cast<uint64_t>(byte) << (8 * i);
    }
    input_cursor_ = (input_cursor_ + 8) % len;
    return word;
}

void VMState::execute(const Instruction& instr) {
    uint32_t next_pc = pc_ + 1;
    auto& r = registers_;

    switch (instr.opcode) {
        case Opcode::Nop:
            break;
        case Opcode::LoadImm:
            r[instr.dst] = instr.imm;
            break;
        case Opcode::Add:
            r[instr.dst] = r[instr.src_a] + r[instr.src_b];
            break;
        case Opcode::Mul:
            r[instr.dst] = r[instr.src_a] * r[instr.src_b];
            break;
        case Opcode::Xor:
            r[instr.dst] = r[instr.src_a] ^ r[instr.src_b];
            break;
        case Opcode::RotL:
            r[instr.dst] = rotl64(r[instr.src_a], instr.imm);
            break;
        case Opcode::Load: {
            uint32_t addr = static_cast<uint32_t>(r[instr.src_a] + instr.imm) & MEMORY_ADDRESS_MASK;
            auto it = memory_.find(addr);
            r[instr.dst] = (it == memory_.end()) ? 0 : it->second;
            break;
        }
        case Opcode::Store: {
            uint32_t addr = static_cast<uint32_t>(r[instr.src_a] + instr.imm) & MEMORY_ADDRESS_MASK;
            uint64_t value = r[instr.src_b];
            if (value == 0) {
                memory_.erase(addr);
            } else {
                memory_[addr] = value;
            }
            break;
        }
        case Opcode::ReadInput:
            r[instr.dst] = read_input_word();
            break;
        case Opcode::Hash:
            r[instr.dst] = Sponge::mix64(r[instr.src_a] ^ rotl64(r[instr.src_b], 32) ^ instr.imm);
            break;
        case Opcode::BranchNonZero:
            if (r[instr.src_a] != 0) {
                next_pc = instr.imm;
            }
            break;
    }

    pc_ = (next_pc >= program_->len()) ? 0 : next_pc;
}

VmSnapshot VMState::snapshot() const {
    if (!at_boundary()) {
        throw CheckpointError::unsupported(cycle_,
            "inside " + opcode_name(program_->at(pc_).opcode)
            + " (micro-step " + std::to_string(micro_step_) + ")");
    }
    VmSnapshot snap;
    snap.cycle = cycle_;
    snap.pc = pc_;
    snap.input_cursor = input_cursor_;
    snap.registers = registers_;
    snap.memory = memory_;
    return snap;
}

Digest VMState::state_digest() const {
    Sponge sponge(4);
    sponge.absorb(cycle_);
    sponge.absorb((static_cast<uint64_t>(pc_) << 32) | micro_step_);
    sponge.absorb(input_cursor_);
    for (uint64_t reg : registers_) {
        sponge.absorb(reg);
    }
    sponge.absorb(static_cast<uint64_t>(memory_.size()));
    for (const auto& entry : memory_) {
        sponge.absorb(static_cast<uint64_t>(entry.first));
        sponge.absorb(entry.second);
    }
    return sponge.finalize();
}

uint64_t VMState::trace_row_word() const {
    const Instruction& instr = program_->at(pc_);
    uint64_t acc = Sponge::mix64(cycle_);
    acc = Sponge::mix64(acc ^ ((static_cast<uint64_t>(pc_) << 32) | micro_step_));
    acc = Sponge::mix64(acc ^ instr.encode_word());
    acc = Sponge::mix64(acc ^ registers_[instr.dst]);
    acc = Sponge::mix64(acc ^ registers_[instr.src_a]);
    acc = Sponge::mix64(acc ^ registers_[instr.src_b]);
    return acc;
}

} // namespace zkshard
