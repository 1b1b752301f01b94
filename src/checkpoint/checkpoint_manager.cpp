#include "checkpoint/checkpoint_manager.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "hash/sponge.hpp"
#include <cstddef>
#include <iostream>
#include <utility>

namespace zkshard {

namespace {

constexpr size_t CHECKSUM_BYTES = Digest::LEN * 8;

void write_digest(ByteWriter& w, const Digest& d) {
    for (size_t i = 0; i < Digest::LEN; ++i) {
        w.write_u64_le(d[i]);
    }
}

std::optional<Digest> read_digest(ByteReader& r) {
    Digest d;
    for (size_t i = 0; i < Digest::LEN; ++i) {
        auto word = r.read_u64_le();
        if (!word) return std::nullopt;
        d[i] = *word;
    }
    return d;
}

} // namespace

CheckpointManager::CheckpointManager(const Program& program, const Bytes& input, uint64_t interval_cycles)
    : program_(program),
      input_(input),
      interval_(interval_cycles == 0 ? 1 : interval_cycles),
      vm_(program, input) {
    cache_.emplace(0, vm_.snapshot());
}

void CheckpointManager::maybe_cache() {
    if (!vm_.at_boundary()) return;
    uint64_t last = cache_.rbegin()->first;
    if (vm_.cycle() >= last + interval_) {
        cache_.emplace(vm_.cycle(), vm_.snapshot());
    }
}

void CheckpointManager::advance_to(uint64_t cycle) {
    if (vm_.cycle() > cycle) {
        // Greatest cached snapshot at or before the target (cycle 0 always exists)
        auto it = cache_.upper_bound(cycle);
        --it;
        ZKSHARD_DEBUG_COUT("[checkpoint] rewinding to cached cycle " << it->first
            << " for target " << cycle << std::endl);
        vm_ = VMState::resume(program_, input_, it->second);
    }
    while (vm_.cycle() < cycle) {
        vm_.step_cycle();
        maybe_cache();
    }
}

CheckpointState CheckpointManager::capture(uint64_t cycle) {
    advance_to(cycle);
    // Throws Unsupported mid-instruction
    VmSnapshot snap = vm_.snapshot();
    return seal(snap, program_.hash());
}

uint64_t CheckpointManager::nearest_boundary(uint64_t cycle) {
    const uint64_t earlier = boundary_at_or_before(cycle);
    const uint64_t later = boundary_at_or_after(cycle);
    return (cycle - earlier <= later - cycle) ? earlier : later;
}

uint64_t CheckpointManager::boundary_at_or_before(uint64_t cycle) {
    advance_to(cycle);
    return cycle - vm_.micro_step();
}

uint64_t CheckpointManager::boundary_at_or_after(uint64_t cycle) {
    advance_to(cycle);
    if (vm_.at_boundary()) {
        return cycle;
    }
    return cycle - vm_.micro_step() + program_.at(vm_.pc()).cycle_cost();
}

CheckpointState CheckpointManager::seal(const VmSnapshot& snapshot, const Digest& program_digest) {
    ByteWriter w;
    w.write_u32_le(BLOB_MAGIC);
    w.write_u32_le(BLOB_VERSION);
    write_digest(w, program_digest);
    snapshot.encode(w);
    Digest checksum = Sponge::hash_bytes(w.data());
    write_digest(w, checksum);

    CheckpointState state;
    state.cycle = snapshot.cycle;
    state.blob = w.take();
    return state;
}

ExecutionContext CheckpointManager::open(const CheckpointState& state) {
    const Bytes& blob = state.blob;
    if (blob.size() < CHECKSUM_BYTES + 8) {
        throw CheckpointError::corrupt("blob too short (" + std::to_string(blob.size()) + " bytes)");
    }

    const size_t body_len = blob.size() - CHECKSUM_BYTES;
    Bytes body(blob.begin(), blob.begin() + static_cast<std::ptrdiff_t>(body_len));
    ByteReader checksum_reader(blob.data() + body_len, CHECKSUM_BYTES);
    auto stored = read_digest(checksum_reader);
    if (!stored || *stored != Sponge::hash_bytes(body)) {
        throw CheckpointError::corrupt("checksum mismatch");
    }

    ByteReader r(body);
    auto magic = r.read_u32_le();
    auto version = r.read_u32_le();
    if (!magic || *magic != BLOB_MAGIC) {
        throw CheckpointError::corrupt("bad magic");
    }
    if (!version || *version != BLOB_VERSION) {
        throw CheckpointError::corrupt("unsupported version");
    }
    auto program_digest = read_digest(r);
    std::optional<VmSnapshot> snapshot;
    if (program_digest) {
        snapshot = VmSnapshot::decode(r);
    }
    if (!snapshot || !r.at_end()) {
        throw CheckpointError::corrupt("malformed snapshot");
    }
    if (snapshot->cycle != state.cycle) {
        throw CheckpointError::corrupt("snapshot cycle " + std::to_string(snapshot->cycle)
            + " does not match checkpoint cycle " + std::to_string(state.cycle));
    }

    ExecutionContext ctx;
    ctx.program_digest = *program_digest;
    ctx.snapshot = std::move(*snapshot);
    return ctx;
}

ExecutionContext CheckpointManager::restore_for(const Program& program, const CheckpointState& state) {
    ExecutionContext ctx = open(state);
    if (ctx.program_digest != program.hash()) {
        throw CheckpointError::corrupt("checkpoint belongs to program " + ctx.program_digest.to_hex()
            + ", expected " + program.hash().to_hex());
    }
    if (ctx.snapshot.pc >= program.len()) {
        throw CheckpointError::corrupt("snapshot pc outside program");
    }
    return ctx;
}

ExecutionContext CheckpointManager::restore(const CheckpointState& state) const {
    return restore_for(program_, state);
}

} // namespace zkshard
