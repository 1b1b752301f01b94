#pragma once

#include "common/byte_io.hpp"
#include "types/digest.hpp"
#include "vm/program.hpp"
#include "vm/vm_state.hpp"
#include <cstdint>
#include <map>
#include <optional>

namespace zkshard {

/**
 * Opaque checkpoint handed between planner, executor and backend.
 *
 * Blob layout (little-endian):
 *   magic u32 "ZKCP" | version u32 | program digest (4 x u64)
 *   | snapshot | checksum digest over everything before it (4 x u64)
 */
struct CheckpointState {
    uint64_t cycle = 0;
    Bytes blob;
};

/**
 * A verified, resumable execution context.
 */
struct ExecutionContext {
    Digest program_digest;
    VmSnapshot snapshot;

    uint64_t cycle() const { return snapshot.cycle; }
};

/**
 * CheckpointManager - splits a sequential execution at cycle boundaries
 *
 * Owns a VM over (program, input) for one request. While advancing it
 * caches a snapshot at each instruction boundary reached on or after a
 * multiple of `interval` cycles, so capturing an earlier cycle restarts
 * from the closest cached snapshot instead of cycle 0.
 *
 * Not thread-safe; one instance per request. Program and input are
 * borrowed and must outlive the manager.
 */
class CheckpointManager {
public:
    static constexpr uint32_t BLOB_MAGIC = 0x5A4B4350;  // "ZKCP"
    static constexpr uint32_t BLOB_VERSION = 1;

    CheckpointManager(const Program& program, const Bytes& input, uint64_t interval_cycles);

    /**
     * Capture the execution state at `cycle`.
     * Throws CheckpointError (Unsupported) when the cycle lies inside a
     * multi-cycle instruction.
     */
    CheckpointState capture(uint64_t cycle);

    /**
     * Closest instruction boundary to `cycle`; ties go to the earlier one.
     */
    uint64_t nearest_boundary(uint64_t cycle);

    // Instruction boundaries enclosing `cycle`; both return `cycle` itself
    // when it already is one
    uint64_t boundary_at_or_before(uint64_t cycle);
    uint64_t boundary_at_or_after(uint64_t cycle);

    /**
     * Verify and decode a checkpoint of this manager's program.
     * Throws CheckpointError (Corrupt) on a failed integrity check or a
     * checkpoint taken for a different program.
     */
    ExecutionContext restore(const CheckpointState& state) const;

    /**
     * restore() for callers without a manager (shard executors running
     * concurrently). Same checks, same errors.
     */
    static ExecutionContext restore_for(const Program& program, const CheckpointState& state);

    /**
     * Encode a boundary snapshot into a checksummed blob.
     */
    static CheckpointState seal(const VmSnapshot& snapshot, const Digest& program_digest);

    /**
     * Verify and decode any checkpoint blob (no program check).
     * Throws CheckpointError (Corrupt).
     */
    static ExecutionContext open(const CheckpointState& state);

    uint64_t interval_cycles() const { return interval_; }
    size_t cached_snapshots() const { return cache_.size(); }

private:
    void advance_to(uint64_t cycle);
    void maybe_cache();

    const Program& program_;
    const Bytes& input_;
    uint64_t interval_;

    std::map<uint64_t, VmSnapshot> cache_;
    VMState vm_;
};

} // namespace zkshard
