#pragma once

#include "common/byte_io.hpp"
#include "types/digest.hpp"
#include <cstdint>
#include <optional>

namespace zkshard {

/**
 * RangeProof - proof artifact of the reference CPU backend
 *
 * Binds a program to the state transition start_state -> end_state over
 * [start_cycle, end_cycle) and to a commitment over every trace row in
 * between. Combining two adjacent proofs yields a proof of the same shape
 * with segments = a.segments + b.segments.
 *
 * Wire layout (little-endian):
 *   magic u32 "ZKRP" | version u32 | program digest | start_cycle u64
 *   | end_cycle u64 | start state digest | end state digest
 *   | commitment | segments u32
 */
struct RangeProof {
    static constexpr uint32_t MAGIC = 0x5A4B5250;  // "ZKRP"
    static constexpr uint32_t VERSION = 1;
    static constexpr size_t ENCODED_SIZE = 4 + 4 + 32 + 8 + 8 + 32 + 32 + 32 + 4;

    Digest program_digest;
    uint64_t start_cycle = 0;
    uint64_t end_cycle = 0;
    Digest start_state;
    Digest end_state;
    Digest commitment;
    uint32_t segments = 1;

    uint64_t num_cycles() const { return end_cycle - start_cycle; }

    Bytes encode() const;

    /**
     * nullopt on wrong size, magic or version
     */
    static std::optional<RangeProof> decode(const Bytes& bytes);

    bool operator==(const RangeProof& rhs) const;
};

} // namespace zkshard
