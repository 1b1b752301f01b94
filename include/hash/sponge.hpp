#pragma once

#include "types/digest.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace zkshard {

/**
 * Sponge - 64-bit word sponge used for state digests and trace commitments
 *
 * 8-word state, rate 4, capacity 4. The permutation is a few rounds of
 * multiply-xorshift mixing with word rotation. It is a commitment helper
 * for the reference backend and checkpoint integrity, not a cryptographic
 * hash.
 */
class Sponge {
public:
    static constexpr size_t STATE_SIZE = 8;
    static constexpr size_t RATE = 4;
    static constexpr size_t CAPACITY = 4;
    static constexpr size_t NUM_ROUNDS = 6;

    std::array<uint64_t, STATE_SIZE> state;

    // Domain-separated initial state
    explicit Sponge(uint64_t domain = 0);

    void permutation();

    // Absorb words, permuting after every RATE words
    void absorb(uint64_t word);
    void absorb(const std::vector<uint64_t>& words);
    void absorb(const Digest& digest);
    void absorb_bytes(const uint8_t* data, size_t len);

    // Pad, permute and return the first LEN words
    Digest finalize();

    // One-shot helpers
    static Digest hash_varlen(const std::vector<uint64_t>& words);
    static Digest hash_bytes(const std::vector<uint8_t>& bytes);
    static Digest hash_pair(const Digest& left, const Digest& right);

    // Single-word avalanche mix
    static uint64_t mix64(uint64_t x);

private:
    size_t absorbed_ = 0;
};

} // namespace zkshard
