#include "hash/sponge.hpp"
#include "common/byte_io.hpp"

namespace zkshard {

namespace {

constexpr uint64_t ROUND_CONSTANTS[Sponge::NUM_ROUNDS] = {
    0x9e3779b97f4a7c15ULL, 0xbf58476d1ce4e5b9ULL, 0x94d049bb133111ebULL,
    0x2545f4914f6cdd1dULL, 0xd6e8feb86659fd93ULL, 0xa0761d6478bd642fULL,
};

inline uint64_t rotl(uint64_t x, unsigned r) {
    return (x << r) | (x >> (64 - r));
}

} // namespace

uint64_t Sponge::mix64(uint64_t x) {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

Sponge::Sponge(uint64_t domain) : state{} {
    state[STATE_SIZE - 1] = domain ^ 0x7a6b7368617264ULL;  // "zkshard"
}

void Sponge::permutation() {
    for (size_t r = 0; r < NUM_ROUNDS; ++r) {
        for (size_t i = 0; i < STATE_SIZE; ++i) {
            state[i] = mix64(state[i] + ROUND_CONSTANTS[r] + i);
        }
        // Diffuse across words
        std::array<uint64_t, STATE_SIZE> next;
        for (size_t i = 0; i < STATE_SIZE; ++i) {
            next[i] = state[i] ^ rotl(state[(i + 1) % STATE_SIZE], 17) ^ state[(i + 3) % STATE_SIZE];
        }
        state = next;
    }
}

void Sponge::absorb(uint64_t word) {
    state[absorbed_] ^= word;
    if (++absorbed_ == RATE) {
        permutation();
        absorbed_ = 0;
    }
}

void Sponge::absorb(const std::vector<uint64_t>& words) {
    for (uint64_t w : words) {
        absorb(w);
    }
}

void Sponge::absorb(const Digest& digest) {
    for (size_t i = 0; i < Digest::LEN; ++i) {
        absorb(digest[i]);
    }
}

void Sponge::absorb_bytes(const uint8_t* data, size_t len) {
    absorb(static_cast<uint64_t>(len));
    size_t i = 0;
    for (; i + 8 <= len; i += 8) {
        absorb(load_u64_le(data + i));
    }
    if (i < len) {
        uint8_t tail[8] = {0};
        for (size_t j = 0; i + j < len; ++j) {
            tail[j] = data[i + j];
        }
        absorb(load_u64_le(tail));
    }
}

Digest Sponge::finalize() {
    // Pad with a single 1 word, then fill the rate with zeros
    state[absorbed_] ^= 1;
    state[STATE_SIZE - 1] ^= 0x8000000000000000ULL;
    permutation();
    absorbed_ = 0;

    std::array<uint64_t, Digest::LEN> out;
    for (size_t i = 0; i < Digest::LEN; ++i) {
        out[i] = state[i];
    }
    return Digest(out);
}

Digest Sponge::hash_varlen(const std::vector<uint64_t>& words) {
    Sponge sponge(1);
    sponge.absorb(static_cast<uint64_t>(words.size()));
    sponge.absorb(words);
    return sponge.finalize();
}

Digest Sponge::hash_bytes(const std::vector<uint8_t>& bytes) {
    Sponge sponge(2);
    sponge.absorb_bytes(bytes.data(), bytes.size());
    return sponge.finalize();
}

Digest Sponge::hash_pair(const Digest& left, const Digest& right) {
    Sponge sponge(3);
    sponge.absorb(left);
    sponge.absorb(right);
    return sponge.finalize();
}

} // namespace zkshard
