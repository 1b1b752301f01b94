#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace zkshard {

/**
 * Digest - 4-word hash digest (Sponge hash output)
 *
 * Identifies VM states, trace commitments and checkpoint payloads.
 */
class Digest {
public:
    static constexpr size_t LEN = 4;

    // Constructors
    Digest() : words_{} {}

    explicit Digest(const std::array<uint64_t, LEN>& words)
        : words_(words) {}

    // Factory methods
    static Digest zero() { return Digest(); }

    // Accessors
    const std::array<uint64_t, LEN>& words() const { return words_; }
    uint64_t operator[](size_t i) const { return words_[i]; }
    uint64_t& operator[](size_t i) { return words_[i]; }

    std::vector<uint64_t> to_words() const {
        return std::vector<uint64_t>(words_.begin(), words_.end());
    }

    // Comparison
    bool operator==(const Digest& rhs) const;
    bool operator!=(const Digest& rhs) const;

    // 16 hex digits per word, most significant first; used in logs and
    // error messages
    std::string to_hex() const;

    friend std::ostream& operator<<(std::ostream& os, const Digest& digest);

private:
    std::array<uint64_t, LEN> words_;
};

} // namespace zkshard
