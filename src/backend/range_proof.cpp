#include "backend/range_proof.hpp"

namespace zkshard {

namespace {

void write_digest(ByteWriter& w, const Digest& d) {
    for (size_t i = 0; i < Digest::LEN; ++i) {
        w.write_u64_le(d[i]);
    }
}

bool read_digest(ByteReader& r, Digest& out) {
    for (size_t i = 0; i < Digest::LEN; ++i) {
        auto word = r.read_u64_le();
        if (!word) return false;
        out[i] = *word;
    }
    return true;
}

} // namespace

Bytes RangeProof::encode() const {
    ByteWriter w;
    w.write_u32_le(MAGIC);
    w.write_u32_le(VERSION);
    write_digest(w, program_digest);
    w.write_u64_le(start_cycle);
    w.write_u64_le(end_cycle);
    write_digest(w, start_state);
    write_digest(w, end_state);
    write_digest(w, commitment);
    w.write_u32_le(segments);
    return w.take();
}

std::optional<RangeProof> RangeProof::decode(const Bytes& bytes) {
    if (bytes.size() != ENCODED_SIZE) {
        return std::nullopt;
    }
    ByteReader r(bytes);
    auto magic = r.read_u32_le();
    auto version = r.read_u32_le();
    if (!magic || *magic != MAGIC || !version || *version != VERSION) {
        return std::nullopt;
    }

    RangeProof proof;
    if (!read_digest(r, proof.program_digest)) return std::nullopt;
    auto start = r.read_u64_le();
    auto end = r.read_u64_le();
    if (!start || !end || *end <= *start) return std::nullopt;
    proof.start_cycle = *start;
    proof.end_cycle = *end;
    if (!read_digest(r, proof.start_state)) return std::nullopt;
    if (!read_digest(r, proof.end_state)) return std::nullopt;
    if (!read_digest(r, proof.commitment)) return std::nullopt;
    auto segments = r.read_u32_le();
    if (!segments || *segments == 0) return std::nullopt;
    proof.segments = *segments;
    return proof;
}

bool RangeProof::operator==(const RangeProof& rhs) const {
    return program_digest == rhs.program_digest
        && start_cycle == rhs.start_cycle
        && end_cycle == rhs.end_cycle
        && start_state == rhs.start_state
        && end_state == rhs.end_state
        && commitment == rhs.commitment
        && segments == rhs.segments;
}

} // namespace zkshard
