#include "common/byte_io.hpp"

#include <cstring>

namespace zkshard {

uint32_t load_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t load_u64_le(const uint8_t* p) {
    return static_cast<uint64_t>(p[0]) |
           (static_cast<uint64_t>(p[1]) << 8) |
           (static_cast<uint64_t>(p[2]) << 16) |
           (static_cast<uint64_t>(p[3]) << 24) |
           (static_cast<uint64_t>(p[4]) << 32) |
           (static_cast<uint64_t>(p[5]) << 40) |
           (static_cast<uint64_t>(p[6]) << 48) |
           (static_cast<uint64_t>(p[7]) << 56);
}

void store_u32_le(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

void store_u64_le(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

// ByteWriter

void ByteWriter::write_u32_le(uint32_t v) {
    uint8_t buf[4];
    store_u32_le(buf, v);
    write_raw(buf, 4);
}

void ByteWriter::write_u64_le(uint64_t v) {
    uint8_t buf[8];
    store_u64_le(buf, v);
    write_raw(buf, 8);
}

void ByteWriter::write_length_prefixed(const Bytes& bytes) {
    write_u32_le(static_cast<uint32_t>(bytes.size()));
    write_raw(bytes.data(), bytes.size());
}

void ByteWriter::write_raw(const uint8_t* ptr, size_t n) {
    data_.insert(data_.end(), ptr, ptr + n);
}

// ByteReader

bool ByteReader::read_exact(void* buf, size_t n) {
    if (n > remaining()) {
        return false;
    }
    if (n > 0) {
        std::memcpy(buf, data_ + pos_, n);
    }
    pos_ += n;
    return true;
}

std::optional<uint8_t> ByteReader::read_u8() {
    uint8_t v;
    if (!read_exact(&v, 1)) {
        return std::nullopt;
    }
    return v;
}

std::optional<uint32_t> ByteReader::read_u32_le() {
    uint8_t buf[4];
    if (!read_exact(buf, 4)) {
        return std::nullopt;
    }
    return load_u32_le(buf);
}

std::optional<uint64_t> ByteReader::read_u64_le() {
    uint8_t buf[8];
    if (!read_exact(buf, 8)) {
        return std::nullopt;
    }
    return load_u64_le(buf);
}

std::optional<Bytes> ByteReader::read_length_prefixed(size_t max_len) {
    auto len = read_u32_le();
    if (!len || *len > max_len || *len > remaining()) {
        return std::nullopt;
    }
    Bytes out(*len);
    if (!read_exact(out.data(), out.size())) {
        return std::nullopt;
    }
    return out;
}

} // namespace zkshard
