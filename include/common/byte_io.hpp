#pragma once

/**
 * Little-endian byte encoding helpers.
 *
 * Used for checkpoint blobs, range proofs and the request-intake wire
 * format. Readers never throw: a short or malformed buffer yields nullopt.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace zkshard {

using Bytes = std::vector<uint8_t>;

class ByteWriter {
public:
    void write_u8(uint8_t v) { data_.push_back(v); }
    void write_u32_le(uint32_t v);
    void write_u64_le(uint64_t v);

    // u32 length prefix followed by the raw bytes
    void write_length_prefixed(const Bytes& bytes);

    void write_raw(const uint8_t* ptr, size_t n);

    const Bytes& data() const { return data_; }
    Bytes take() { return std::move(data_); }

private:
    Bytes data_;
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const Bytes& bytes) : data_(bytes.data()), size_(bytes.size()) {}

    bool read_exact(void* buf, size_t n);

    std::optional<uint8_t> read_u8();
    std::optional<uint32_t> read_u32_le();
    std::optional<uint64_t> read_u64_le();

    /**
     * Read a u32 length prefix and that many bytes.
     * Fails if the length exceeds max_len or the remaining input.
     */
    std::optional<Bytes> read_length_prefixed(size_t max_len);

    size_t position() const { return pos_; }
    size_t remaining() const { return size_ - pos_; }
    bool at_end() const { return pos_ == size_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

// Raw little-endian helpers shared with the socket reader/writer
uint32_t load_u32_le(const uint8_t* p);
uint64_t load_u64_le(const uint8_t* p);
void store_u32_le(uint8_t* p, uint32_t v);
void store_u64_le(uint8_t* p, uint64_t v);

} // namespace zkshard
