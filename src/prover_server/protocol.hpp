#pragma once

/**
 * Socket protocol for the zkshard request-intake server
 *
 * All integers little-endian.
 *
 * Request:
 *   [4 bytes: magic "ZKSQ" = 0x5A4B5351]
 *   [4 bytes: version = 1]
 *   [4 bytes: job_id]
 *   [4 bytes: kind: 0=PROVE, 1=STATUS]
 *   if kind == PROVE:
 *     [4 bytes: program_len]  [program_len bytes: program binary]
 *     [4 bytes: input_len]    [input_len bytes: input]
 *     [8 bytes: estimated_total_cycles]
 *     [8 bytes: deadline_ms, 0 = no deadline]
 *
 * Response:
 *   [4 bytes: magic "ZKSR" = 0x5A4B5352]
 *   [4 bytes: status]
 *   [4 bytes: job_id]
 *   if status == OK:
 *     [8 bytes: payload_len]
 *     [payload_len bytes: final proof, or status JSON]
 *   otherwise:
 *     [4 bytes: error_msg_len]
 *     [error_msg_len bytes: error message UTF-8]
 */

#include "common/byte_io.hpp"
#include "common/errors.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace zkshard {
namespace prover_server {

// Protocol constants
constexpr uint32_t MAGIC_REQUEST = 0x5A4B5351;  // "ZKSQ"
constexpr uint32_t MAGIC_RESPONSE = 0x5A4B5352; // "ZKSR"
constexpr uint32_t PROTOCOL_VERSION = 1;

// Program and input blobs above this are rejected
constexpr uint32_t MAX_BLOB_BYTES = 100'000'000;

enum class RequestKind : uint32_t {
    Prove = 0,
    Status = 1,
};

// Response status codes
enum class ResponseStatus : uint32_t {
    Ok = 0,
    Aborted = 1,
    DeadlineExceeded = 2,
    DeviceUnavailable = 3,
    CombineFailed = 4,
    InvalidRequest = 5,
    Error = 6,
};

const char* to_string(ResponseStatus status);

/**
 * Wire status for a terminal engine error.
 */
ResponseStatus status_for(ErrorKind kind);

struct NodeRequest {
    uint32_t job_id = 0;
    RequestKind kind = RequestKind::Prove;

    // Prove only
    Bytes program_binary;
    Bytes input;
    uint64_t estimated_total_cycles = 0;
    uint64_t deadline_ms = 0;
};

struct NodeResponse {
    ResponseStatus status = ResponseStatus::Error;
    uint32_t job_id = 0;

    // For Ok response
    Bytes payload;

    // For every other status
    std::string error_message;

    static NodeResponse ok(uint32_t job_id, Bytes payload) {
        NodeResponse r;
        r.status = ResponseStatus::Ok;
        r.job_id = job_id;
        r.payload = std::move(payload);
        return r;
    }

    static NodeResponse failure(ResponseStatus status, uint32_t job_id, const std::string& msg) {
        NodeResponse r;
        r.status = status;
        r.job_id = job_id;
        r.error_message = msg;
        return r;
    }

    static NodeResponse error(uint32_t job_id, const std::string& msg) {
        return failure(ResponseStatus::Error, job_id, msg);
    }
};

// Read/write helpers for socket I/O
class SocketReader {
public:
    explicit SocketReader(int fd) : fd_(fd) {}

    // Read exactly n bytes
    bool read_exact(void* buf, size_t n);

    std::optional<uint32_t> read_u32_le();
    std::optional<uint64_t> read_u64_le();

    // u32 length prefix then bytes, bounded by MAX_BLOB_BYTES
    std::optional<Bytes> read_length_prefixed();

    // Server side
    std::optional<NodeRequest> read_request();

    // Client side
    std::optional<NodeResponse> read_response();

private:
    int fd_;
};

class SocketWriter {
public:
    explicit SocketWriter(int fd) : fd_(fd) {}

    // Write exactly n bytes
    bool write_all(const void* buf, size_t n);

    bool write_u32_le(uint32_t v);
    bool write_u64_le(uint64_t v);

    // Server side
    bool write_response(const NodeResponse& response);

    // Client side
    bool write_request(const NodeRequest& request);

private:
    int fd_;
};

} // namespace prover_server
} // namespace zkshard
