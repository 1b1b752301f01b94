#include "protocol.hpp"

#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace zkshard {
namespace prover_server {

const char* to_string(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::Ok: return "OK";
        case ResponseStatus::Aborted: return "ABORTED";
        case ResponseStatus::DeadlineExceeded: return "DEADLINE_EXCEEDED";
        case ResponseStatus::DeviceUnavailable: return "DEVICE_UNAVAILABLE";
        case ResponseStatus::CombineFailed: return "COMBINE_FAILED";
        case ResponseStatus::InvalidRequest: return "INVALID_REQUEST";
        case ResponseStatus::Error: return "ERROR";
    }
    return "ERROR";
}

ResponseStatus status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidRequest: return ResponseStatus::InvalidRequest;
        case ErrorKind::DeviceUnavailable: return ResponseStatus::DeviceUnavailable;
        case ErrorKind::CombineError: return ResponseStatus::CombineFailed;
        case ErrorKind::DeadlineExceeded: return ResponseStatus::DeadlineExceeded;
        case ErrorKind::CheckpointUnsupported:
        case ErrorKind::CheckpointCorrupt:
        case ErrorKind::ShardExecutionFailed:
        case ErrorKind::Cancelled:
            return ResponseStatus::Aborted;
        case ErrorKind::InvalidConfig:
            return ResponseStatus::Error;
    }
    return ResponseStatus::Error;
}

// SocketReader implementation

bool SocketReader::read_exact(void* buf, size_t n) {
    uint8_t* ptr = static_cast<uint8_t*>(buf);
    size_t remaining = n;

    while (remaining > 0) {
        ssize_t bytes_read = ::read(fd_, ptr, remaining);
        if (bytes_read <= 0) {
            if (bytes_read == 0) {
                // Connection closed
                return false;
            }
            if (errno == EINTR) {
                continue;  // Interrupted, retry
            }
            return false;  // Error
        }
        ptr += bytes_read;
        remaining -= static_cast<size_t>(bytes_read);
    }
    return true;
}

std::optional<uint32_t> SocketReader::read_u32_le() {
    uint8_t buf[4];
    if (!read_exact(buf, 4)) {
        return std::nullopt;
    }
    return load_u32_le(buf);
}

std::optional<uint64_t> SocketReader::read_u64_le() {
    uint8_t buf[8];
    if (!read_exact(buf, 8)) {
        return std::nullopt;
    }
    return load_u64_le(buf);
}

std::optional<Bytes> SocketReader::read_length_prefixed() {
    auto len_opt = read_u32_le();
    if (!len_opt) {
        return std::nullopt;
    }

    uint32_t len = *len_opt;
    if (len > MAX_BLOB_BYTES) {
        std::cerr << "[protocol] Blob too large: " << len << " bytes" << std::endl;
        return std::nullopt;
    }

    Bytes result(len);
    if (len > 0 && !read_exact(result.data(), len)) {
        return std::nullopt;
    }
    return result;
}

std::optional<NodeRequest> SocketReader::read_request() {
    // Read and verify magic
    auto magic_opt = read_u32_le();
    if (!magic_opt) {
        return std::nullopt;
    }
    if (*magic_opt != MAGIC_REQUEST) {
        std::cerr << "[protocol] Invalid magic: expected 0x" << std::hex << MAGIC_REQUEST
                  << ", got 0x" << *magic_opt << std::dec << std::endl;
        return std::nullopt;
    }

    // Read and verify version
    auto version_opt = read_u32_le();
    if (!version_opt) {
        return std::nullopt;
    }
    if (*version_opt != PROTOCOL_VERSION) {
        std::cerr << "[protocol] Unsupported version: " << *version_opt << std::endl;
        return std::nullopt;
    }

    auto job_id_opt = read_u32_le();
    if (!job_id_opt) {
        return std::nullopt;
    }

    auto kind_opt = read_u32_le();
    if (!kind_opt) {
        return std::nullopt;
    }

    NodeRequest request;
    request.job_id = *job_id_opt;

    if (*kind_opt == static_cast<uint32_t>(RequestKind::Status)) {
        request.kind = RequestKind::Status;
        return request;
    }
    if (*kind_opt != static_cast<uint32_t>(RequestKind::Prove)) {
        std::cerr << "[protocol] Unknown request kind: " << *kind_opt << std::endl;
        return std::nullopt;
    }
    request.kind = RequestKind::Prove;

    auto program = read_length_prefixed();
    if (!program) return std::nullopt;

    auto input = read_length_prefixed();
    if (!input) return std::nullopt;

    auto cycles = read_u64_le();
    if (!cycles) return std::nullopt;

    auto deadline = read_u64_le();
    if (!deadline) return std::nullopt;

    request.program_binary = std::move(*program);
    request.input = std::move(*input);
    request.estimated_total_cycles = *cycles;
    request.deadline_ms = *deadline;
    return request;
}

std::optional<NodeResponse> SocketReader::read_response() {
    auto magic_opt = read_u32_le();
    if (!magic_opt || *magic_opt != MAGIC_RESPONSE) {
        return std::nullopt;
    }

    auto status_opt = read_u32_le();
    if (!status_opt || *status_opt > static_cast<uint32_t>(ResponseStatus::Error)) {
        return std::nullopt;
    }

    auto job_id_opt = read_u32_le();
    if (!job_id_opt) {
        return std::nullopt;
    }

    NodeResponse response;
    response.status = static_cast<ResponseStatus>(*status_opt);
    response.job_id = *job_id_opt;

    if (response.status == ResponseStatus::Ok) {
        auto len = read_u64_le();
        if (!len || *len > MAX_BLOB_BYTES) {
            return std::nullopt;
        }
        response.payload.resize(static_cast<size_t>(*len));
        if (*len > 0 && !read_exact(response.payload.data(), response.payload.size())) {
            return std::nullopt;
        }
    } else {
        auto message = read_length_prefixed();
        if (!message) {
            return std::nullopt;
        }
        response.error_message.assign(message->begin(), message->end());
    }
    return response;
}

// SocketWriter implementation

bool SocketWriter::write_all(const void* buf, size_t n) {
    const uint8_t* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = n;

    while (remaining > 0) {
        ssize_t bytes_written = ::write(fd_, ptr, remaining);
        if (bytes_written <= 0) {
            if (errno == EINTR) {
                continue;  // Interrupted, retry
            }
            return false;  // Error
        }
        ptr += bytes_written;
        remaining -= static_cast<size_t>(bytes_written);
    }
    return true;
}

bool SocketWriter::write_u32_le(uint32_t v) {
    uint8_t buf[4];
    store_u32_le(buf, v);
    return write_all(buf, 4);
}

bool SocketWriter::write_u64_le(uint64_t v) {
    uint8_t buf[8];
    store_u64_le(buf, v);
    return write_all(buf, 8);
}

bool SocketWriter::write_response(const NodeResponse& response) {
    if (!write_u32_le(MAGIC_RESPONSE)) return false;
    if (!write_u32_le(static_cast<uint32_t>(response.status))) return false;
    if (!write_u32_le(response.job_id)) return false;

    if (response.status == ResponseStatus::Ok) {
        if (!write_u64_le(response.payload.size())) return false;
        if (!write_all(response.payload.data(), response.payload.size())) return false;
    } else {
        if (!write_u32_le(static_cast<uint32_t>(response.error_message.size()))) return false;
        if (!write_all(response.error_message.data(), response.error_message.size())) return false;
    }
    return true;
}

bool SocketWriter::write_request(const NodeRequest& request) {
    if (!write_u32_le(MAGIC_REQUEST)) return false;
    if (!write_u32_le(PROTOCOL_VERSION)) return false;
    if (!write_u32_le(request.job_id)) return false;
    if (!write_u32_le(static_cast<uint32_t>(request.kind))) return false;

    if (request.kind == RequestKind::Prove) {
        if (!write_u32_le(static_cast<uint32_t>(request.program_binary.size()))) return false;
        if (!write_all(request.program_binary.data(), request.program_binary.size())) return false;
        if (!write_u32_le(static_cast<uint32_t>(request.input.size()))) return false;
        if (!write_all(request.input.data(), request.input.size())) return false;
        if (!write_u64_le(request.estimated_total_cycles)) return false;
        if (!write_u64_le(request.deadline_ms)) return false;
    }
    return true;
}

} // namespace prover_server
} // namespace zkshard
