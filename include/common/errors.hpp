#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace zkshard {

/**
 * Terminal causes reported to callers of the sharding engine.
 */
enum class ErrorKind {
    InvalidConfig,
    InvalidRequest,
    DeviceUnavailable,
    CheckpointUnsupported,
    CheckpointCorrupt,
    ShardExecutionFailed,
    CombineError,
    DeadlineExceeded,
    Cancelled
};

const char* to_string(ErrorKind kind);

/**
 * Base error for everything the engine raises on its own behalf.
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& message)
        : EngineError(ErrorKind::InvalidConfig, message) {}
};

/**
 * Raised by the checkpoint manager.
 *
 * Unsupported: the requested cycle is not a resumable boundary (for
 * example it lies inside a multi-cycle instruction).
 * Corrupt: a checkpoint blob failed its integrity check.
 */
class CheckpointError : public EngineError {
public:
    enum class Code { Unsupported, Corrupt };

    static CheckpointError unsupported(uint64_t cycle, const std::string& reason) {
        return CheckpointError(Code::Unsupported,
            "checkpoint unsupported at cycle " + std::to_string(cycle) + ": " + reason);
    }

    static CheckpointError corrupt(const std::string& reason) {
        return CheckpointError(Code::Corrupt, "checkpoint corrupt: " + reason);
    }

    Code code() const noexcept { return code_; }

private:
    CheckpointError(Code code, const std::string& message)
        : EngineError(code == Code::Unsupported ? ErrorKind::CheckpointUnsupported
                                                : ErrorKind::CheckpointCorrupt,
                      message),
          code_(code) {}

    Code code_;
};

class CombineError : public EngineError {
public:
    explicit CombineError(const std::string& message)
        : EngineError(ErrorKind::CombineError, message) {}
};

/**
 * Raised by proving backends. Never escapes the engine directly: the shard
 * executor turns it into a failed ShardResult and the combiner turns it
 * into a CombineError.
 */
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace zkshard
