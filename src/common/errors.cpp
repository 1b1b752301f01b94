#include "common/errors.hpp"

namespace zkshard {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidConfig:         return "InvalidConfig";
        case ErrorKind::InvalidRequest:        return "InvalidRequest";
        case ErrorKind::DeviceUnavailable:     return "DeviceUnavailable";
        case ErrorKind::CheckpointUnsupported: return "CheckpointUnsupported";
        case ErrorKind::CheckpointCorrupt:     return "CheckpointCorrupt";
        case ErrorKind::ShardExecutionFailed:  return "ShardExecutionFailed";
        case ErrorKind::CombineError:          return "CombineError";
        case ErrorKind::DeadlineExceeded:      return "DeadlineExceeded";
        case ErrorKind::Cancelled:             return "Cancelled";
    }
    return "Unknown";
}

} // namespace zkshard
