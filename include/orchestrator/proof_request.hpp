#pragma once

#include "common/byte_io.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

namespace zkshard {

/**
 * One accepted proof request. Consumed once by an orchestrator and never
 * mutated.
 */
struct ProofRequest {
    using Clock = std::chrono::steady_clock;

    Bytes program_binary;
    Bytes input_bytes;
    uint64_t estimated_total_cycles = 0;
    std::optional<Clock::time_point> deadline;
};

} // namespace zkshard
