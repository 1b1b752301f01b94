#pragma once

#include "combiner/recursion_combiner.hpp"
#include "common/errors.hpp"
#include "device/device_info.hpp"
#include "executor/shard_executor.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace zkshard {

/**
 * Per-device shard attempt counters.
 */
struct DeviceMetrics {
    DeviceId device = 0;
    uint64_t shards_succeeded = 0;
    uint64_t shards_failed = 0;
    double busy_seconds = 0.0;
    // busy_seconds / (uptime * slots per device), at most 1
    double utilization = 0.0;
};

/**
 * Point-in-time copy of EngineMetrics.
 */
struct MetricsSnapshot {
    uint64_t proofs_completed = 0;
    uint64_t proofs_failed = 0;
    uint64_t deadline_misses = 0;
    uint64_t shards_processed = 0;  // shards of completed proofs
    uint64_t cycles_proved = 0;

    // Request latency over completed proofs
    std::chrono::duration<double> average_latency{0};
    std::chrono::duration<double> fastest_latency{0};
    std::chrono::duration<double> slowest_latency{0};

    double uptime_seconds = 0.0;
    std::vector<DeviceMetrics> devices;

    nlohmann::json to_json() const;
};

/**
 * EngineMetrics - running totals over every request an engine proved
 *
 * Updated once per request from its outcome and its shard attempt log.
 * Thread-safe; concurrent requests record into the same instance.
 */
class EngineMetrics {
public:
    EngineMetrics(const std::vector<DeviceInfo>& devices, uint32_t slots_per_device);

    void record_success(const FinalProof& proof,
                        std::chrono::duration<double> latency,
                        const std::vector<ShardResult>& attempts);

    void record_failure(ErrorKind kind, const std::vector<ShardResult>& attempts);

    MetricsSnapshot snapshot() const;

private:
    void record_attempts(const std::vector<ShardResult>& attempts);

    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point started_;
    uint32_t slots_per_device_;

    uint64_t proofs_completed_ = 0;
    uint64_t proofs_failed_ = 0;
    uint64_t deadline_misses_ = 0;
    uint64_t shards_processed_ = 0;
    uint64_t cycles_proved_ = 0;
    std::chrono::duration<double> total_latency_{0};
    std::chrono::duration<double> fastest_latency_{0};
    std::chrono::duration<double> slowest_latency_{0};
    std::map<DeviceId, DeviceMetrics> devices_;
};

} // namespace zkshard
