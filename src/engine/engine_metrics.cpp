#include "engine/engine_metrics.hpp"
#include <algorithm>

namespace zkshard {

nlohmann::json MetricsSnapshot::to_json() const {
    nlohmann::json j;
    j["proofs_completed"] = proofs_completed;
    j["proofs_failed"] = proofs_failed;
    j["deadline_misses"] = deadline_misses;
    j["shards_processed"] = shards_processed;
    j["cycles_proved"] = cycles_proved;
    j["average_latency_ms"] = average_latency.count() * 1000.0;
    j["fastest_latency_ms"] = fastest_latency.count() * 1000.0;
    j["slowest_latency_ms"] = slowest_latency.count() * 1000.0;
    j["uptime_seconds"] = uptime_seconds;

    nlohmann::json devs = nlohmann::json::array();
    for (const auto& d : devices) {
        devs.push_back({
            {"device", d.device},
            {"shards_succeeded", d.shards_succeeded},
            {"shards_failed", d.shards_failed},
            {"busy_seconds", d.busy_seconds},
            {"utilization", d.utilization},
        });
    }
    j["devices"] = devs;
    return j;
}

EngineMetrics::EngineMetrics(const std::vector<DeviceInfo>& devices, uint32_t slots_per_device)
    : started_(std::chrono::steady_clock::now()),
      slots_per_device_(std::max<uint32_t>(1, slots_per_device)) {
    for (const auto& d : devices) {
        devices_[d.id].device = d.id;
    }
}

void EngineMetrics::record_attempts(const std::vector<ShardResult>& attempts) {
    for (const auto& r : attempts) {
        DeviceMetrics& d = devices_[r.device];
        d.device = r.device;
        if (r.ok()) {
            ++d.shards_succeeded;
        } else {
            ++d.shards_failed;
        }
        d.busy_seconds += r.execution_duration.count();
    }
}

void EngineMetrics::record_success(const FinalProof& proof,
                                   std::chrono::duration<double> latency,
                                   const std::vector<ShardResult>& attempts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (proofs_completed_ == 0 || latency < fastest_latency_) {
        fastest_latency_ = latency;
    }
    slowest_latency_ = std::max(slowest_latency_, latency);
    total_latency_ += latency;
    ++proofs_completed_;
    shards_processed_ += proof.num_shards;
    cycles_proved_ += proof.total_cycles;
    record_attempts(attempts);
}

void EngineMetrics::record_failure(ErrorKind kind, const std::vector<ShardResult>& attempts) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++proofs_failed_;
    if (kind == ErrorKind::DeadlineExceeded) {
        ++deadline_misses_;
    }
    record_attempts(attempts);
}

MetricsSnapshot EngineMetrics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MetricsSnapshot s;
    s.proofs_completed = proofs_completed_;
    s.proofs_failed = proofs_failed_;
    s.deadline_misses = deadline_misses_;
    s.shards_processed = shards_processed_;
    s.cycles_proved = cycles_proved_;
    if (proofs_completed_ > 0) {
        s.average_latency = total_latency_ / static_cast<double>(proofs_completed_);
    }
    s.fastest_latency = fastest_latency_;
    s.slowest_latency = slowest_latency_;
    s.uptime_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();

    const double capacity = s.uptime_seconds * slots_per_device_;
    for (const auto& entry : devices_) {
        DeviceMetrics d = entry.second;
        d.utilization = capacity > 0.0 ? std::min(1.0, d.busy_seconds / capacity) : 0.0;
        s.devices.push_back(d);
    }
    return s;
}

} // namespace zkshard
