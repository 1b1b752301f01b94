#pragma once

#include "config/policies.hpp"
#include "config/sharding_config.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zkshard {

/**
 * Where the device list comes from.
 */
enum class DiscoverySource {
    Virtual,  // devices declared in the config (reference CPU backend)
    Cuda      // CUDA runtime query
};

DiscoverySource discovery_source_from_string(const std::string& s);
const char* to_string(DiscoverySource source);

struct DeviceSection {
    DiscoverySource discovery = DiscoverySource::Virtual;
    DeviceProfile profile = DeviceProfile::Auto;
    std::vector<uint32_t> visible;  // empty = all devices
    uint32_t virtual_device_count = 1;
    double virtual_device_memory_gib = 24.0;
};

/**
 * Per-field overrides applied on top of the profile defaults.
 */
struct ShardingOverrides {
    std::optional<uint32_t> shards_per_device;
    std::optional<uint64_t> min_cycles_per_shard;
    std::optional<uint64_t> max_cycles_per_shard;
    std::optional<uint64_t> checkpoint_interval_cycles;
    std::optional<bool> enable_checkpointing;

    ShardingConfig apply(ShardingConfig base) const;
};

struct OrchestratorOptions {
    uint32_t retry_budget = 2;
    std::chrono::milliseconds slot_wait_timeout{600000};
    DeadlinePolicy deadline_policy = DeadlinePolicy::AbortWhenExceeded;
    CombineStrategy combine_strategy = CombineStrategy::Sequential;
};

struct ParallelSection {
    int num_threads = 0;  // 0 = auto
};

struct LoggingSection {
    bool debug = false;
    bool profile = false;
};

struct CalibrationSection {
    uint64_t cycles_per_run = 0;  // 0 = min_cycles_per_shard of the pool
    size_t program_length = 64;
    double safety_margin = 0.8;
    uint64_t seed = 1;
};

/**
 * EngineConfig - the validated configuration of one sharding node
 *
 * Built once at startup (defaults, JSON file, CLI overrides) and passed by
 * reference into each component. Nothing else reads process state.
 *
 * JSON layout:
 *   {
 *     "devices":      { "discovery", "profile", "visible",
 *                       "virtual_device_count", "virtual_device_memory_gib" },
 *     "sharding":     { "shards_per_device", "min_cycles_per_shard",
 *                       "max_cycles_per_shard", "checkpoint_interval_cycles",
 *                       "enable_checkpointing" },
 *     "orchestrator": { "retry_budget", "slot_wait_timeout_ms",
 *                       "deadline_policy", "combine_strategy" },
 *     "parallel":     { "num_threads" },
 *     "logging":      { "debug", "profile" },
 *     "calibration":  { "cycles_per_run", "program_length", "safety_margin", "seed" }
 *   }
 * Every key is optional; missing keys keep their defaults.
 */
struct EngineConfig {
    DeviceSection devices;
    ShardingOverrides sharding;
    OrchestratorOptions orchestrator;
    ParallelSection parallel;
    LoggingSection logging;
    CalibrationSection calibration;

    /**
     * Parse and validate. Throws ConfigError naming the offending key.
     */
    static EngineConfig from_json(const nlohmann::json& json);

    /**
     * Read a JSON file and parse it. Throws ConfigError if the file cannot
     * be opened or is not valid JSON.
     */
    static EngineConfig load_file(const std::string& path);

    nlohmann::json to_json() const;

    void validate() const;
};

} // namespace zkshard
