#include "config/sharding_config.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <iostream>

namespace zkshard {

DeviceProfile device_profile_from_string(const std::string& s) {
    if (s == "rtx3080") return DeviceProfile::Rtx3080;
    if (s == "rtx3090") return DeviceProfile::Rtx3090;
    if (s == "rtx4080") return DeviceProfile::Rtx4080;
    if (s == "rtx4090") return DeviceProfile::Rtx4090;
    if (s == "a100") return DeviceProfile::A100;
    if (s == "auto") return DeviceProfile::Auto;
    throw ConfigError("devices.profile: unknown profile '" + s + "'");
}

const char* to_string(DeviceProfile profile) {
    switch (profile) {
        case DeviceProfile::Rtx3080: return "rtx3080";
        case DeviceProfile::Rtx3090: return "rtx3090";
        case DeviceProfile::Rtx4080: return "rtx4080";
        case DeviceProfile::Rtx4090: return "rtx4090";
        case DeviceProfile::A100:    return "a100";
        case DeviceProfile::Auto:    return "auto";
    }
    return "unknown";
}

void ShardingConfig::validate() const {
    if (device_count < 1) {
        throw ConfigError("sharding.device_count must be >= 1");
    }
    if (shards_per_device < 1) {
        throw ConfigError("sharding.shards_per_device must be >= 1");
    }
    if (min_cycles_per_shard < 1) {
        throw ConfigError("sharding.min_cycles_per_shard must be >= 1");
    }
    if (min_cycles_per_shard > max_cycles_per_shard) {
        throw ConfigError("sharding.min_cycles_per_shard (" + std::to_string(min_cycles_per_shard)
            + ") exceeds sharding.max_cycles_per_shard (" + std::to_string(max_cycles_per_shard) + ")");
    }
    if (enable_checkpointing && checkpoint_interval_cycles < 1) {
        throw ConfigError("sharding.checkpoint_interval_cycles must be >= 1");
    }
}

ShardingConfig ShardingConfig::for_profile(DeviceProfile profile, uint32_t device_count) {
    ShardingConfig cfg;
    cfg.device_count = device_count;
    cfg.enable_checkpointing = true;

    switch (profile) {
        case DeviceProfile::Rtx3080:
            cfg.shards_per_device = 3;
            cfg.min_cycles_per_shard = 1500000;
            cfg.max_cycles_per_shard = 15000000;
            break;
        case DeviceProfile::Rtx4080:
            cfg.shards_per_device = 4;
            cfg.min_cycles_per_shard = 3000000;
            cfg.max_cycles_per_shard = 30000000;
            break;
        case DeviceProfile::Rtx3090:
            cfg.shards_per_device = 6;
            cfg.min_cycles_per_shard = 4000000;
            cfg.max_cycles_per_shard = 40000000;
            break;
        case DeviceProfile::Rtx4090:
            cfg.shards_per_device = 6;
            cfg.min_cycles_per_shard = 5000000;
            cfg.max_cycles_per_shard = 50000000;
            break;
        case DeviceProfile::A100:
            cfg.shards_per_device = 8;
            cfg.min_cycles_per_shard = 10000000;
            cfg.max_cycles_per_shard = 100000000;
            break;
        case DeviceProfile::Auto:
            throw ConfigError("devices.profile: auto needs a free-memory figure");
    }

    cfg.checkpoint_interval_cycles = cfg.min_cycles_per_shard;
    return cfg;
}

ShardingConfig ShardingConfig::auto_from_memory(uint64_t min_free_bytes, uint32_t device_count) {
    ShardingConfig cfg;
    cfg.device_count = device_count;
    cfg.enable_checkpointing = true;

    uint64_t shards = min_free_bytes / AUTO_BYTES_PER_SHARD;
    shards = std::max<uint64_t>(1, std::min<uint64_t>(shards, AUTO_MAX_SHARDS_PER_DEVICE));
    cfg.shards_per_device = static_cast<uint32_t>(shards);

    uint64_t per_shard_bytes = min_free_bytes / shards;
    cfg.max_cycles_per_shard = std::max<uint64_t>(AUTO_MIN_FRACTION, per_shard_bytes / AUTO_BYTES_PER_CYCLE);
    cfg.min_cycles_per_shard = std::max<uint64_t>(1, cfg.max_cycles_per_shard / AUTO_MIN_FRACTION);
    cfg.checkpoint_interval_cycles = cfg.min_cycles_per_shard;
    return cfg;
}

void ShardingConfig::print() const {
    std::cout << "[config] Sharding:" << std::endl;
    std::cout << "  devices:             " << device_count << std::endl;
    std::cout << "  shards/device:       " << shards_per_device << std::endl;
    std::cout << "  cycles/shard:        " << min_cycles_per_shard << " - " << max_cycles_per_shard << std::endl;
    std::cout << "  checkpointing:       " << (enable_checkpointing ? "enabled" : "disabled");
    if (enable_checkpointing) {
        std::cout << " (every " << checkpoint_interval_cycles << " cycles)";
    }
    std::cout << std::endl;
}

bool operator==(const ShardingConfig& a, const ShardingConfig& b) {
    return a.device_count == b.device_count
        && a.shards_per_device == b.shards_per_device
        && a.min_cycles_per_shard == b.min_cycles_per_shard
        && a.max_cycles_per_shard == b.max_cycles_per_shard
        && a.checkpoint_interval_cycles == b.checkpoint_interval_cycles
        && a.enable_checkpointing == b.enable_checkpointing;
}

} // namespace zkshard
