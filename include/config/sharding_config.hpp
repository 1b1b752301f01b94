#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace zkshard {

/**
 * Known accelerator classes with tuned sharding defaults.
 * Auto derives the defaults from measured free device memory instead.
 */
enum class DeviceProfile {
    Rtx3080,
    Rtx3090,
    Rtx4080,
    Rtx4090,
    A100,
    Auto
};

/**
 * Parse "rtx3080", "rtx3090", "rtx4080", "rtx4090", "a100" or "auto".
 * Throws ConfigError for anything else.
 */
DeviceProfile device_profile_from_string(const std::string& s);
const char* to_string(DeviceProfile profile);

/**
 * Sharding Configuration
 *
 * Selected once per device pool and held read-only for the pool's
 * lifetime. Invariants (checked by validate()):
 * - device_count >= 1, shards_per_device >= 1
 * - 1 <= min_cycles_per_shard <= max_cycles_per_shard
 * - checkpoint_interval_cycles >= 1 when checkpointing is enabled
 */
struct ShardingConfig {
    // =========================================================================
    // Auto Profile Constants
    // =========================================================================

    // One concurrent shard per 4 GiB of free device memory
    static constexpr uint64_t AUTO_BYTES_PER_SHARD = 4ULL * 1024 * 1024 * 1024;
    static constexpr uint32_t AUTO_MAX_SHARDS_PER_DEVICE = 8;
    // Approximate trace memory per proved cycle
    static constexpr uint64_t AUTO_BYTES_PER_CYCLE = 80;
    static constexpr uint64_t AUTO_MIN_FRACTION = 10;

    // =========================================================================
    // Configuration
    // =========================================================================

    uint32_t device_count = 1;
    uint32_t shards_per_device = 1;
    uint64_t min_cycles_per_shard = 1;
    uint64_t max_cycles_per_shard = 1;
    uint64_t checkpoint_interval_cycles = 1;
    bool enable_checkpointing = true;

    // =========================================================================
    // Computed Values
    // =========================================================================

    uint32_t target_shard_count() const {
        return device_count * shards_per_device;
    }

    /**
     * Throws ConfigError naming the violated field.
     */
    void validate() const;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * Tuned defaults for a known profile. Auto is rejected here because it
     * needs a memory figure; use auto_from_memory().
     */
    static ShardingConfig for_profile(DeviceProfile profile, uint32_t device_count);

    /**
     * Derive defaults from the smallest free-memory figure in the pool.
     */
    static ShardingConfig auto_from_memory(uint64_t min_free_bytes, uint32_t device_count);

    /**
     * Print configuration summary
     */
    void print() const;
};

bool operator==(const ShardingConfig& a, const ShardingConfig& b);

} // namespace zkshard
