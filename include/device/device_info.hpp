#pragma once

#include "config/engine_config.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace zkshard {

using DeviceId = uint32_t;

/**
 * Snapshot of one accelerator taken at pool initialization.
 */
struct DeviceInfo {
    DeviceId id = 0;
    std::string name;
    uint64_t total_memory_bytes = 0;
    uint64_t free_memory_bytes = 0;
};

/**
 * Enumerate the devices described by the config.
 *
 * Virtual: returns virtual_device_count devices of the declared size.
 * Cuda: queries the CUDA runtime. Throws ConfigError when the build has no
 * CUDA support.
 *
 * A non-empty `visible` list keeps only the listed ids. The result is
 * sorted by id and may be empty.
 */
std::vector<DeviceInfo> discover_devices(const DeviceSection& devices);

std::vector<DeviceInfo> virtual_devices(uint32_t count, uint64_t memory_bytes);

/**
 * Query the CUDA runtime (cudaGetDeviceCount, cudaGetDeviceProperties,
 * cudaMemGetInfo). Returns an empty list when no device is attached.
 */
std::vector<DeviceInfo> cuda_devices();

bool cuda_discovery_available();

/**
 * Resolve the pool's ShardingConfig: profile defaults (or the auto profile
 * from the smallest free-memory figure), then the overrides, then
 * validation. Throws ConfigError on invalid results and EngineError
 * (DeviceUnavailable) when the device list is empty.
 */
ShardingConfig resolve_sharding_config(const EngineConfig& config, const std::vector<DeviceInfo>& devices);

} // namespace zkshard
