/**
 * Device discovery
 */

#include "device/device_info.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <iostream>

#ifdef ZKSHARD_CUDA_ENABLED
#include <cuda_runtime.h>
#endif

namespace zkshard {

std::vector<DeviceInfo> virtual_devices(uint32_t count, uint64_t memory_bytes) {
    std::vector<DeviceInfo> devices;
    devices.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        DeviceInfo info;
        info.id = i;
        info.name = "virtual-" + std::to_string(i);
        info.total_memory_bytes = memory_bytes;
        info.free_memory_bytes = memory_bytes;
        devices.push_back(info);
    }
    return devices;
}

#ifdef ZKSHARD_CUDA_ENABLED

bool cuda_discovery_available() { return true; }

std::vector<DeviceInfo> cuda_devices() {
    int count = 0;
    cudaError_t err = cudaGetDeviceCount(&count);
    if (err == cudaErrorNoDevice || err == cudaErrorInsufficientDriver) {
        return {};
    }
    if (err != cudaSuccess) {
        throw std::runtime_error("cudaGetDeviceCount failed: " +
            std::string(cudaGetErrorString(err)));
    }

    std::vector<DeviceInfo> devices;
    for (int i = 0; i < count; ++i) {
        cudaDeviceProp prop;
        err = cudaGetDeviceProperties(&prop, i);
        if (err != cudaSuccess) {
            throw std::runtime_error("cudaGetDeviceProperties failed: " +
                std::string(cudaGetErrorString(err)));
        }

        err = cudaSetDevice(i);
        if (err != cudaSuccess) {
            throw std::runtime_error("cudaSetDevice failed: " +
                std::string(cudaGetErrorString(err)));
        }
        size_t free_bytes = 0;
        size_t total_bytes = 0;
        err = cudaMemGetInfo(&free_bytes, &total_bytes);
        if (err != cudaSuccess) {
            throw std::runtime_error("cudaMemGetInfo failed: " +
                std::string(cudaGetErrorString(err)));
        }

        DeviceInfo info;
        info.id = static_cast<DeviceId>(i);
        info.name = prop.name;
        info.total_memory_bytes = total_bytes;
        info.free_memory_bytes = free_bytes;
        devices.push_back(info);
    }
    return devices;
}

#else // !ZKSHARD_CUDA_ENABLED

bool cuda_discovery_available() { return false; }

std::vector<DeviceInfo> cuda_devices() {
    throw ConfigError("devices.discovery: CUDA not available - build with ZKSHARD_ENABLE_CUDA=ON");
}

#endif // ZKSHARD_CUDA_ENABLED

std::vector<DeviceInfo> discover_devices(const DeviceSection& section) {
    std::vector<DeviceInfo> devices;
    switch (section.discovery) {
        case DiscoverySource::Virtual: {
            uint64_t bytes = static_cast<uint64_t>(section.virtual_device_memory_gib * 1024.0 * 1024.0 * 1024.0);
            devices = virtual_devices(section.virtual_device_count, bytes);
            break;
        }
        case DiscoverySource::Cuda:
            devices = cuda_devices();
            break;
    }

    if (!section.visible.empty()) {
        devices.erase(std::remove_if(devices.begin(), devices.end(), [&](const DeviceInfo& d) {
            return std::find(section.visible.begin(), section.visible.end(), d.id) == section.visible.end();
        }), devices.end());
    }
    std::sort(devices.begin(), devices.end(), [](const DeviceInfo& a, const DeviceInfo& b) {
        return a.id < b.id;
    });

    ZKSHARD_DEBUG_COUT("[pool] Discovered " << devices.size() << " device(s) via "
        << to_string(section.discovery) << std::endl);
    return devices;
}

ShardingConfig resolve_sharding_config(const EngineConfig& config, const std::vector<DeviceInfo>& devices) {
    if (devices.empty()) {
        throw EngineError(ErrorKind::DeviceUnavailable, "no devices available for proving");
    }
    const uint32_t device_count = static_cast<uint32_t>(devices.size());

    ShardingConfig base;
    if (config.devices.profile == DeviceProfile::Auto) {
        uint64_t min_free = devices.front().free_memory_bytes;
        for (const auto& d : devices) {
            min_free = std::min(min_free, d.free_memory_bytes);
        }
        base = ShardingConfig::auto_from_memory(min_free, device_count);
    } else {
        base = ShardingConfig::for_profile(config.devices.profile, device_count);
    }

    ShardingConfig resolved = config.sharding.apply(base);
    resolved.validate();
    return resolved;
}

} // namespace zkshard
