#include "device/device_pool.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace zkshard {

void ScopedSlot::release() noexcept {
    if (pool_) {
        pool_->release(device_);
        pool_ = nullptr;
    }
}

DevicePool::DevicePool(std::vector<DeviceInfo> devices, uint32_t slots_per_device)
    : devices_(std::move(devices)), slots_per_device_(slots_per_device) {
    if (slots_per_device_ < 1) {
        throw ConfigError("slots per device must be >= 1");
    }
    for (const auto& d : devices_) {
        if (!counters_.emplace(d.id, DeviceCounters{}).second) {
            throw ConfigError("duplicate device id " + std::to_string(d.id));
        }
    }
    std::cout << "[pool] " << devices_.size() << " device(s), "
              << slots_per_device_ << " slot(s) each" << std::endl;
}

std::vector<DeviceId> DevicePool::device_ids() const {
    std::vector<DeviceId> ids;
    ids.reserve(devices_.size());
    for (const auto& d : devices_) {
        ids.push_back(d.id);
    }
    return ids;
}

std::optional<DeviceId> DevicePool::pick_device(std::optional<DeviceId> device,
                                                const std::set<DeviceId>& avoid) const {
    if (device) {
        const auto& c = counters_.at(*device);
        if (c.in_use < slots_per_device_) return device;
        return std::nullopt;
    }

    // Rank: (avoided, in_use, id); counters_ iterates in ascending id
    std::optional<DeviceId> best;
    bool best_avoided = true;
    uint32_t best_load = 0;
    for (const auto& entry : counters_) {
        if (entry.second.in_use >= slots_per_device_) continue;
        bool avoided = avoid.count(entry.first) > 0;
        if (!best
            || (best_avoided && !avoided)
            || (best_avoided == avoided && entry.second.in_use < best_load)) {
            best = entry.first;
            best_avoided = avoided;
            best_load = entry.second.in_use;
        }
    }
    return best;
}

void DevicePool::take(DeviceId device) {
    auto& c = counters_.at(device);
    ++c.in_use;
    c.peak = std::max(c.peak, c.in_use);
}

ScopedSlot DevicePool::acquire_slot(std::optional<DeviceId> device,
                                    std::chrono::milliseconds timeout,
                                    const CancelToken* cancel,
                                    const std::set<DeviceId>& avoid) {
    if (devices_.empty()) {
        throw EngineError(ErrorKind::DeviceUnavailable, "device pool is empty");
    }
    if (device && counters_.count(*device) == 0) {
        throw EngineError(ErrorKind::DeviceUnavailable, "unknown device " + std::to_string(*device));
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    uint64_t seen_releases = releases_;
    while (true) {
        if (cancel && cancel->is_cancelled()) {
            throw EngineError(ErrorKind::Cancelled, "slot wait cancelled");
        }
        if (auto picked = pick_device(device, avoid)) {
            take(*picked);
            ZKSHARD_DEBUG_COUT("[pool] acquired slot on device " << *picked
                << " (" << counters_.at(*picked).in_use << "/" << slots_per_device_ << ")" << std::endl);
            return ScopedSlot(this, *picked);
        }
        auto now = std::chrono::steady_clock::now();
        // The timeout counts from the last release anywhere in the pool
        if (releases_ != seen_releases) {
            seen_releases = releases_;
            deadline = now + timeout;
        }
        if (now >= deadline) {
            throw EngineError(ErrorKind::DeviceUnavailable,
                "no free device slot within " + std::to_string(timeout.count()) + " ms");
        }
        // Bounded wait so cancellation is noticed without a notify
        auto wake = std::min(deadline, now + WAIT_POLL_INTERVAL);
        slot_freed_.wait_until(lock, wake);
    }
}

std::optional<ScopedSlot> DevicePool::try_acquire_slot(std::optional<DeviceId> device,
                                                       const std::set<DeviceId>& avoid) {
    if (device && counters_.count(*device) == 0) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto picked = pick_device(device, avoid);
    if (!picked) {
        return std::nullopt;
    }
    take(*picked);
    return ScopedSlot(this, *picked);
}

void DevicePool::release(DeviceId device) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(device);
        if (it != counters_.end() && it->second.in_use > 0) {
            --it->second.in_use;
            ++releases_;
        }
    }
    slot_freed_.notify_all();
}

uint32_t DevicePool::in_use(DeviceId device) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(device);
    return it == counters_.end() ? 0 : it->second.in_use;
}

uint32_t DevicePool::total_in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t total = 0;
    for (const auto& entry : counters_) {
        total += entry.second.in_use;
    }
    return total;
}

uint32_t DevicePool::peak_in_use(DeviceId device) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(device);
    return it == counters_.end() ? 0 : it->second.peak;
}

} // namespace zkshard
