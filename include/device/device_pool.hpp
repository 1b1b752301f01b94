#pragma once

#include "common/cancel_token.hpp"
#include "device/device_info.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace zkshard {

class DevicePool;

/**
 * ScopedSlot - one acquired unit of device concurrency
 *
 * Move-only. The slot returns to the pool when the handle is destroyed or
 * release() is called, whichever comes first.
 */
class ScopedSlot {
public:
    ScopedSlot() = default;
    ~ScopedSlot() { release(); }

    ScopedSlot(ScopedSlot&& other) noexcept
        : pool_(other.pool_), device_(other.device_) {
        other.pool_ = nullptr;
    }

    ScopedSlot& operator=(ScopedSlot&& other) noexcept {
        if (this != &other) {
            release();
            pool_ = other.pool_;
            device_ = other.device_;
            other.pool_ = nullptr;
        }
        return *this;
    }

    ScopedSlot(const ScopedSlot&) = delete;
    ScopedSlot& operator=(const ScopedSlot&) = delete;

    DeviceId device() const { return device_; }
    bool valid() const { return pool_ != nullptr; }

    void release() noexcept;

private:
    friend class DevicePool;
    ScopedSlot(DevicePool* pool, DeviceId device) : pool_(pool), device_(device) {}

    DevicePool* pool_ = nullptr;
    DeviceId device_ = 0;
};

/**
 * DevicePool - bounded concurrency per accelerator
 *
 * A counting semaphore per device (slots_per_device each). The device
 * snapshot is taken once at construction. Thread-safe; shared by every
 * request running on the node and by the calibrator. Must outlive every
 * ScopedSlot it hands out.
 */
class DevicePool {
public:
    static constexpr std::chrono::milliseconds WAIT_POLL_INTERVAL{20};

    DevicePool(std::vector<DeviceInfo> devices, uint32_t slots_per_device);

    DevicePool(const DevicePool&) = delete;
    DevicePool& operator=(const DevicePool&) = delete;

    /**
     * Devices captured at pool initialization (may be empty)
     */
    const std::vector<DeviceInfo>& enumerate_devices() const { return devices_; }
    std::vector<DeviceId> device_ids() const;

    bool empty() const { return devices_.empty(); }
    uint32_t slots_per_device() const { return slots_per_device_; }
    uint32_t total_slots() const { return static_cast<uint32_t>(devices_.size()) * slots_per_device_; }

    /**
     * Block until a slot is free.
     *
     * device: a specific device, or any device when nullopt. Without a
     *         named device, devices outside `avoid` are preferred, then the
     *         least-loaded device, then the lowest id.
     *
     * Throws EngineError(DeviceUnavailable) when the pool is empty, the
     * named device is unknown, or `timeout` passes with no slot released
     * anywhere in the pool. Each release restarts the timeout, so a queue
     * that keeps draining never times out however many waves it spans.
     * Throws EngineError(Cancelled) once `cancel` is set.
     */
    ScopedSlot acquire_slot(std::optional<DeviceId> device,
                            std::chrono::milliseconds timeout,
                            const CancelToken* cancel = nullptr,
                            const std::set<DeviceId>& avoid = {});

    /**
     * Non-blocking variant; nullopt when nothing is free right now.
     */
    std::optional<ScopedSlot> try_acquire_slot(std::optional<DeviceId> device,
                                               const std::set<DeviceId>& avoid = {});

    // Diagnostics
    uint32_t in_use(DeviceId device) const;
    uint32_t total_in_use() const;
    uint32_t peak_in_use(DeviceId device) const;

private:
    friend class ScopedSlot;

    struct DeviceCounters {
        uint32_t in_use = 0;
        uint32_t peak = 0;
    };

    // Both called with mutex_ held
    std::optional<DeviceId> pick_device(std::optional<DeviceId> device, const std::set<DeviceId>& avoid) const;
    void take(DeviceId device);

    void release(DeviceId device) noexcept;

    std::vector<DeviceInfo> devices_;
    uint32_t slots_per_device_;

    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    std::map<DeviceId, DeviceCounters> counters_;
    uint64_t releases_ = 0;  // guarded by mutex_
};

} // namespace zkshard
