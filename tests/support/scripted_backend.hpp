#pragma once

/**
 * ScriptedBackend - deterministic fake proving backend for tests
 *
 * A proof is the encoded range {start u64, end u64, segments u32}; combine
 * checks adjacency exactly like a real backend would. Failures, delays and
 * tree support are scripted per test.
 */

#include "backend/backend.hpp"
#include "common/byte_io.hpp"
#include "common/errors.hpp"
#include "config/sharding_config.hpp"
#include "device/device_info.hpp"
#include "vm/program.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>

namespace zkshard {
namespace testing_support {

struct FakeRange {
    uint64_t start = 0;
    uint64_t end = 0;
    uint32_t segments = 1;

    Bytes encode() const {
        ByteWriter w;
        w.write_u64_le(start);
        w.write_u64_le(end);
        w.write_u32_le(segments);
        return w.take();
    }

    static std::optional<FakeRange> decode(const Bytes& bytes) {
        ByteReader r(bytes);
        auto s = r.read_u64_le();
        auto e = r.read_u64_le();
        auto n = r.read_u32_le();
        if (!s || !e || !n || !r.at_end()) {
            return std::nullopt;
        }
        return FakeRange{*s, *e, *n};
    }
};

struct ProveCall {
    DeviceId device = 0;
    uint64_t start = 0;
    uint64_t end = 0;
};

class ScriptedBackend : public ProvingBackend {
public:
    BackendType type() const override { return BackendType::CPU; }
    std::string name() const override { return "scripted"; }

    RangeResult prove_cycle_range(DeviceId device,
                                  const Program&,
                                  const Bytes&,
                                  const std::optional<ExecutionContext>& start,
                                  uint64_t cycle_end,
                                  bool,
                                  const CancelToken& cancel) override {
        const uint64_t start_cycle = start ? start->cycle() : 0;
        int now_in_flight = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now_in_flight > seen && !max_in_flight_.compare_exchange_weak(seen, now_in_flight)) {
        }

        bool fail = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(ProveCall{device, start_cycle, cycle_end});
            if (failing_devices_.count(device)) {
                fail = true;
            }
            auto it = failures_by_start_.find(start_cycle);
            if (it != failures_by_start_.end() && it->second > 0) {
                --it->second;
                fail = true;
            }
        }

        // Sleep in small steps so cancellation is observed promptly
        auto deadline = std::chrono::steady_clock::now() + delay_for(start_cycle);
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel.is_cancelled()) {
                --in_flight_;
                throw BackendError("cancelled");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        --in_flight_;

        if (fail) {
            throw BackendError("scripted failure at cycle " + std::to_string(start_cycle)
                               + " on device " + std::to_string(device));
        }
        RangeResult result;
        result.proof = FakeRange{start_cycle, cycle_end, 1}.encode();
        return result;
    }

    Bytes combine(const Bytes& a, const Bytes& b) override {
        ++combine_calls_;
        if (fail_combine_) {
            throw BackendError("scripted combine failure");
        }
        auto left = FakeRange::decode(a);
        auto right = FakeRange::decode(b);
        if (!left || !right) {
            throw BackendError("malformed fake proof");
        }
        if (left->end != right->start) {
            throw BackendError("non-adjacent ranges");
        }
        if (!tree_ && right->segments != 1) {
            throw BackendError("sequential-only backend got a combined right operand");
        }
        return FakeRange{left->start, right->end, left->segments + right->segments}.encode();
    }

    bool supports_tree_combination() const override { return tree_; }

    // ---- scripting ----

    void fail_device(DeviceId device) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_devices_.insert(device);
    }

    void fail_shard_starting_at(uint64_t start_cycle, uint32_t times) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_by_start_[start_cycle] = times;
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    void set_delay_for(uint64_t start_cycle, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_by_start_[start_cycle] = delay;
    }

    void set_tree_support(bool tree) { tree_ = tree; }
    void set_fail_combine(bool fail) { fail_combine_ = fail; }

    // ---- observations ----

    std::vector<ProveCall> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int max_in_flight() const { return max_in_flight_.load(); }
    int combine_calls() const { return combine_calls_.load(); }

private:
    std::chrono::milliseconds delay_for(uint64_t start_cycle) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = delay_by_start_.find(start_cycle);
        return it != delay_by_start_.end() ? it->second : delay_;
    }

    mutable std::mutex mutex_;
    std::vector<ProveCall> calls_;
    std::set<DeviceId> failing_devices_;
    std::map<uint64_t, uint32_t> failures_by_start_;
    std::map<uint64_t, std::chrono::milliseconds> delay_by_start_;
    std::chrono::milliseconds delay_{0};
    bool tree_ = true;
    bool fail_combine_ = false;
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
    std::atomic<int> combine_calls_{0};
};

/**
 * Program of single-cycle instructions: every cycle is a boundary, so
 * shard boundaries never move.
 */
inline Program single_cycle_program() {
    std::vector<Instruction> instrs;
    instrs.push_back(Instruction{Opcode::LoadImm, 1, 0, 0, 7});
    instrs.push_back(Instruction{Opcode::Add, 2, 2, 1, 0});
    instrs.push_back(Instruction{Opcode::Xor, 3, 2, 1, 0});
    instrs.push_back(Instruction{Opcode::RotL, 4, 3, 0, 13});
    return Program::from_instructions(instrs);
}

inline std::vector<DeviceInfo> test_devices(uint32_t count) {
    std::vector<DeviceInfo> devices;
    for (uint32_t i = 0; i < count; ++i) {
        DeviceInfo d;
        d.id = i;
        d.name = "test-device-" + std::to_string(i);
        d.total_memory_bytes = 24ULL << 30;
        d.free_memory_bytes = 24ULL << 30;
        devices.push_back(d);
    }
    return devices;
}

/**
 * Fixed sharding config: `devices` x `per_device` target shards,
 * lengths in [min_len, max_len], checkpoint every `interval` cycles.
 */
inline ShardingConfig test_sharding(uint32_t devices, uint32_t per_device,
                                    uint64_t min_len, uint64_t max_len, uint64_t interval) {
    ShardingConfig c;
    c.device_count = devices;
    c.shards_per_device = per_device;
    c.min_cycles_per_shard = min_len;
    c.max_cycles_per_shard = max_len;
    c.checkpoint_interval_cycles = interval;
    c.enable_checkpointing = true;
    return c;
}

} // namespace testing_support
} // namespace zkshard
