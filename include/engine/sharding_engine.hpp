#pragma once

#include "backend/backend.hpp"
#include "combiner/recursion_combiner.hpp"
#include "config/engine_config.hpp"
#include "device/device_pool.hpp"
#include "engine/engine_metrics.hpp"
#include "orchestrator/proof_request.hpp"
#include "planner/shard_plan.hpp"
#include <memory>
#include <vector>

namespace zkshard {

/**
 * ShardingEngine - entry point for proving on one node
 *
 * Owns the device pool, the pool's resolved ShardingConfig, the
 * orchestrator options and a shared proving backend. Each prove() call
 * runs its own RequestOrchestrator; concurrent requests share nothing but
 * device slots.
 */
class ShardingEngine {
public:
    /**
     * Throws EngineError(DeviceUnavailable) when `devices` is empty and
     * ConfigError when the resolved sharding config is invalid.
     */
    ShardingEngine(const EngineConfig& config,
                   std::vector<DeviceInfo> devices,
                   std::shared_ptr<ProvingBackend> backend);

    /**
     * Discover devices per config and use the reference CPU backend.
     */
    static std::unique_ptr<ShardingEngine> from_config(const EngineConfig& config);

    /**
     * Prove one request. Throws EngineError with the terminal cause.
     * Both outcomes are recorded in metrics().
     */
    FinalProof prove(const ProofRequest& request);

    /**
     * Shard ranges for a request of `total_cycles` (no checkpoints)
     */
    ShardPlan plan(uint64_t total_cycles) const;

    DevicePool& pool() { return pool_; }
    const DevicePool& pool() const { return pool_; }
    const ShardingConfig& sharding() const { return sharding_; }
    const EngineConfig& config() const { return config_; }
    const std::shared_ptr<ProvingBackend>& backend() const { return backend_; }
    const EngineMetrics& metrics() const { return metrics_; }

private:
    EngineConfig config_;
    ShardingConfig sharding_;
    DevicePool pool_;
    std::shared_ptr<ProvingBackend> backend_;
    EngineMetrics metrics_;
};

} // namespace zkshard
