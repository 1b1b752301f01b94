#include "engine/sharding_engine.hpp"
#include "orchestrator/request_orchestrator.hpp"
#include "planner/shard_planner.hpp"
#include <chrono>
#include <iostream>
#include <utility>

namespace zkshard {

ShardingEngine::ShardingEngine(const EngineConfig& config,
                               std::vector<DeviceInfo> devices,
                               std::shared_ptr<ProvingBackend> backend)
    : config_(config),
      sharding_(resolve_sharding_config(config, devices)),
      pool_(std::move(devices), sharding_.shards_per_device),
      backend_(std::move(backend)),
      metrics_(pool_.enumerate_devices(), sharding_.shards_per_device) {
    std::cout << "[engine] backend " << backend_->name() << ", profile "
              << to_string(config_.devices.profile) << std::endl;
    sharding_.print();
}

std::unique_ptr<ShardingEngine> ShardingEngine::from_config(const EngineConfig& config) {
    std::shared_ptr<ProvingBackend> backend = ProvingBackend::create(BackendType::CPU, config.parallel.num_threads);
    return std::make_unique<ShardingEngine>(config, discover_devices(config.devices), std::move(backend));
}

FinalProof ShardingEngine::prove(const ProofRequest& request) {
    auto start = std::chrono::steady_clock::now();
    RequestOrchestrator orchestrator(pool_, sharding_, config_.orchestrator, backend_);
    try {
        FinalProof proof = orchestrator.run(request);
        metrics_.record_success(proof, std::chrono::steady_clock::now() - start, orchestrator.attempt_log());
        return proof;
    } catch (const EngineError& e) {
        metrics_.record_failure(e.kind(), orchestrator.attempt_log());
        throw;
    }
}

ShardPlan ShardingEngine::plan(uint64_t total_cycles) const {
    return ShardPlanner(sharding_).plan(total_cycles);
}

} // namespace zkshard
