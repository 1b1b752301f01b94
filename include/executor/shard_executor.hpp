#pragma once

#include "backend/backend.hpp"
#include "common/cancel_token.hpp"
#include "device/device_pool.hpp"
#include "planner/shard_plan.hpp"
#include "vm/program.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace zkshard {

/**
 * Outcome of one shard attempt. Failure is data: the orchestrator decides
 * what to do with it.
 */
struct ShardResult {
    enum class Outcome { Success, Failed };

    uint32_t shard_index = 0;
    DeviceId device = 0;
    uint32_t attempt = 0;
    Bytes partial_proof;
    std::chrono::duration<double> execution_duration{0};
    Outcome outcome = Outcome::Failed;
    std::string failure_reason;

    bool ok() const { return outcome == Outcome::Success; }

    static ShardResult success(uint32_t shard_index, DeviceId device, uint32_t attempt,
                               Bytes proof, std::chrono::duration<double> duration);
    static ShardResult failed(uint32_t shard_index, DeviceId device, uint32_t attempt,
                              const std::string& reason, std::chrono::duration<double> duration);
};

/**
 * ShardExecutor - runs one shard on the device of an acquired slot
 *
 * Restores the shard's checkpoint when it starts past cycle 0, then asks
 * the backend for a proof of [cycle_start, cycle_end). Never throws:
 * backend errors, checkpoint errors and missing checkpoints all come back
 * as a Failed result.
 *
 * Program and input are borrowed; one executor serves every attempt of a
 * request and may be called from several threads at once.
 */
class ShardExecutor {
public:
    ShardExecutor(std::shared_ptr<ProvingBackend> backend, const Program& program, const Bytes& input);

    ShardResult execute(const ProofShard& shard,
                        const ScopedSlot& slot,
                        uint32_t attempt,
                        const CancelToken& cancel) const;

private:
    std::shared_ptr<ProvingBackend> backend_;
    const Program& program_;
    const Bytes& input_;
};

} // namespace zkshard
