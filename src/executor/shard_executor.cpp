#include "executor/shard_executor.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <iostream>
#include <utility>

namespace zkshard {

ShardResult ShardResult::success(uint32_t shard_index, DeviceId device, uint32_t attempt,
                                 Bytes proof, std::chrono::duration<double> duration) {
    ShardResult r;
    r.shard_index = shard_index;
    r.device = device;
    r.attempt = attempt;
    r.partial_proof = std::move(proof);
    r.execution_duration = duration;
    r.outcome = Outcome::Success;
    return r;
}

ShardResult ShardResult::failed(uint32_t shard_index, DeviceId device, uint32_t attempt,
                                const std::string& reason, std::chrono::duration<double> duration) {
    ShardResult r;
    r.shard_index = shard_index;
    r.device = device;
    r.attempt = attempt;
    r.execution_duration = duration;
    r.outcome = Outcome::Failed;
    r.failure_reason = reason;
    return r;
}

ShardExecutor::ShardExecutor(std::shared_ptr<ProvingBackend> backend, const Program& program, const Bytes& input)
    : backend_(std::move(backend)), program_(program), input_(input) {}

ShardResult ShardExecutor::execute(const ProofShard& shard,
                                   const ScopedSlot& slot,
                                   uint32_t attempt,
                                   const CancelToken& cancel) const {
    const auto start = std::chrono::steady_clock::now();
    const DeviceId device = slot.device();
    auto elapsed = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    };

    ZKSHARD_DEBUG_COUT("[executor] shard " << shard.shard_index << " attempt " << attempt
        << " on device " << device << " [" << shard.cycle_start << ", " << shard.cycle_end << ")" << std::endl);

    try {
        std::optional<ExecutionContext> context;
        if (shard.cycle_start > 0) {
            if (!shard.checkpoint) {
                return ShardResult::failed(shard.shard_index, device, attempt,
                    "missing checkpoint for start cycle " + std::to_string(shard.cycle_start), elapsed());
            }
            context = CheckpointManager::restore_for(program_, *shard.checkpoint);
            if (context->cycle() != shard.cycle_start) {
                return ShardResult::failed(shard.shard_index, device, attempt,
                    "checkpoint cycle " + std::to_string(context->cycle())
                    + " does not match shard start " + std::to_string(shard.cycle_start), elapsed());
            }
        }

        RangeResult range = backend_->prove_cycle_range(
            device, program_, input_, context, shard.cycle_end, false, cancel);

        auto duration = elapsed();
        ZKSHARD_PROFILE_COUT("[executor] shard " << shard.shard_index << " done on device " << device
            << " in " << duration.count() * 1000.0 << " ms" << std::endl);
        return ShardResult::success(shard.shard_index, device, attempt, std::move(range.proof), duration);
    } catch (const CheckpointError& e) {
        return ShardResult::failed(shard.shard_index, device, attempt, e.what(), elapsed());
    } catch (const BackendError& e) {
        return ShardResult::failed(shard.shard_index, device, attempt, e.what(), elapsed());
    } catch (const std::exception& e) {
        return ShardResult::failed(shard.shard_index, device, attempt,
            std::string("unexpected error: ") + e.what(), elapsed());
    }
}

} // namespace zkshard
