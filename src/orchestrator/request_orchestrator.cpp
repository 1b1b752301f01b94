#include "orchestrator/request_orchestrator.hpp"
#include "checkpoint/checkpoint_manager.hpp"
#include "common/debug_control.hpp"
#include "planner/shard_planner.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace zkshard {

const char* to_string(RequestState state) {
    switch (state) {
        case RequestState::Planning:        return "Planning";
        case RequestState::Dispatching:     return "Dispatching";
        case RequestState::AwaitingResults: return "AwaitingResults";
        case RequestState::Combining:       return "Combining";
        case RequestState::Complete:        return "Complete";
        case RequestState::Aborted:         return "Aborted";
    }
    return "Unknown";
}

RequestOrchestrator::RequestOrchestrator(DevicePool& pool,
                                         const ShardingConfig& sharding,
                                         const OrchestratorOptions& options,
                                         std::shared_ptr<ProvingBackend> backend)
    : pool_(pool),
      sharding_(sharding),
      options_(options),
      backend_(std::move(backend)) {
    history_.push_back(RequestState::Planning);
}

RequestOrchestrator::~RequestOrchestrator() {
    token_.cancel();
    join_all();
}

void RequestOrchestrator::transition(RequestState next) {
    state_.store(next);
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(next);
}

std::vector<RequestState> RequestOrchestrator::history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_;
}

std::vector<ShardResult> RequestOrchestrator::attempt_log() const {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    return attempt_log_;
}

void RequestOrchestrator::cancel() {
    cancel_requested_.store(true);
    token_.cancel();
    channel_cv_.notify_all();
}

void RequestOrchestrator::abort_request(ErrorKind kind, const std::string& message) {
    transition(RequestState::Aborted);
    token_.cancel();
    join_all();

    std::cerr << "[orchestrator] request aborted (" << to_string(kind) << "): " << message << std::endl;
    if (kind == ErrorKind::CombineError) {
        throw CombineError(message);
    }
    throw EngineError(kind, message);
}

void RequestOrchestrator::join_all() {
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
}

void RequestOrchestrator::post(AttemptOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        if (outcome.result) {
            attempt_log_.push_back(*outcome.result);
        }
        channel_.push_back(std::move(outcome));
    }
    channel_cv_.notify_all();
}

void RequestOrchestrator::launch_attempt(uint32_t shard_index, uint32_t attempt, std::set<DeviceId> avoid) {
    const ProofShard& shard = plan_.shards[shard_index];
    threads_.emplace_back([this, &shard, shard_index, attempt, avoid = std::move(avoid)]() {
        AttemptOutcome outcome;
        outcome.shard_index = shard_index;
        outcome.attempt = attempt;
        try {
            ScopedSlot slot = pool_.acquire_slot(std::nullopt, options_.slot_wait_timeout, &token_, avoid);
            ShardResult result = executor_->execute(shard, slot, attempt, token_);
            // Slot goes back before the orchestrator sees the result
            slot.release();
            outcome.result = std::move(result);
        } catch (const EngineError& e) {
            outcome.error_kind = e.kind();
            outcome.error = e.what();
        } catch (const std::exception& e) {
            outcome.error_kind = ErrorKind::ShardExecutionFailed;
            outcome.error = e.what();
        }
        post(std::move(outcome));
    });
}

void RequestOrchestrator::check_deadline(const ProofRequest& request, size_t remaining_shards) {
    if (!request.deadline || options_.deadline_policy == DeadlinePolicy::Ignore) {
        return;
    }
    const auto now = ProofRequest::Clock::now();
    if (now >= *request.deadline) {
        abort_request(ErrorKind::DeadlineExceeded, "deadline passed with " + std::to_string(remaining_shards)
            + " shard(s) outstanding");
    }
    if (options_.deadline_policy != DeadlinePolicy::AbortWhenProjected || success_durations_.empty()) {
        return;
    }

    // Remaining shards run in waves of at most total_slots
    const auto total = std::accumulate(success_durations_.begin(), success_durations_.end(),
                                       std::chrono::duration<double>(0));
    const auto mean = total / static_cast<double>(success_durations_.size());
    const size_t slots = std::max<size_t>(1, pool_.total_slots());
    const size_t waves = (remaining_shards + slots - 1) / slots;
    const auto projected = now + std::chrono::duration_cast<ProofRequest::Clock::duration>(
        mean * static_cast<double>(waves));
    if (projected > *request.deadline) {
        auto late_ms = std::chrono::duration<double, std::milli>(projected - *request.deadline).count();
        abort_request(ErrorKind::DeadlineExceeded, "projected completion misses the deadline by "
            + std::to_string(static_cast<long long>(late_ms)) + " ms");
    }
}

FinalProof RequestOrchestrator::run(const ProofRequest& request) {
    if (started_.exchange(true)) {
        throw std::logic_error("RequestOrchestrator::run called twice");
    }
    const auto t0 = std::chrono::steady_clock::now();

    // ---- Planning ----
    if (pool_.empty()) {
        abort_request(ErrorKind::DeviceUnavailable, "no devices available");
    }
    if (request.estimated_total_cycles == 0) {
        abort_request(ErrorKind::InvalidRequest, "estimated_total_cycles must be > 0");
    }
    try {
        program_.emplace(Program::from_binary(request.program_binary));
    } catch (const std::invalid_argument& e) {
        abort_request(ErrorKind::InvalidRequest, std::string("invalid program: ") + e.what());
    }
    try {
        ShardPlanner planner(sharding_);
        CheckpointManager checkpoints(*program_, request.input_bytes, sharding_.checkpoint_interval_cycles);
        plan_ = planner.plan_with_checkpoints(request.estimated_total_cycles, checkpoints);
    } catch (const EngineError& e) {
        abort_request(e.kind(), e.what());
    }
    if (cancel_requested_.load()) {
        abort_request(ErrorKind::Cancelled, "request cancelled");
    }
    check_deadline(request, plan_.size());

    // ---- Dispatching ----
    transition(RequestState::Dispatching);
    executor_ = std::make_unique<ShardExecutor>(backend_, *program_, request.input_bytes);
    for (const auto& shard : plan_.shards) {
        launch_attempt(shard.shard_index, 0, {});
    }

    // ---- AwaitingResults ----
    transition(RequestState::AwaitingResults);
    const size_t n = plan_.size();
    std::vector<std::optional<ShardResult>> successes(n);
    std::vector<uint32_t> attempts_made(n, 1);
    std::vector<std::set<DeviceId>> tried(n);
    size_t remaining = n;

    while (remaining > 0) {
        std::deque<AttemptOutcome> batch;
        {
            std::unique_lock<std::mutex> lock(channel_mutex_);
            channel_cv_.wait_for(lock, POLL_INTERVAL, [this]() {
                return !channel_.empty() || cancel_requested_.load();
            });
            batch.swap(channel_);
        }
        if (cancel_requested_.load()) {
            abort_request(ErrorKind::Cancelled, "request cancelled");
        }

        for (auto& outcome : batch) {
            const uint32_t idx = outcome.shard_index;
            if (!outcome.result) {
                // The attempt never ran (slot wait timed out or stopped)
                abort_request(outcome.error_kind, "shard " + std::to_string(idx) + ": " + outcome.error);
            }

            ShardResult& result = *outcome.result;
            if (result.ok()) {
                if (!successes[idx]) {
                    success_durations_.push_back(result.execution_duration);
                    successes[idx] = std::move(result);
                    --remaining;
                }
                continue;
            }

            tried[idx].insert(result.device);
            std::cerr << "[orchestrator] shard " << idx << " failed on device " << result.device
                      << " (attempt " << (result.attempt + 1) << "/" << (options_.retry_budget + 1)
                      << "): " << result.failure_reason << std::endl;
            if (attempts_made[idx] > options_.retry_budget) {
                abort_request(ErrorKind::ShardExecutionFailed, "shard " + std::to_string(idx) + " failed after "
                    + std::to_string(attempts_made[idx]) + " attempt(s): " + result.failure_reason);
            }
            launch_attempt(idx, attempts_made[idx]++, tried[idx]);
        }

        if (remaining > 0) {
            check_deadline(request, remaining);
        }
    }
    join_all();

    // ---- Combining ----
    transition(RequestState::Combining);
    std::vector<ShardResult> results;
    results.reserve(n);
    for (auto& s : successes) {
        results.push_back(std::move(*s));
    }

    FinalProof final_proof;
    try {
        RecursionCombiner combiner(backend_, options_.combine_strategy);
        final_proof = combiner.combine(plan_, std::move(results));
    } catch (const CombineError& e) {
        abort_request(ErrorKind::CombineError, e.what());
    }

    transition(RequestState::Complete);
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    std::cout << "[orchestrator] request complete: " << n << " shard(s), "
              << request.estimated_total_cycles << " cycles in " << elapsed << " ms" << std::endl;
    return final_proof;
}

} // namespace zkshard
