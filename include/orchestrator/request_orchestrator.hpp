#pragma once

#include "backend/backend.hpp"
#include "combiner/recursion_combiner.hpp"
#include "common/cancel_token.hpp"
#include "common/errors.hpp"
#include "config/engine_config.hpp"
#include "device/device_pool.hpp"
#include "executor/shard_executor.hpp"
#include "orchestrator/proof_request.hpp"
#include "planner/shard_plan.hpp"
#include "vm/program.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>

namespace zkshard {

enum class RequestState {
    Planning,
    Dispatching,
    AwaitingResults,
    Combining,
    Complete,
    Aborted
};

const char* to_string(RequestState state);

/**
 * RequestOrchestrator - drives one ProofRequest to a FinalProof
 *
 *   Planning -> Dispatching -> AwaitingResults -> Combining -> Complete
 *   any non-terminal state -> Aborted
 *
 * Every shard attempt runs on its own thread and blocks on a device slot,
 * so the pool alone bounds concurrency. Failed attempts are retried on
 * devices the shard has not used yet, up to retry_budget times. Results
 * arrive in any order; the combiner sorts them by shard index.
 *
 * On abort the cancel token is set, every attempt thread is joined (all
 * slots are back in the pool) and one EngineError with the terminal cause
 * is thrown. A request never yields a partial proof.
 *
 * Single use: run() may be called once per instance.
 */
class RequestOrchestrator {
public:
    static constexpr std::chrono::milliseconds POLL_INTERVAL{20};

    RequestOrchestrator(DevicePool& pool,
                        const ShardingConfig& sharding,
                        const OrchestratorOptions& options,
                        std::shared_ptr<ProvingBackend> backend);
    ~RequestOrchestrator();

    RequestOrchestrator(const RequestOrchestrator&) = delete;
    RequestOrchestrator& operator=(const RequestOrchestrator&) = delete;

    FinalProof run(const ProofRequest& request);

    /**
     * Abort the running request with ErrorKind::Cancelled. Thread-safe.
     */
    void cancel();

    RequestState state() const { return state_.load(); }
    std::vector<RequestState> history() const;

    // Every attempt result received so far, in arrival order
    std::vector<ShardResult> attempt_log() const;

    const ShardPlan& plan() const { return plan_; }

private:
    // Posted by attempt threads
    struct AttemptOutcome {
        uint32_t shard_index = 0;
        uint32_t attempt = 0;
        std::optional<ShardResult> result;
        ErrorKind error_kind = ErrorKind::ShardExecutionFailed;
        std::string error;
    };

    void transition(RequestState next);
    [[noreturn]] void abort_request(ErrorKind kind, const std::string& message);

    void launch_attempt(uint32_t shard_index, uint32_t attempt, std::set<DeviceId> avoid);
    void post(AttemptOutcome outcome);
    void join_all();

    // Aborts with DeadlineExceeded when the deadline policy says so
    void check_deadline(const ProofRequest& request, size_t remaining_shards);

    DevicePool& pool_;
    ShardingConfig sharding_;
    OrchestratorOptions options_;
    std::shared_ptr<ProvingBackend> backend_;

    std::atomic<RequestState> state_{RequestState::Planning};
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> started_{false};
    CancelToken token_;

    mutable std::mutex history_mutex_;
    std::vector<RequestState> history_;

    std::optional<Program> program_;
    ShardPlan plan_;
    std::unique_ptr<ShardExecutor> executor_;
    std::vector<std::thread> threads_;

    mutable std::mutex channel_mutex_;
    std::condition_variable channel_cv_;
    std::deque<AttemptOutcome> channel_;
    std::vector<ShardResult> attempt_log_;

    std::vector<std::chrono::duration<double>> success_durations_;
};

} // namespace zkshard
