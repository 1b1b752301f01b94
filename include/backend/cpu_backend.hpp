#pragma once

#include "backend/backend.hpp"
#include "backend/range_proof.hpp"
#include "types/digest.hpp"
#include <atomic>
#include <vector>

namespace zkshard {

/**
 * CPU backend implementation (reference).
 *
 * Proves a range by executing it cycle by cycle and committing to the
 * trace rows: rows are buffered in windows, each window is cut into
 * blocks hashed in parallel with OpenMP, and block digests are folded into
 * the running commitment in order. Holds no per-call state, so concurrent
 * calls are safe.
 *
 * The OpenMP team size is passed on every parallel region: proving runs on
 * shard attempt threads, which do not inherit omp_set_num_threads() from
 * the thread that configured the process.
 */
class CpuBackend : public ProvingBackend {
public:
    static constexpr size_t BLOCK_ROWS = 4096;
    static constexpr size_t WINDOW_ROWS = 256 * BLOCK_ROWS;
    static constexpr uint64_t CANCEL_CHECK_CYCLES = 65536;

    // num_threads 0 = physical core count
    explicit CpuBackend(int num_threads = 0);
    ~CpuBackend() override = default;

    BackendType type() const override { return BackendType::CPU; }
    std::string name() const override { return "CPU"; }

    RangeResult prove_cycle_range(
        DeviceId device,
        const Program& program,
        const Bytes& input,
        const std::optional<ExecutionContext>& start,
        uint64_t cycle_end,
        bool capture_end,
        const CancelToken& cancel
    ) override;

    /**
     * Requires a.end_cycle == b.start_cycle, a.end_state == b.start_state
     * and the same program; throws BackendError otherwise.
     */
    Bytes combine(const Bytes& a, const Bytes& b) override;

    bool supports_tree_combination() const override { return true; }

    /**
     * Fold one window of trace rows into `commitment`.
     * Block boundaries are relative to the window start.
     */
    static Digest commit_window(const Digest& commitment, const std::vector<uint64_t>& rows,
                                int num_threads = 1, int* team_size = nullptr);

    int num_threads() const { return num_threads_; }

    // Largest OpenMP team any proving call ran with
    int peak_team_size() const { return peak_team_size_.load(); }

private:
    void note_team_size(int team);

    int num_threads_;
    std::atomic<int> peak_team_size_{0};
};

} // namespace zkshard
