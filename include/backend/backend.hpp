#pragma once

#include <memory>
#include <optional>
#include <string>
#include "checkpoint/checkpoint_manager.hpp"
#include "common/byte_io.hpp"
#include "common/cancel_token.hpp"
#include "device/device_info.hpp"
#include "vm/program.hpp"

namespace zkshard {

/**
 * Backend type enumeration
 */
enum class BackendType {
    CPU     // Reference implementation (executes and commits to the trace)
};

/**
 * Output of one prove_cycle_range call.
 */
struct RangeResult {
    Bytes proof;
    // Present when requested and the range ended on an instruction boundary
    std::optional<CheckpointState> end_checkpoint;
};

/**
 * Abstract proving backend.
 *
 * The engine treats "prove a cycle range" and "combine two adjacent
 * proofs" as opaque primitives. Implementations must be safe to call from
 * several threads at once (one call per acquired device slot) and report
 * failures by throwing BackendError.
 */
class ProvingBackend {
public:
    virtual ~ProvingBackend() = default;

    /**
     * Get the backend type
     */
    virtual BackendType type() const = 0;

    /**
     * Get backend name for logging
     */
    virtual std::string name() const = 0;

    // =========================================================================
    // Proving
    // =========================================================================

    /**
     * Prove execution of [start cycle, cycle_end) on one device.
     * @param device     Device the caller holds a slot on
     * @param program    Program being proved
     * @param input      Program input
     * @param start      Resume point; nullopt means cycle 0
     * @param cycle_end  Exclusive end cycle
     * @param capture_end  Also return a checkpoint at cycle_end
     * @param cancel     Polled during long runs
     */
    virtual RangeResult prove_cycle_range(
        DeviceId device,
        const Program& program,
        const Bytes& input,
        const std::optional<ExecutionContext>& start,
        uint64_t cycle_end,
        bool capture_end,
        const CancelToken& cancel
    ) = 0;

    // =========================================================================
    // Recursion
    // =========================================================================

    /**
     * Combine two proofs of adjacent ranges, `a` immediately before `b`.
     */
    virtual Bytes combine(const Bytes& a, const Bytes& b) = 0;

    /**
     * True when combine() also accepts already combined proofs, so a
     * balanced tree of adjacent pairs is valid.
     */
    virtual bool supports_tree_combination() const = 0;

    // =========================================================================
    // Factory
    // =========================================================================

    /**
     * Create a backend instance; num_threads bounds its CPU parallelism
     * (0 = physical core count)
     */
    static std::unique_ptr<ProvingBackend> create(BackendType type, int num_threads = 0);
};

} // namespace zkshard
