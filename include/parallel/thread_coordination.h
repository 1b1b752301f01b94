#pragma once

/**
 * Thread Coordination Utility
 *
 * Coordinates thread counts between OpenMP and TBB to avoid
 * oversubscription. Both share the same cores:
 * - OpenMP: loop-level parallelism (trace block hashing in the CPU backend)
 * - TBB: task parallelism (balanced-tree proof combination)
 *
 * Shard attempt threads are mostly blocked on device work and are not
 * counted here.
 *
 * Thread allocation:
 * - parallel.num_threads from the engine config when non-zero
 * - otherwise physical core count (half the logical threads)
 */

#include "config/engine_config.hpp"
#include <algorithm>
#include <thread>

#ifdef _OPENMP
#include <omp.h>
#endif

#include <tbb/global_control.h>

namespace zkshard::parallel {

/**
 * Get the optimal thread count for parallel execution
 */
inline int get_optimal_thread_count(int configured) {
    if (configured > 0) {
        return configured;
    }

    // Use physical core count (not logical threads)
    unsigned int hw_threads = std::thread::hardware_concurrency();
    return std::max(1, static_cast<int>(hw_threads / 2));
}

/**
 * Initialize thread coordination for all parallel libraries.
 * Call this once at program startup; later calls keep the first limit
 * for TBB.
 */
inline void initialize_thread_coordination(const ParallelSection& parallel) {
    int thread_count = get_optimal_thread_count(parallel.num_threads);

#ifdef _OPENMP
    omp_set_num_threads(thread_count);
#endif

    // TBB: global thread limit, same count as OpenMP
    static tbb::global_control tbb_control(
        tbb::global_control::max_allowed_parallelism,
        static_cast<size_t>(thread_count)
    );
}

/**
 * Get current thread count being used
 */
inline int get_current_thread_count() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return static_cast<int>(tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism));
#endif
}

} // namespace zkshard::parallel
