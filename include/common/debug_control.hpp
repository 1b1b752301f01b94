#pragma once

#include <atomic>
#include <iostream>

namespace zkshard {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Both flags default to off and are set once at startup from the
 * `logging` section of EngineConfig:
 * - profile: timing measurements (plan, shard, combine durations)
 * - debug:   detailed state dumps (shard boundaries, slot traffic)
 */

inline std::atomic<bool>& profile_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline std::atomic<bool>& debug_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void set_profile_enabled(bool enabled) { profile_flag().store(enabled); }
inline void set_debug_enabled(bool enabled) { debug_flag().store(enabled); }

inline bool is_profile_enabled() { return profile_flag().load(std::memory_order_relaxed); }
inline bool is_debug_enabled() { return debug_flag().load(std::memory_order_relaxed); }

} // namespace debug
} // namespace zkshard

// Profile printing (timing measurements)
#define ZKSHARD_PROFILE_COUT(expr) \
    do { \
        if (zkshard::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Debug printing (detailed state dumps)
#define ZKSHARD_DEBUG_COUT(expr) \
    do { \
        if (zkshard::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)
