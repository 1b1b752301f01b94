#pragma once

#include <atomic>

namespace zkshard {

/**
 * Shared cancellation flag for one proof request.
 *
 * Long-running calls (slot waits, backend proving) poll it and stop early
 * once it is set.
 */
class CancelToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace zkshard
