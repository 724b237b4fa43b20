#pragma once

#include <atomic>

namespace bulkdl
{

/**
 * External stop signal for a run. May be triggered from any thread,
 * including a signal handler (it only stores to a lock-free atomic).
 */
class CancellationToken
{
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace bulkdl
