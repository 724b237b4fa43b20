#pragma once

#include <chrono>
#include <functional>
#include <random>
#include <set>

#include "bulkdl/config.hpp"
#include "bulkdl/item_state.hpp"

namespace bulkdl
{

/**
 * Bounded retry with exponential backoff, a delay cap and random jitter.
 */
class RetryPolicy
{
public:
    RetryPolicy(unsigned retries, BackoffOptions backoff, std::set<long> retryableStatusCodes);

    static RetryPolicy fromConfig(const RunConfig &config);

    // Initial attempt plus retries
    unsigned maxAttempts() const { return retries_ + 1; }
    unsigned retries() const { return retries_; }

    /**
     * 5xx responses and any status explicitly configured as retryable.
     */
    bool isRetryableStatus(long statusCode) const;

    /**
     * Delay before the next attempt, without jitter:
     * initialDelay * multiplier^(failedAttempts - 1), capped at maxDelay.
     *
     * @param failedAttempts Attempts that have failed so far (>= 1)
     */
    std::chrono::milliseconds baseDelay(unsigned failedAttempts) const;

    /**
     * baseDelay() with +/- jitter applied, never above maxDelay.
     */
    std::chrono::milliseconds delay(unsigned failedAttempts, std::mt19937_64 &rng) const;

private:
    unsigned retries_;
    BackoffOptions backoff_;
    std::set<long> retryableStatusCodes_;
};

/**
 * What a single attempt produced, as seen by the retry wrapper.
 */
struct AttemptResult
{
    Outcome outcome;
    bool retryable = false; // Only meaningful when outcome is outcome::Failed
};

// Runs attempt number `attempt` (1-based) and eventually calls `done` once
using AttemptOperation = std::function<void(unsigned attempt, std::function<void(AttemptResult)> done)>;

// Runs `task` after `delay` without blocking other work
using DeferFunction = std::function<void(std::chrono::milliseconds delay, std::function<void()> task)>;

// Receives the final outcome and how many attempts were made
using RetryCompletion = std::function<void(Outcome outcome, unsigned attempts)>;

// Told about each retry before its delay starts
using RetryNotice = std::function<void(unsigned failedAttempt, const TransferError &error,
                                       std::chrono::milliseconds delay)>;

/**
 * Run `operation` under `policy`.
 *
 * The first attempt starts immediately. A retryable failure schedules the
 * next attempt through `defer` after the policy's backoff delay, until
 * maxAttempts() attempts have been made; the last failure is then final.
 * Non-retryable failures and every non-failure outcome finish at once.
 *
 * @param rng Jitter source; must outlive the whole retry sequence
 */
void attempt(AttemptOperation operation,
             const RetryPolicy &policy,
             DeferFunction defer,
             RetryCompletion finished,
             std::mt19937_64 &rng,
             RetryNotice onRetry = {});

} // namespace bulkdl
