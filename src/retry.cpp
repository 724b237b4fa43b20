#include "bulkdl/retry.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>
#include <variant>

namespace bulkdl
{

RetryPolicy::RetryPolicy(unsigned retries, BackoffOptions backoff, std::set<long> retryableStatusCodes)
    : retries_(retries), backoff_(backoff), retryableStatusCodes_(std::move(retryableStatusCodes))
{
}

RetryPolicy RetryPolicy::fromConfig(const RunConfig &config)
{
    return RetryPolicy(config.retries(), config.backoff(), config.retryableStatusCodes());
}

bool RetryPolicy::isRetryableStatus(long statusCode) const
{
    if (statusCode >= 500 && statusCode < 600)
    {
        return true;
    }
    return retryableStatusCodes_.count(statusCode) > 0;
}

std::chrono::milliseconds RetryPolicy::baseDelay(unsigned failedAttempts) const
{
    unsigned exponent = failedAttempts > 0 ? failedAttempts - 1 : 0;
    double initial = static_cast<double>(backoff_.initialDelay.count());
    double cap = static_cast<double>(backoff_.maxDelay.count());

    // pow may reach infinity for large exponents; min() takes care of it
    double value = std::min(cap, initial * std::pow(backoff_.multiplier, static_cast<double>(exponent)));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
}

std::chrono::milliseconds RetryPolicy::delay(unsigned failedAttempts, std::mt19937_64 &rng) const
{
    double base = static_cast<double>(baseDelay(failedAttempts).count());
    double jittered = base;
    if (backoff_.jitter > 0.0)
    {
        std::uniform_real_distribution<double> dis(-backoff_.jitter, backoff_.jitter);
        jittered = base * (1.0 + dis(rng));
    }

    double cap = static_cast<double>(backoff_.maxDelay.count());
    jittered = std::clamp(jittered, 0.0, cap);
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(jittered));
}

namespace
{

// State of one retry sequence, kept alive by the callbacks that reference it
struct RetrySequence : std::enable_shared_from_this<RetrySequence>
{
    RetrySequence(AttemptOperation operation, const RetryPolicy &policy, DeferFunction defer,
                  RetryCompletion finished, std::mt19937_64 &rng, RetryNotice onRetry)
        : operation(std::move(operation)),
          policy(policy),
          defer(std::move(defer)),
          finished(std::move(finished)),
          rng(rng),
          onRetry(std::move(onRetry))
    {
    }

    void next()
    {
        ++attempts;
        auto self = shared_from_this();
        operation(attempts, [self](AttemptResult result) { self->handle(std::move(result)); });
    }

    void handle(AttemptResult result)
    {
        const auto *failed = std::get_if<outcome::Failed>(&result.outcome);
        if (failed != nullptr && result.retryable && attempts < policy.maxAttempts())
        {
            auto wait = policy.delay(attempts, rng);
            if (onRetry)
            {
                onRetry(attempts, failed->error, wait);
            }
            auto self = shared_from_this();
            defer(wait, [self]() { self->next(); });
            return;
        }
        finished(std::move(result.outcome), attempts);
    }

    AttemptOperation operation;
    RetryPolicy policy;
    DeferFunction defer;
    RetryCompletion finished;
    std::mt19937_64 &rng;
    RetryNotice onRetry;
    unsigned attempts = 0;
};

} // namespace

void attempt(AttemptOperation operation,
             const RetryPolicy &policy,
             DeferFunction defer,
             RetryCompletion finished,
             std::mt19937_64 &rng,
             RetryNotice onRetry)
{
    auto sequence = std::make_shared<RetrySequence>(std::move(operation), policy, std::move(defer),
                                                    std::move(finished), rng, std::move(onRetry));
    sequence->next();
}

} // namespace bulkdl
