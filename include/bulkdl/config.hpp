#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "bulkdl/version.hpp"

namespace bulkdl
{

/**
 * Which progress views the renderer should draw. The orchestrator itself
 * only forwards this to the renderer.
 */
enum class ProgressVisibility
{
    Hidden,
    PerItem,
    Aggregate,
    Both
};

const char *toString(ProgressVisibility visibility);

/**
 * Parse "hidden", "item", "aggregate" or "both".
 * @throws ConfigError for any other value
 */
ProgressVisibility parseProgressVisibility(const std::string &value);

/**
 * Split a "Name: value" header line. Surrounding whitespace of the value is
 * dropped.
 * @throws ConfigError if there is no ':' or the name is empty
 */
std::pair<std::string, std::string> parseHeader(const std::string &line);

/**
 * Shape of the delay between retry attempts: bounded exponential growth with
 * random jitter.
 */
struct BackoffOptions
{
    std::chrono::milliseconds initialDelay{500};
    std::chrono::milliseconds maxDelay{30000};
    double multiplier = 2.0;
    double jitter = 0.2; // Fraction of the delay added or removed at random
};

/**
 * Raw, unvalidated run options. Fill in what you need and hand it to
 * RunConfig::create().
 */
struct RunOptions
{
    // Where downloaded files go (empty = current working directory)
    std::filesystem::path directory;

    // Transfer scheduling
    int concurrency = 32; // Values below 1 are coerced to 1
    int retries = 3;      // Retries after the first attempt
    bool resumable = true;

    // Request shaping, applied to every request issued for an item
    std::map<std::string, std::string> headers;
    std::optional<std::string> proxy;
    std::string userAgent = "bulkdl/" BULKDL_VERSION;
    long maxRedirects = 5;
    std::size_t bufferSize = 64 * 1024;

    // Timeouts (zero disables the request and stall timeouts)
    std::chrono::seconds connectTimeout{30};
    std::chrono::seconds requestTimeout{0};
    std::chrono::seconds stallTimeout{60};
    std::optional<std::chrono::seconds> batchTimeout;

    // Retry behaviour
    BackoffOptions backoff;
    std::set<long> retryableStatusCodes{408, 429};

    // Presentation policy consumed by the progress renderer
    ProgressVisibility progressVisibility = ProgressVisibility::Both;
    bool clearOnFinish = false;
};

/**
 * Validated, immutable configuration for one run.
 * Only obtainable through create(), so every instance has passed validation.
 */
class RunConfig
{
public:
    /**
     * Validate options and build the configuration.
     *
     * @param options Raw options
     * @return Configuration with defaults resolved and concurrency coerced
     * @throws ConfigError if any option value is unusable
     */
    static RunConfig create(RunOptions options);

    const std::filesystem::path &directory() const { return options_.directory; }

    // Effective concurrency, always >= 1
    std::size_t concurrency() const { return static_cast<std::size_t>(options_.concurrency); }
    unsigned retries() const { return static_cast<unsigned>(options_.retries); }
    bool resumable() const { return options_.resumable; }

    const std::map<std::string, std::string> &headers() const { return options_.headers; }
    const std::optional<std::string> &proxy() const { return options_.proxy; }
    const std::string &userAgent() const { return options_.userAgent; }
    long maxRedirects() const { return options_.maxRedirects; }
    std::size_t bufferSize() const { return options_.bufferSize; }

    std::chrono::seconds connectTimeout() const { return options_.connectTimeout; }
    std::chrono::seconds requestTimeout() const { return options_.requestTimeout; }
    std::chrono::seconds stallTimeout() const { return options_.stallTimeout; }
    const std::optional<std::chrono::seconds> &batchTimeout() const { return options_.batchTimeout; }

    const BackoffOptions &backoff() const { return options_.backoff; }
    const std::set<long> &retryableStatusCodes() const { return options_.retryableStatusCodes; }

    ProgressVisibility progressVisibility() const { return options_.progressVisibility; }
    bool clearOnFinish() const { return options_.clearOnFinish; }

private:
    explicit RunConfig(RunOptions options) : options_(std::move(options)) {}

    RunOptions options_;
};

} // namespace bulkdl
