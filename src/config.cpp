#include "bulkdl/config.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/core.h>

#include "bulkdl/errors.hpp"

namespace bulkdl
{

namespace
{

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

// RFC 7230 token characters
bool isTokenChar(char ch)
{
    if (std::isalnum(static_cast<unsigned char>(ch)))
    {
        return true;
    }
    static const std::string extra = "!#$%&'*+-.^_`|~";
    return extra.find(ch) != std::string::npos;
}

void validateHeaders(const std::map<std::string, std::string> &headers)
{
    for (const auto &[name, value] : headers)
    {
        if (name.empty() || !std::all_of(name.begin(), name.end(), isTokenChar))
        {
            throw ConfigError(fmt::format("Invalid header name: '{}'", name));
        }
        if (value.find_first_of("\r\n") != std::string::npos)
        {
            throw ConfigError(fmt::format("Header '{}' contains a line break", name));
        }
        // The Range header is computed per attempt from the resume checkpoint
        if (toLower(name) == "range")
        {
            throw ConfigError("The Range header is managed by the downloader and cannot be set");
        }
    }
}

void validateBackoff(const BackoffOptions &backoff)
{
    if (backoff.initialDelay.count() <= 0)
    {
        throw ConfigError("Initial retry delay must be positive");
    }
    if (backoff.maxDelay < backoff.initialDelay)
    {
        throw ConfigError(fmt::format("Maximum retry delay ({} ms) is below the initial delay ({} ms)",
                                      backoff.maxDelay.count(), backoff.initialDelay.count()));
    }
    if (backoff.multiplier < 1.0)
    {
        throw ConfigError(fmt::format("Retry delay multiplier must be >= 1.0, got {}", backoff.multiplier));
    }
    if (backoff.jitter < 0.0 || backoff.jitter > 1.0)
    {
        throw ConfigError(fmt::format("Retry jitter must be within [0, 1], got {}", backoff.jitter));
    }
}

} // namespace

const char *toString(ProgressVisibility visibility)
{
    switch (visibility)
    {
    case ProgressVisibility::Hidden:
        return "hidden";
    case ProgressVisibility::PerItem:
        return "item";
    case ProgressVisibility::Aggregate:
        return "aggregate";
    case ProgressVisibility::Both:
        return "both";
    }
    return "unknown";
}

ProgressVisibility parseProgressVisibility(const std::string &value)
{
    std::string lowered = toLower(value);
    if (lowered == "hidden")
    {
        return ProgressVisibility::Hidden;
    }
    if (lowered == "item")
    {
        return ProgressVisibility::PerItem;
    }
    if (lowered == "aggregate")
    {
        return ProgressVisibility::Aggregate;
    }
    if (lowered == "both")
    {
        return ProgressVisibility::Both;
    }
    throw ConfigError(fmt::format("Unknown progress visibility '{}'", value));
}

std::pair<std::string, std::string> parseHeader(const std::string &line)
{
    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0)
    {
        throw ConfigError(fmt::format("Header '{}' is not of the form 'Name: value'", line));
    }

    std::string name = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    auto first = value.find_first_not_of(" \t");
    auto last = value.find_last_not_of(" \t");
    value = first == std::string::npos ? std::string() : value.substr(first, last - first + 1);
    return {name, value};
}

RunConfig RunConfig::create(RunOptions options)
{
    // 1. Destination directory (usability is checked when the run starts)
    if (options.directory.empty())
    {
        std::error_code ec;
        options.directory = std::filesystem::current_path(ec);
        if (ec)
        {
            throw ConfigError(fmt::format("Cannot determine current directory: {}", ec.message()));
        }
    }

    // 2. Scheduling: zero or negative concurrency means "one at a time"
    options.concurrency = std::max(1, options.concurrency);
    if (options.retries < 0 || options.retries > 100)
    {
        throw ConfigError(fmt::format("Retry count must be within [0, 100], got {}", options.retries));
    }

    // 3. Request shaping
    validateHeaders(options.headers);
    if (options.proxy)
    {
        if (options.proxy->empty() || options.proxy->find("://") == std::string::npos)
        {
            throw ConfigError(fmt::format("Proxy '{}' must include a scheme (e.g. http://host:port)",
                                          *options.proxy));
        }
    }
    if (options.maxRedirects < 0)
    {
        throw ConfigError("Maximum redirect count cannot be negative");
    }
    if (options.bufferSize < 1024 || options.bufferSize > 2 * 1024 * 1024)
    {
        throw ConfigError(fmt::format("Buffer size must be within [1 KiB, 2 MiB], got {}", options.bufferSize));
    }

    // 4. Timeouts
    if (options.connectTimeout.count() <= 0)
    {
        throw ConfigError("Connect timeout must be positive");
    }
    if (options.requestTimeout.count() < 0 || options.stallTimeout.count() < 0)
    {
        throw ConfigError("Request and stall timeouts cannot be negative");
    }
    if (options.batchTimeout && options.batchTimeout->count() <= 0)
    {
        throw ConfigError("Batch timeout must be positive when set");
    }

    // 5. Retry behaviour
    validateBackoff(options.backoff);
    for (long code : options.retryableStatusCodes)
    {
        if (code < 100 || code > 599)
        {
            throw ConfigError(fmt::format("Retryable status code {} is not an HTTP status", code));
        }
    }

    return RunConfig(std::move(options));
}

} // namespace bulkdl
