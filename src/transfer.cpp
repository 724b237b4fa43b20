#include "bulkdl/transfer.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "bulkdl/checksum.hpp"
#include "bulkdl/log.hpp"
#include "overloaded.hpp"

namespace bulkdl
{

namespace
{

// Human-readable text for the status codes a download commonly meets
const char *httpStatusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 304:
        return "Not Modified";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 408:
        return "Request Timeout";
    case 410:
        return "Gone";
    case 416:
        return "Range Not Satisfiable";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    default:
        return "Unknown Status";
    }
}

AttemptResult failure(ErrorKind kind, std::string message, bool retryable,
                      std::optional<long> httpStatus = std::nullopt)
{
    return AttemptResult{outcome::Failed{TransferError{kind, std::move(message), httpStatus}}, retryable};
}

} // namespace

TransferTask::TransferTask(ItemId id,
                           const DownloadItem &item,
                           const RunConfig &config,
                           const RetryPolicy &policy,
                           HttpTransport &transport,
                           ProgressAggregator &progress,
                           const CancellationToken &cancel)
    : id_(id),
      item_(item),
      config_(config),
      policy_(policy),
      transport_(transport),
      progress_(progress),
      cancel_(cancel),
      destination_(item.destination(config.directory()))
{
}

void TransferTask::setStatus(ItemStatus status)
{
    state_.transition(status);
    progress_.itemStatus(id_, status);
}

void TransferTask::begin(unsigned attempt, std::function<void(AttemptResult)> done)
{
    done_ = std::move(done);
    attempt_ = attempt;
    stopped_.reset();
    offset_ = 0;

    if (cancel_.isCancelled())
    {
        finishAttempt(AttemptResult{outcome::Cancelled{}, false});
        return;
    }

    // 1. Resolve the destination; a bad name never gets better on retry
    if (auto problem = item_.validateFilename())
    {
        finishAttempt(failure(ErrorKind::InvalidPath,
                              fmt::format("Invalid destination for {}: {}", item_.url(), *problem), false));
        return;
    }

    // 2. Resume checkpoint S from the file already on disk
    if (auto error = prepareDestination())
    {
        finishAttempt(AttemptResult{outcome::Failed{*error}, false});
        return;
    }

    // 3. One request carries every configured header, plus the range
    HttpRequest request;
    request.url = item_.url();
    request.headers = config_.headers();
    if (config_.resumable())
    {
        request.rangeStart = offset_;
        setStatus(ItemStatus::Probing);
        if (offset_ > 0)
        {
            log::info("Found partial download of {} ({} bytes), attempting to resume", destination_.string(),
                      offset_);
        }
    }
    else
    {
        setStatus(ItemStatus::Downloading);
    }

    log::debug("Attempt {} for {} (range start: {})", attempt_, item_.url(),
               request.rangeStart ? std::to_string(*request.rangeStart) : std::string("none"));

    try
    {
        transport_.start(request, *this);
    }
    catch (const std::exception &e)
    {
        finishAttempt(failure(ErrorKind::Network, fmt::format("Cannot start request: {}", e.what()), false));
    }
}

std::optional<TransferError> TransferTask::prepareDestination()
{
    std::error_code ec;
    std::filesystem::path directory = destination_.parent_path();
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        return TransferError{ErrorKind::Filesystem,
                             fmt::format("Failed to create directory {}: {}", directory.string(), ec.message()),
                             std::nullopt};
    }

    if (!config_.resumable())
    {
        return std::nullopt;
    }

    auto status = std::filesystem::status(destination_, ec);
    if (ec && status.type() != std::filesystem::file_type::not_found)
    {
        return TransferError{ErrorKind::Filesystem,
                             fmt::format("Cannot inspect {}: {}", destination_.string(), ec.message()),
                             std::nullopt};
    }
    if (status.type() == std::filesystem::file_type::not_found)
    {
        return std::nullopt;
    }
    if (status.type() != std::filesystem::file_type::regular)
    {
        return TransferError{ErrorKind::Filesystem,
                             fmt::format("{} exists and is not a regular file", destination_.string()),
                             std::nullopt};
    }

    auto size = std::filesystem::file_size(destination_, ec);
    if (ec)
    {
        return TransferError{ErrorKind::Filesystem,
                             fmt::format("Cannot read size of {}: {}", destination_.string(), ec.message()),
                             std::nullopt};
    }
    offset_ = static_cast<std::uint64_t>(size);
    return std::nullopt;
}

bool TransferTask::onResponse(long statusCode, std::optional<std::uint64_t> contentLength)
{
    httpStatus_ = statusCode;
    if (cancel_.isCancelled())
    {
        return stop(AttemptResult{outcome::Cancelled{}, false});
    }

    bool ranged = config_.resumable();
    std::optional<std::uint64_t> total;

    if (ranged && statusCode == 416)
    {
        // The range starts at or past the end: the file is already complete
        if (offset_ == 0)
        {
            std::ofstream touch(destination_, std::ios::binary | std::ios::app);
            if (!touch)
            {
                return stopWithError(ErrorKind::Filesystem,
                                     fmt::format("Cannot create {}", destination_.string()), false);
            }
        }
        state_.bytes = offset_;
        state_.total = offset_;
        progress_.itemPositioned(id_, offset_, offset_);
        log::info("{} is already fully downloaded", destination_.string());
        return stop(AttemptResult{outcome::AlreadyComplete{}, false});
    }
    else if (ranged && statusCode == 206)
    {
        // Server honors the range: append after the S bytes on disk
        setStatus(ItemStatus::Resuming);
        if (!openDestination(true))
        {
            return false;
        }
        if (contentLength)
        {
            total = offset_ + *contentLength;
        }
    }
    else if (statusCode >= 200 && statusCode < 300 && statusCode != 206)
    {
        // Full body: never append it after stale bytes
        if (ranged)
        {
            setStatus(ItemStatus::Restarting);
            if (offset_ > 0)
            {
                log::info("Server ignored the range for {}, restarting from the beginning", item_.url());
            }
        }
        offset_ = 0;
        if (!openDestination(false))
        {
            return false;
        }
        total = contentLength;
    }
    else
    {
        std::string message = fmt::format("HTTP error {}: {}", statusCode, httpStatusText(statusCode));
        return stopWithError(ErrorKind::Protocol, std::move(message), policy_.isRetryableStatus(statusCode),
                             statusCode);
    }

    state_.bytes = offset_;
    state_.total = total;
    if (ranged)
    {
        setStatus(ItemStatus::Downloading);
    }
    progress_.itemPositioned(id_, offset_, total);
    return true;
}

bool TransferTask::openDestination(bool append)
{
    if (append)
    {
        // The checkpoint must still describe the file we append to
        std::error_code ec;
        auto size = std::filesystem::file_size(destination_, ec);
        std::uint64_t onDisk = ec ? 0 : static_cast<std::uint64_t>(size);
        if (onDisk != offset_)
        {
            return stopWithError(ErrorKind::Filesystem,
                                 fmt::format("{} changed size during the request ({} -> {} bytes)",
                                             destination_.string(), offset_, onDisk),
                                 false);
        }
    }

    // Append mode continues after the checkpoint; truncate mode starts over
    std::ios::openmode mode = std::ios::binary | (append ? std::ios::app : std::ios::trunc);
    file_.open(destination_, mode);
    if (!file_)
    {
        file_.clear();
        return stopWithError(ErrorKind::Filesystem,
                             fmt::format("Cannot open file for writing: {}", destination_.string()), false);
    }
    return true;
}

bool TransferTask::onBody(const char *data, std::size_t size)
{
    if (cancel_.isCancelled())
    {
        return stop(AttemptResult{outcome::Cancelled{}, false});
    }
    if (!file_.is_open())
    {
        return stopWithError(ErrorKind::Protocol, "Received a body before a usable response", false);
    }

    // Never write past a declared total
    std::size_t writable = size;
    bool overflow = false;
    if (state_.total)
    {
        std::uint64_t room = *state_.total > state_.bytes ? *state_.total - state_.bytes : 0;
        if (size > room)
        {
            writable = static_cast<std::size_t>(room);
            overflow = true;
        }
    }

    if (writable > 0)
    {
        file_.write(data, static_cast<std::streamsize>(writable));
        if (!file_.good())
        {
            return stopWithError(ErrorKind::Filesystem,
                                 fmt::format("Failed to write to {}", destination_.string()), false);
        }
        state_.bytes += writable;
        bytesWritten_ += writable;
        progress_.itemProgress(id_, writable, state_.total);
    }

    if (overflow)
    {
        return stopWithError(ErrorKind::SizeMismatch,
                             fmt::format("Server sent more than the declared {} bytes", *state_.total), false);
    }
    return true;
}

bool TransferTask::onTick()
{
    if (cancel_.isCancelled())
    {
        return stop(AttemptResult{outcome::Cancelled{}, false});
    }
    return true;
}

void TransferTask::onComplete(const TransportResult &result)
{
    auto closeError = closeDestination();

    if (stopped_)
    {
        AttemptResult reason = std::move(*stopped_);
        stopped_.reset();
        finishAttempt(std::move(reason));
        return;
    }
    if (closeError)
    {
        finishAttempt(failure(ErrorKind::Filesystem, std::move(*closeError), false));
        return;
    }

    switch (result.status)
    {
    case TransportResult::Status::Completed:
        // Stream exhaustion ends the transfer; a known total must have been reached
        if (state_.total && state_.bytes != *state_.total)
        {
            finishAttempt(failure(ErrorKind::SizeMismatch,
                                  fmt::format("Received {} of {} declared bytes", state_.bytes, *state_.total),
                                  false));
            return;
        }
        finishAttempt(AttemptResult{outcome::Success{bytesWritten_}, false});
        return;

    case TransportResult::Status::AbortedByHandler:
        finishAttempt(failure(ErrorKind::Network, "Transfer aborted", false));
        return;

    case TransportResult::Status::Failed:
        if (cancel_.isCancelled())
        {
            finishAttempt(AttemptResult{outcome::Cancelled{}, false});
            return;
        }
        finishAttempt(failure(ErrorKind::Network, result.message, result.retryable));
        return;
    }
}

std::optional<std::string> TransferTask::closeDestination()
{
    if (!file_.is_open())
    {
        return std::nullopt;
    }

    file_.close();
    bool failed = file_.fail();
    file_.clear();
    if (failed)
    {
        return fmt::format("Failed to flush {}", destination_.string());
    }
    return std::nullopt;
}

bool TransferTask::stop(AttemptResult result)
{
    if (!stopped_)
    {
        stopped_ = std::move(result);
    }
    return false;
}

bool TransferTask::stopWithError(ErrorKind kind, std::string message, bool retryable,
                                 std::optional<long> httpStatus)
{
    return stop(failure(kind, std::move(message), retryable, httpStatus));
}

void TransferTask::finishAttempt(AttemptResult result)
{
    const auto *failed = std::get_if<outcome::Failed>(&result.outcome);
    if (failed != nullptr)
    {
        state_.lastError = failed->error;
        // Free the active status while the item waits for its next attempt
        if (result.retryable && isActive(state_.status))
        {
            setStatus(ItemStatus::NotStarted);
        }
    }

    auto done = std::move(done_);
    done_ = nullptr;
    if (!done)
    {
        throw std::logic_error("Attempt finished twice");
    }
    done(std::move(result));
}

std::optional<TransferError> TransferTask::verifyChecksum() const
{
    const auto &expected = *item_.checksum();
    try
    {
        if (!ChecksumVerifier::verify(destination_, expected))
        {
            return TransferError{ErrorKind::ChecksumMismatch,
                                 fmt::format("Checksum mismatch for {}: expected {}", destination_.string(),
                                             expected.toString()),
                                 std::nullopt};
        }
    }
    catch (const std::exception &e)
    {
        return TransferError{ErrorKind::Filesystem, e.what(), std::nullopt};
    }
    return std::nullopt;
}

Outcome TransferTask::finalize(Outcome outcome)
{
    bool completed = std::holds_alternative<outcome::Success>(outcome) ||
                     std::holds_alternative<outcome::AlreadyComplete>(outcome);
    if (completed && item_.checksum())
    {
        if (auto error = verifyChecksum())
        {
            outcome = outcome::Failed{std::move(*error)};
        }
    }

    std::visit(detail::overloaded{
                   [&](const outcome::Success &success) {
                       log::info("Downloaded {} ({} bytes written)", destination_.string(), success.bytesWritten);
                   },
                   [&](const outcome::AlreadyComplete &) {},
                   [&](const outcome::Failed &failed) {
                       state_.lastError = failed.error;
                       log::error("Download of {} failed after {} attempt(s): {}", item_.url(), attempt_,
                                  failed.error.message);
                   },
                   [&](const outcome::Cancelled &) { log::info("Download of {} cancelled", item_.url()); },
               },
               outcome);

    state_.transition(statusOf(outcome));
    progress_.itemFinished(id_, state_.status);
    return outcome;
}

ItemState TransferTask::takeState()
{
    if (!isTerminal(state_.status))
    {
        throw std::logic_error(fmt::format("Item {} is still {}", id_, toString(state_.status)));
    }
    return std::move(state_);
}

} // namespace bulkdl
