#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

#include "bulkdl/cancellation.hpp"
#include "bulkdl/config.hpp"
#include "bulkdl/download_item.hpp"
#include "bulkdl/http_transport.hpp"
#include "bulkdl/item_state.hpp"
#include "bulkdl/progress.hpp"
#include "bulkdl/retry.hpp"

namespace bulkdl
{

/**
 * Performs the resumable download of one item, one attempt at a time.
 *
 * Each attempt takes the size S of any existing destination file as the
 * resume checkpoint, requests bytes [S, end) with the configured headers, and
 * interprets the response:
 *   206 -> append the body after the S bytes already on disk
 *   200 -> the range was ignored: truncate and write the full body
 *   416 -> the file is already complete, nothing is written
 * Other 4xx statuses fail the item; 5xx and configured statuses are
 * retryable. With resume disabled the file is always rewritten from zero.
 *
 * The task stays at a stable address for the whole run; the transport calls
 * back into it while an attempt is in flight.
 */
class TransferTask : public ResponseHandler
{
public:
    TransferTask(ItemId id,
                 const DownloadItem &item,
                 const RunConfig &config,
                 const RetryPolicy &policy,
                 HttpTransport &transport,
                 ProgressAggregator &progress,
                 const CancellationToken &cancel);

    TransferTask(const TransferTask &) = delete;
    TransferTask &operator=(const TransferTask &) = delete;

    /**
     * Start attempt number `attempt`; `done` is called exactly once when it
     * is over, possibly before begin() returns.
     */
    void begin(unsigned attempt, std::function<void(AttemptResult)> done);

    /**
     * Turn the retry sequence's final outcome into the item's terminal
     * status. Verifies the expected checksum of completed files, which may
     * turn a success into a failure.
     */
    Outcome finalize(Outcome outcome);

    /**
     * Hand over the item state once it is terminal.
     */
    ItemState takeState();

    const ItemState &state() const { return state_; }
    const std::filesystem::path &destination() const { return destination_; }
    std::uint64_t bytesWritten() const { return bytesWritten_; }
    std::optional<long> httpStatus() const { return httpStatus_; }

    // ResponseHandler
    bool onResponse(long statusCode, std::optional<std::uint64_t> contentLength) override;
    bool onBody(const char *data, std::size_t size) override;
    bool onTick() override;
    void onComplete(const TransportResult &result) override;

private:
    void setStatus(ItemStatus status);
    void finishAttempt(AttemptResult result);

    // Remember why the attempt stops; the transport reports the abort later
    bool stop(AttemptResult result);
    bool stopWithError(ErrorKind kind, std::string message, bool retryable,
                       std::optional<long> httpStatus = std::nullopt);

    bool openDestination(bool append);
    std::optional<std::string> closeDestination();
    std::optional<TransferError> prepareDestination();
    std::optional<TransferError> verifyChecksum() const;

    ItemId id_;
    const DownloadItem &item_;
    const RunConfig &config_;
    const RetryPolicy &policy_;
    HttpTransport &transport_;
    ProgressAggregator &progress_;
    const CancellationToken &cancel_;

    std::filesystem::path destination_;
    ItemState state_;
    std::function<void(AttemptResult)> done_;
    unsigned attempt_ = 0;

    // Current attempt
    std::ofstream file_;
    std::uint64_t offset_ = 0; // Resume checkpoint S
    std::optional<AttemptResult> stopped_;

    std::uint64_t bytesWritten_ = 0;
    std::optional<long> httpStatus_;
};

} // namespace bulkdl
