#pragma once

#include <memory>
#include <random>
#include <vector>

#include "bulkdl/cancellation.hpp"
#include "bulkdl/config.hpp"
#include "bulkdl/download_item.hpp"
#include "bulkdl/http_transport.hpp"
#include "bulkdl/progress.hpp"
#include "bulkdl/result_collector.hpp"
#include "bulkdl/retry.hpp"

namespace bulkdl
{

/**
 * Downloads a batch of items with bounded concurrency.
 *
 * Items are dispatched in input order while fewer than concurrency() of them
 * are in progress; an item keeps its slot until it is terminal, including
 * while it waits for a retry. All transfers are multiplexed over one
 * HttpTransport driven from the thread calling run().
 */
class Downloader
{
public:
    /**
     * Downloader over libcurl.
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit Downloader(RunConfig config);

    /**
     * Downloader over a caller-provided transport.
     */
    Downloader(RunConfig config, std::shared_ptr<HttpTransport> transport);

    /**
     * Download every item.
     *
     * Individual item failures never make this fail: each one ends up in its
     * OutcomeRecord. Once `cancel` (or the configured batch timeout) fires, no
     * new items are dispatched and in-flight ones stop as Cancelled.
     *
     * @param items Items to fetch, read-only for the whole run
     * @param observer Receives progress events; may be null
     * @param cancel External cancellation signal; may be null
     * @return One record per item, in input order
     * @throws ConfigError if the destination directory cannot be created or
     *         is not a writable directory
     */
    std::vector<OutcomeRecord> run(const std::vector<DownloadItem> &items,
                                   ProgressObserver *observer = nullptr,
                                   const CancellationToken *cancel = nullptr);

    const RunConfig &config() const { return config_; }

private:
    void prepareDirectory() const;

    RunConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    RetryPolicy policy_;
    std::mt19937_64 rng_;
};

} // namespace bulkdl
