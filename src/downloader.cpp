#include "bulkdl/downloader.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <map>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <unistd.h>

#include <fmt/core.h>

#include "bulkdl/curl_transport.hpp"
#include "bulkdl/errors.hpp"
#include "bulkdl/log.hpp"
#include "bulkdl/transfer.hpp"

namespace bulkdl
{

namespace
{

using Clock = std::chrono::steady_clock;

// Upper bound on one I/O wait, so cancellation and deadlines are noticed
constexpr std::chrono::milliseconds kMaxWait{100};

// Drops whatever the transport still runs when a run unwinds early
class InFlightGuard
{
public:
    explicit InFlightGuard(HttpTransport &transport) : transport_(transport) {}
    ~InFlightGuard()
    {
        if (transport_.inFlight() > 0)
        {
            transport_.abortAll();
        }
    }

    InFlightGuard(const InFlightGuard &) = delete;
    InFlightGuard &operator=(const InFlightGuard &) = delete;

private:
    HttpTransport &transport_;
};

} // namespace

Downloader::Downloader(RunConfig config)
    : config_(std::move(config)),
      transport_(std::make_shared<CurlTransport>(config_)),
      policy_(RetryPolicy::fromConfig(config_)),
      rng_(std::random_device{}())
{
}

Downloader::Downloader(RunConfig config, std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      policy_(RetryPolicy::fromConfig(config_)),
      rng_(std::random_device{}())
{
    if (!transport_)
    {
        throw std::invalid_argument("Downloader requires a transport");
    }
}

void Downloader::prepareDirectory() const
{
    const auto &directory = config_.directory();
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        throw ConfigError(fmt::format("Cannot create download directory {}: {}", directory.string(), ec.message()));
    }
    if (!std::filesystem::is_directory(directory, ec))
    {
        throw ConfigError(fmt::format("Download destination {} is not a directory", directory.string()));
    }
    if (::access(directory.c_str(), W_OK) != 0)
    {
        throw ConfigError(fmt::format("Download directory {} is not writable: {}", directory.string(),
                                      std::strerror(errno)));
    }
}

std::vector<OutcomeRecord> Downloader::run(const std::vector<DownloadItem> &items,
                                           ProgressObserver *observer,
                                           const CancellationToken *cancel)
{
    if (items.empty())
    {
        ProgressAggregator(std::vector<std::string>{}, observer).allFinished();
        return {};
    }

    prepareDirectory();

    std::vector<std::string> names;
    names.reserve(items.size());
    for (const auto &item : items)
    {
        names.push_back(item.filename());
    }
    ProgressAggregator progress(std::move(names), observer);
    ResultCollector collector(items.size());

    // Run-wide signal seen by every task; set from `cancel` or the deadline
    CancellationToken stopping;
    std::optional<Clock::time_point> deadline;
    if (config_.batchTimeout())
    {
        deadline = Clock::now() + *config_.batchTimeout();
    }

    // Tasks stay alive until the run returns; the transport calls into them
    std::vector<std::unique_ptr<TransferTask>> tasks(items.size());
    InFlightGuard guard(*transport_);
    std::multimap<Clock::time_point, std::function<void()>> timers;
    std::size_t busy = 0;
    ItemId next = 0;

    DeferFunction defer = [&timers](std::chrono::milliseconds delay, std::function<void()> task) {
        timers.emplace(Clock::now() + delay, std::move(task));
    };

    auto finish = [&](ItemId id, Outcome outcome, unsigned attempts) {
        TransferTask &task = *tasks[id];
        FinishedItem finished;
        finished.outcome = task.finalize(std::move(outcome));
        finished.state = task.takeState();
        finished.path = task.destination();
        finished.attempts = attempts;
        finished.bytesWritten = task.bytesWritten();
        finished.httpStatus = task.httpStatus();
        collector.record(id, std::move(finished));
        --busy;
    };

    auto dispatch = [&](ItemId id) {
        tasks[id] = std::make_unique<TransferTask>(id, items[id], config_, policy_, *transport_, progress, stopping);
        TransferTask *task = tasks[id].get();
        ++busy;
        progress.itemStarted(id);
        log::debug("Dispatching {} -> {}", items[id].url(), task->destination().string());

        attempt(
            [task](unsigned n, std::function<void(AttemptResult)> done) { task->begin(n, std::move(done)); },
            policy_,
            defer,
            [&finish, id](Outcome outcome, unsigned attempts) { finish(id, std::move(outcome), attempts); },
            rng_,
            [url = items[id].url()](unsigned failed, const TransferError &error, std::chrono::milliseconds delay) {
                log::warn("Attempt {} for {} failed ({}: {}), retrying in {} ms", failed, url, toString(error.kind),
                          error.message, delay.count());
            });
    };

    // Items never dispatched are cancelled without touching the network
    auto cancelPending = [&]() {
        for (; next < items.size(); ++next)
        {
            ItemState state;
            state.transition(ItemStatus::Cancelled);
            progress.itemFinished(next, ItemStatus::Cancelled);

            FinishedItem finished;
            finished.outcome = outcome::Cancelled{};
            finished.state = std::move(state);
            finished.path = items[next].destination(config_.directory());
            collector.record(next, std::move(finished));
        }
    };

    log::info("Downloading {} item(s) with concurrency {}", items.size(), config_.concurrency());

    while (!collector.complete())
    {
        // 1. Check for cancellation and the batch deadline
        if (!stopping.isCancelled())
        {
            if (cancel != nullptr && cancel->isCancelled())
            {
                log::warn("Cancellation requested, stopping downloads");
                stopping.cancel();
            }
            else if (deadline && Clock::now() >= *deadline)
            {
                log::warn("Batch timeout of {} s reached, cancelling remaining downloads",
                          config_.batchTimeout()->count());
                stopping.cancel();
            }
        }

        // 2. Fill free slots in input order
        if (stopping.isCancelled())
        {
            cancelPending();
        }
        else
        {
            while (busy < config_.concurrency() && next < items.size())
            {
                dispatch(next++);
            }
        }

        // 3. Start due retries; once cancelled every waiting item wakes up to stop
        auto now = Clock::now();
        while (!timers.empty() && (stopping.isCancelled() || timers.begin()->first <= now))
        {
            auto task = std::move(timers.begin()->second);
            timers.erase(timers.begin());
            task();
        }

        if (collector.complete())
        {
            break;
        }

        // 4. Drive I/O until the next timer is due
        auto wait = kMaxWait;
        if (!timers.empty())
        {
            auto untilTimer = std::chrono::duration_cast<std::chrono::milliseconds>(timers.begin()->first - now);
            wait = std::clamp(untilTimer, std::chrono::milliseconds(0), kMaxWait);
        }

        if (transport_->inFlight() > 0)
        {
            transport_->perform(wait);
        }
        else if (!timers.empty())
        {
            std::this_thread::sleep_for(wait);
        }
        else if (busy >= config_.concurrency() || next >= items.size())
        {
            throw std::logic_error("Scheduler stalled with unfinished items");
        }
    }

    progress.allFinished();
    auto records = collector.finish();

    auto summary = RunSummary::of(records);
    log::info("Finished: {} succeeded, {} already complete, {} failed, {} cancelled ({} bytes written)",
              summary.succeeded, summary.alreadyComplete, summary.failed, summary.cancelled, summary.bytesWritten);
    return records;
}

} // namespace bulkdl
