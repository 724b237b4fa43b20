#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>
#include <gtest/gtest.h>

#include "bulkdl/downloader.hpp"
#include "bulkdl/errors.hpp"
#include "fake_transport.hpp"
#include "test_util.hpp"

using namespace bulkdl;
using bulkdl::fake::FakeResponse;
using bulkdl::fake::readFile;
using bulkdl::fake::writeFile;

namespace
{

std::string urlFor(const std::string &name)
{
    return "http://example.com/files/" + name;
}

// Counts items holding a scheduler slot and remembers completion order
class SlotObserver : public ProgressObserver
{
public:
    void itemStarted(ItemId id, const std::string &) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running.insert(id);
        peak = std::max(peak, running.size());
    }

    void itemProgress(ItemId, std::uint64_t, std::optional<std::uint64_t>) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++chunks;
        if (cancelAfterChunks && chunks >= *cancelAfterChunks && token)
        {
            token->cancel();
        }
    }

    void itemFinished(ItemId id, ItemStatus) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running.erase(id);
        order.push_back(id);
    }

    void allFinished(const AggregateProgress &aggregate) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        final = aggregate;
        allFinishedCalls++;
    }

    std::set<ItemId> running;
    std::size_t peak = 0;
    std::size_t chunks = 0;
    std::vector<ItemId> order;
    AggregateProgress final;
    int allFinishedCalls = 0;

    std::optional<std::size_t> cancelAfterChunks;
    CancellationToken *token = nullptr;

private:
    std::mutex mutex_;
};

fake::Responder slowBody(std::string content)
{
    return [content](const HttpRequest &) {
        FakeResponse response;
        response.body = content;
        response.chunkSize = 1;
        return response;
    };
}

} // namespace

class DownloaderTest : public ::testing::Test
{
protected:
    DownloaderTest() : transport(std::make_shared<fake::FakeTransport>())
    {
        options.directory = tmp.dir();
        options.backoff.initialDelay = std::chrono::milliseconds(1);
        options.backoff.maxDelay = std::chrono::milliseconds(5);
        options.progressVisibility = ProgressVisibility::Hidden;
    }

    Downloader makeDownloader() { return Downloader(RunConfig::create(options), transport); }

    DownloadItem serve(const std::string &name, fake::Responder responder)
    {
        transport->route(urlFor(name), std::move(responder));
        return DownloadItem::fromUrl(urlFor(name));
    }

    fake::TempDir tmp;
    RunOptions options;
    std::shared_ptr<fake::FakeTransport> transport;
};

TEST_F(DownloaderTest, MixedBatchWithResumeRestartAndRetry)
{
    options.concurrency = 2;
    options.retries = 1;

    std::string a = fake::payload(300, 'a');
    std::string b = fake::payload(1000, 'b');
    std::string c = fake::payload(400, 'c');
    writeFile(tmp / "a.bin", a);

    std::vector<DownloadItem> items{
        serve("a.bin", fake::rangeServer(a)),
        serve("b.bin", fake::fullServer(b)),
        serve("c.bin", fake::sequence({fake::connectionReset(), fake::rangeServer(c)})),
    };

    SlotObserver observer;
    auto records = makeDownloader().run(items, &observer);

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].status, ItemStatus::AlreadyComplete);
    EXPECT_EQ(records[0].bytesWritten, 0u);
    EXPECT_EQ(records[0].finalPath, tmp / "a.bin");

    EXPECT_EQ(records[1].status, ItemStatus::Success);
    EXPECT_EQ(records[1].bytesWritten, 1000u);
    EXPECT_EQ(records[1].attempts, 1u);
    EXPECT_EQ(readFile(tmp / "b.bin"), b);

    EXPECT_EQ(records[2].status, ItemStatus::Success);
    EXPECT_EQ(records[2].attempts, 2u);
    EXPECT_EQ(readFile(tmp / "c.bin"), c);

    EXPECT_LE(transport->peakInFlight(), 2u);
    EXPECT_LE(observer.peak, 2u);
    EXPECT_EQ(observer.allFinishedCalls, 1);
}

TEST_F(DownloaderTest, RerunOfCompletedBatchWritesNothing)
{
    std::vector<DownloadItem> items{
        serve("one.bin", fake::rangeServer(fake::payload(128))),
        serve("two.bin", fake::rangeServer(fake::payload(64, 'k'))),
    };

    auto first = makeDownloader().run(items);
    ASSERT_EQ(first[0].status, ItemStatus::Success);
    ASSERT_EQ(first[1].status, ItemStatus::Success);

    auto second = makeDownloader().run(items);
    for (const auto &record : second)
    {
        EXPECT_EQ(record.status, ItemStatus::AlreadyComplete);
        EXPECT_EQ(record.bytesWritten, 0u);
    }
    EXPECT_EQ(readFile(tmp / "one.bin"), fake::payload(128));
    EXPECT_EQ(second[1].fileSize, 64u);
}

TEST_F(DownloaderTest, RetryableFailureStopsAfterRetriesPlusOneAttempts)
{
    options.retries = 3;
    std::vector<DownloadItem> items{serve("busy.bin", fake::status(503))};

    auto records = makeDownloader().run(items);

    EXPECT_EQ(records[0].status, ItemStatus::Fail);
    EXPECT_EQ(records[0].attempts, 4u);
    EXPECT_EQ(transport->requestCount(urlFor("busy.bin")), 4u);
    EXPECT_EQ(records[0].errorKind, ErrorKind::Protocol);
    EXPECT_EQ(records[0].httpStatus, 503);
    ASSERT_TRUE(records[0].errorMessage);
    EXPECT_NE(records[0].errorMessage->find("503"), std::string::npos);
}

TEST_F(DownloaderTest, ClientErrorIsNotRetried)
{
    options.retries = 3;
    std::vector<DownloadItem> items{serve("missing.bin", fake::status(404))};

    auto records = makeDownloader().run(items);

    EXPECT_EQ(records[0].status, ItemStatus::Fail);
    EXPECT_EQ(records[0].attempts, 1u);
    EXPECT_EQ(transport->requestCount(urlFor("missing.bin")), 1u);
}

TEST_F(DownloaderTest, FailureDoesNotAffectOtherItems)
{
    std::vector<DownloadItem> items{
        serve("gone.bin", fake::status(410)),
        serve("fine.bin", fake::rangeServer("payload")),
    };

    auto records = makeDownloader().run(items);

    EXPECT_EQ(records[0].status, ItemStatus::Fail);
    EXPECT_EQ(records[1].status, ItemStatus::Success);
    EXPECT_EQ(readFile(tmp / "fine.bin"), "payload");
}

TEST_F(DownloaderTest, NeverExceedsConcurrencyLimit)
{
    for (int limit : {3, 1})
    {
        options.concurrency = limit;
        auto transportForRun = std::make_shared<fake::FakeTransport>();
        transport = transportForRun;

        std::vector<DownloadItem> items;
        for (int i = 0; i < 10; ++i)
        {
            items.push_back(serve(fmt::format("limit{}-{}.bin", limit, i), slowBody(fake::payload(30))));
        }

        SlotObserver observer;
        auto records = makeDownloader().run(items, &observer);

        EXPECT_EQ(transport->peakInFlight(), static_cast<std::size_t>(limit));
        EXPECT_LE(observer.peak, static_cast<std::size_t>(limit));
        for (const auto &record : records)
        {
            EXPECT_EQ(record.status, ItemStatus::Success);
        }
    }
}

TEST_F(DownloaderTest, ZeroConcurrencyRunsOneAtATime)
{
    options.concurrency = 0;
    std::vector<DownloadItem> items{
        serve("x.bin", slowBody("xxxxxxxx")),
        serve("y.bin", slowBody("yyyyyyyy")),
    };

    auto records = makeDownloader().run(items);

    EXPECT_EQ(transport->peakInFlight(), 1u);
    EXPECT_EQ(records[0].status, ItemStatus::Success);
    EXPECT_EQ(records[1].status, ItemStatus::Success);
}

TEST_F(DownloaderTest, RecordsFollowInputOrderNotCompletionOrder)
{
    options.concurrency = 3;
    std::vector<DownloadItem> items{
        serve("large.bin", slowBody(fake::payload(200))),
        serve("medium.bin", slowBody(fake::payload(50))),
        serve("small.bin", slowBody(fake::payload(5))),
    };

    SlotObserver observer;
    auto records = makeDownloader().run(items, &observer);

    EXPECT_EQ(observer.order, (std::vector<ItemId>{2, 1, 0}));
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].finalPath, tmp / "large.bin");
    EXPECT_EQ(records[1].finalPath, tmp / "medium.bin");
    EXPECT_EQ(records[2].finalPath, tmp / "small.bin");
    EXPECT_EQ(records[0].bytesWritten, 200u);
}

TEST_F(DownloaderTest, CancellationStopsInFlightAndPendingItems)
{
    options.concurrency = 2;
    std::vector<DownloadItem> items;
    for (int i = 0; i < 5; ++i)
    {
        items.push_back(serve(fmt::format("c{}.bin", i), slowBody(fake::payload(500))));
    }

    CancellationToken token;
    SlotObserver observer;
    observer.cancelAfterChunks = 10;
    observer.token = &token;

    auto records = makeDownloader().run(items, &observer, &token);

    ASSERT_EQ(records.size(), 5u);
    for (const auto &record : records)
    {
        EXPECT_EQ(record.status, ItemStatus::Cancelled);
    }
    for (int i = 2; i < 5; ++i)
    {
        EXPECT_EQ(transport->requestCount(urlFor(fmt::format("c{}.bin", i))), 0u);
    }
}

TEST_F(DownloaderTest, BatchTimeoutCancelsItemWaitingForRetry)
{
    options.retries = 5;
    options.backoff.initialDelay = std::chrono::milliseconds(60000);
    options.backoff.maxDelay = std::chrono::milliseconds(60000);
    options.batchTimeout = std::chrono::seconds(1);
    std::vector<DownloadItem> items{serve("flaky.bin", fake::status(503))};

    auto started = std::chrono::steady_clock::now();
    auto records = makeDownloader().run(items);

    EXPECT_EQ(records[0].status, ItemStatus::Cancelled);
    EXPECT_EQ(records[0].attempts, 2u);
    EXPECT_EQ(transport->requestCount(urlFor("flaky.bin")), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(DownloaderTest, EmptyInputYieldsEmptyResult)
{
    SlotObserver observer;
    auto records = makeDownloader().run({}, &observer);

    EXPECT_TRUE(records.empty());
    EXPECT_TRUE(transport->requests().empty());
    EXPECT_EQ(observer.allFinishedCalls, 1);
}

TEST_F(DownloaderTest, UnusableDirectoryIsConfigError)
{
    writeFile(tmp / "not-a-dir", "x");
    options.directory = tmp / "not-a-dir";
    std::vector<DownloadItem> items{serve("f.bin", fake::rangeServer("data"))};

    EXPECT_THROW(makeDownloader().run(items), ConfigError);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(DownloaderTest, CreatesMissingDirectories)
{
    options.directory = tmp / "nested" / "dir";
    transport->route(urlFor("f.bin"), fake::rangeServer("data"));
    transport->route(urlFor("g.bin"), fake::rangeServer("more"));
    std::vector<DownloadItem> items{
        DownloadItem::fromUrl(urlFor("f.bin")),
        DownloadItem::fromUrl(urlFor("g.bin"), std::nullopt, tmp.dir() / "elsewhere"),
    };

    auto records = makeDownloader().run(items);

    EXPECT_EQ(readFile(tmp.dir() / "nested" / "dir" / "f.bin"), "data");
    EXPECT_EQ(readFile(tmp.dir() / "elsewhere" / "g.bin"), "more");
    EXPECT_EQ(records[1].finalPath, tmp.dir() / "elsewhere" / "g.bin");
}

TEST_F(DownloaderTest, InvalidFilenameFailsOnlyThatItem)
{
    transport->route(urlFor("x"), fake::rangeServer("data"));
    std::vector<DownloadItem> items{
        DownloadItem::fromUrl(urlFor("x"), std::string("a/b")),
        serve("ok.bin", fake::rangeServer("ok")),
    };

    auto records = makeDownloader().run(items);

    EXPECT_EQ(records[0].status, ItemStatus::Fail);
    EXPECT_EQ(records[0].errorKind, ErrorKind::InvalidPath);
    EXPECT_EQ(records[0].attempts, 1u);
    EXPECT_EQ(records[1].status, ItemStatus::Success);
}

TEST_F(DownloaderTest, ChecksumMismatchFailsTheItem)
{
    transport->route(urlFor("sum.bin"), fake::rangeServer("hello"));
    std::vector<DownloadItem> items{DownloadItem::fromUrl(urlFor("sum.bin"), std::nullopt, std::nullopt,
                                                          std::string("sha256:") + std::string(64, '0'))};

    auto records = makeDownloader().run(items);

    EXPECT_EQ(records[0].status, ItemStatus::Fail);
    EXPECT_EQ(records[0].errorKind, ErrorKind::ChecksumMismatch);
    EXPECT_EQ(records[0].attempts, 1u);
}

TEST_F(DownloaderTest, HeadersAreSentOnEveryAttempt)
{
    options.retries = 1;
    options.headers = {{"Authorization", "Bearer abc"}};
    writeFile(tmp / "auth.bin", "abc");
    std::vector<DownloadItem> items{
        serve("auth.bin", fake::sequence({fake::status(502), fake::rangeServer("abcdef")})),
    };

    auto records = makeDownloader().run(items);

    EXPECT_EQ(records[0].status, ItemStatus::Success);
    ASSERT_EQ(transport->requests().size(), 2u);
    for (const auto &request : transport->requests())
    {
        EXPECT_EQ(request.headers.at("Authorization"), "Bearer abc");
        EXPECT_EQ(request.rangeStart, 3u);
    }
}

TEST_F(DownloaderTest, AggregateTotalIsKnownOnlyWhenEveryLengthIs)
{
    std::vector<DownloadItem> items{
        serve("p.bin", fake::rangeServer(fake::payload(100))),
        serve("q.bin", fake::rangeServer(fake::payload(20))),
    };

    SlotObserver observer;
    makeDownloader().run(items, &observer);
    EXPECT_EQ(observer.final.bytes, 120u);
    EXPECT_EQ(observer.final.total, 120u);
    EXPECT_EQ(observer.final.finishedItems, 2u);

    transport->route(urlFor("r.bin"), [](const HttpRequest &) {
        FakeResponse response;
        response.body = "unknown length";
        response.sendContentLength = false;
        return response;
    });
    std::vector<DownloadItem> more{DownloadItem::fromUrl(urlFor("r.bin"))};
    SlotObserver second;
    makeDownloader().run(more, &second);
    EXPECT_FALSE(second.final.total.has_value());
    EXPECT_EQ(second.final.bytes, 14u);
}

TEST_F(DownloaderTest, FailedRunLeavesTransportReusable)
{
    options.concurrency = 2;

    class ThrowingObserver : public ProgressObserver
    {
    public:
        void itemProgress(ItemId, std::uint64_t, std::optional<std::uint64_t>) override
        {
            throw std::runtime_error("renderer failed");
        }
    };

    std::string a = fake::payload(40, 'a');
    std::string b = fake::payload(40, 'b');
    std::vector<DownloadItem> items{
        serve("a.bin", fake::rangeServer(a)),
        serve("b.bin", fake::rangeServer(b)),
    };

    Downloader downloader = makeDownloader();
    ThrowingObserver throwing;
    EXPECT_THROW(downloader.run(items, &throwing), std::runtime_error);
    EXPECT_EQ(transport->inFlight(), 0u);

    auto records = downloader.run(items);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].status, ItemStatus::Success);
    EXPECT_EQ(records[1].status, ItemStatus::Success);
    EXPECT_EQ(readFile(tmp / "a.bin"), a);
    EXPECT_EQ(readFile(tmp / "b.bin"), b);
}
