#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "bulkdl/progress.hpp"

using namespace bulkdl;

namespace
{

// Checks that each item's events arrive in stream order
class OrderCheckingObserver : public ProgressObserver
{
public:
    explicit OrderCheckingObserver(std::size_t items) : bytes_(items, 0), finished_(items, false) {}

    void itemPositioned(ItemId id, std::uint64_t offset, std::optional<std::uint64_t>) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bytes_[id] = offset;
    }

    void itemProgress(ItemId id, std::uint64_t delta, std::optional<std::uint64_t>) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_[id])
        {
            ++violations;
        }
        bytes_[id] += delta;
    }

    void itemFinished(ItemId id, ItemStatus) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_[id] = true;
    }

    void allFinished(const AggregateProgress &aggregate) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        final = aggregate;
    }

    std::uint64_t bytes(ItemId id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return bytes_[id];
    }

    int violations = 0;
    AggregateProgress final;

private:
    std::mutex mutex_;
    std::vector<std::uint64_t> bytes_;
    std::vector<bool> finished_;
};

} // namespace

TEST(ProgressAggregatorTest, ConcurrentUpdatesAreNotLost)
{
    constexpr std::size_t kItems = 8;
    constexpr int kChunks = 5000;
    ProgressAggregator progress(std::vector<std::string>(kItems, "item"));

    std::vector<std::thread> workers;
    for (std::size_t id = 0; id < kItems; ++id)
    {
        workers.emplace_back([&progress, id]() {
            progress.itemStarted(id);
            progress.itemStatus(id, ItemStatus::Downloading);
            progress.itemPositioned(id, 0, std::nullopt);
            for (int i = 0; i < kChunks; ++i)
            {
                progress.itemProgress(id, 3, std::nullopt);
            }
            progress.itemFinished(id, ItemStatus::Success);
        });
    }
    for (auto &worker : workers)
    {
        worker.join();
    }

    auto aggregate = progress.aggregate();
    EXPECT_EQ(aggregate.bytes, kItems * kChunks * 3u);
    EXPECT_EQ(aggregate.finishedItems, kItems);
    EXPECT_FALSE(aggregate.total.has_value());
    EXPECT_EQ(progress.activeCount(), 0u);
    EXPECT_LE(progress.peakActiveCount(), kItems);
    for (std::size_t id = 0; id < kItems; ++id)
    {
        EXPECT_EQ(progress.item(id).bytes, kChunks * 3u);
        EXPECT_EQ(progress.item(id).status, ItemStatus::Success);
    }
}

TEST(ProgressAggregatorTest, TotalKnownOnlyWhenEveryItemHasOne)
{
    ProgressAggregator progress({"a", "b"});
    progress.itemPositioned(0, 0, 100);
    EXPECT_FALSE(progress.aggregate().total.has_value());

    progress.itemPositioned(1, 40, 60);
    auto aggregate = progress.aggregate();
    ASSERT_TRUE(aggregate.total.has_value());
    EXPECT_EQ(*aggregate.total, 160u);
    EXPECT_EQ(aggregate.bytes, 40u);
}

TEST(ProgressAggregatorTest, RestartRebasesItemBytes)
{
    ProgressAggregator progress({"a"});
    progress.itemPositioned(0, 500, std::nullopt);
    progress.itemProgress(0, 100, std::nullopt);
    EXPECT_EQ(progress.aggregate().bytes, 600u);

    // Server ignored the range: the stream starts over from zero
    progress.itemPositioned(0, 0, 1000);
    EXPECT_EQ(progress.aggregate().bytes, 0u);
    progress.itemProgress(0, 250, 1000);
    EXPECT_EQ(progress.item(0).bytes, 250u);
    EXPECT_EQ(progress.aggregate().total, 1000u);
}

TEST(ProgressAggregatorTest, TracksActiveItems)
{
    ProgressAggregator progress({"a", "b", "c"});
    progress.itemStatus(0, ItemStatus::Probing);
    progress.itemStatus(1, ItemStatus::Downloading);
    EXPECT_EQ(progress.activeCount(), 2u);

    progress.itemStatus(0, ItemStatus::Resuming);
    EXPECT_EQ(progress.activeCount(), 2u);

    progress.itemStatus(1, ItemStatus::NotStarted);
    progress.itemFinished(0, ItemStatus::Success);
    EXPECT_EQ(progress.activeCount(), 0u);
    EXPECT_EQ(progress.peakActiveCount(), 2u);
}

TEST(ProgressAggregatorTest, ForwardsEventsInStreamOrder)
{
    OrderCheckingObserver observer(2);
    ProgressAggregator progress({"a", "b"}, &observer);

    std::thread other([&progress]() {
        progress.itemPositioned(1, 10, std::nullopt);
        for (int i = 0; i < 1000; ++i)
        {
            progress.itemProgress(1, 1, std::nullopt);
        }
        progress.itemFinished(1, ItemStatus::Success);
    });
    progress.itemPositioned(0, 0, 2000);
    for (int i = 0; i < 1000; ++i)
    {
        progress.itemProgress(0, 2, 2000);
    }
    progress.itemFinished(0, ItemStatus::Success);
    other.join();
    progress.allFinished();

    EXPECT_EQ(observer.violations, 0);
    EXPECT_EQ(observer.bytes(0), 2000u);
    EXPECT_EQ(observer.bytes(1), 1010u);
    EXPECT_EQ(observer.final.finishedItems, 2u);
    EXPECT_EQ(observer.final.bytes, 3010u);
}

TEST(ProgressAggregatorTest, FinishingTwiceIsAnError)
{
    ProgressAggregator progress({"a"});
    progress.itemFinished(0, ItemStatus::Cancelled);
    EXPECT_THROW(progress.itemFinished(0, ItemStatus::Cancelled), std::logic_error);
    EXPECT_THROW(progress.item(3), std::out_of_range);
}
