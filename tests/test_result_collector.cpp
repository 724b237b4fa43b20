#include <stdexcept>

#include <gtest/gtest.h>

#include "bulkdl/result_collector.hpp"
#include "test_util.hpp"

using namespace bulkdl;

namespace
{

FinishedItem finished(Outcome outcome, const std::filesystem::path &path = "/nonexistent/file")
{
    FinishedItem item;
    item.state.transition(ItemStatus::Probing);
    item.state.transition(statusOf(outcome));
    item.outcome = std::move(outcome);
    item.path = path;
    item.attempts = 1;
    return item;
}

} // namespace

TEST(ResultCollectorTest, ReleasesRecordsInInputOrder)
{
    ResultCollector collector(3);
    collector.record(2, finished(outcome::Cancelled{}, "/c"));
    collector.record(0, finished(outcome::AlreadyComplete{}, "/a"));
    EXPECT_FALSE(collector.complete());
    EXPECT_EQ(collector.remaining(), 1u);
    collector.record(1, finished(outcome::Failed{TransferError{ErrorKind::Protocol, "HTTP error 404: Not Found", 404}},
                                 "/b"));
    ASSERT_TRUE(collector.complete());

    auto records = collector.finish();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].finalPath, std::filesystem::path("/a"));
    EXPECT_EQ(records[0].status, ItemStatus::AlreadyComplete);
    EXPECT_EQ(records[1].status, ItemStatus::Fail);
    EXPECT_EQ(records[1].errorMessage, std::string("HTTP error 404: Not Found"));
    EXPECT_EQ(records[1].errorKind, ErrorKind::Protocol);
    EXPECT_EQ(records[1].httpStatus, 404);
    EXPECT_EQ(records[2].status, ItemStatus::Cancelled);
    EXPECT_FALSE(records[2].errorMessage);
}

TEST(ResultCollectorTest, RejectsDuplicatesAndUnknownItems)
{
    ResultCollector collector(1);
    collector.record(0, finished(outcome::AlreadyComplete{}));
    EXPECT_THROW(collector.record(0, finished(outcome::AlreadyComplete{})), std::logic_error);
    EXPECT_THROW(collector.record(5, finished(outcome::AlreadyComplete{})), std::logic_error);
}

TEST(ResultCollectorTest, FinishBeforeCompletionThrows)
{
    ResultCollector collector(2);
    collector.record(0, finished(outcome::AlreadyComplete{}));
    EXPECT_THROW(collector.finish(), std::logic_error);
}

TEST(ResultCollectorTest, StateMustAgreeWithOutcome)
{
    ResultCollector collector(1);
    FinishedItem item = finished(outcome::AlreadyComplete{});
    item.outcome = outcome::Cancelled{};
    EXPECT_THROW(collector.record(0, std::move(item)), std::logic_error);
}

TEST(ResultCollectorTest, RecordsFileSizeWhenPresent)
{
    fake::TempDir tmp;
    fake::writeFile(tmp / "f.bin", "12345");

    ResultCollector collector(1);
    collector.record(0, finished(outcome::AlreadyComplete{}, tmp / "f.bin"));
    auto records = collector.finish();
    EXPECT_EQ(records[0].fileSize, 5u);
}

TEST(RunSummaryTest, CountsByStatus)
{
    std::vector<OutcomeRecord> records(5);
    records[0].status = ItemStatus::Success;
    records[0].bytesWritten = 10;
    records[1].status = ItemStatus::AlreadyComplete;
    records[2].status = ItemStatus::Fail;
    records[3].status = ItemStatus::Cancelled;
    records[4].status = ItemStatus::Success;
    records[4].bytesWritten = 5;

    auto summary = RunSummary::of(records);
    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_EQ(summary.alreadyComplete, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.cancelled, 1u);
    EXPECT_EQ(summary.bytesWritten, 15u);
    EXPECT_FALSE(summary.allSucceeded());

    records.resize(2);
    EXPECT_TRUE(RunSummary::of(records).allSucceeded());
}
