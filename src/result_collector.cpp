#include "bulkdl/result_collector.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "overloaded.hpp"

namespace bulkdl
{

ResultCollector::ResultCollector(std::size_t itemCount) : records_(itemCount), remaining_(itemCount)
{
}

void ResultCollector::record(ItemId id, FinishedItem item)
{
    OutcomeRecord outcomeRecord = toRecord(std::move(item));

    std::lock_guard<std::mutex> lock(mutex_);
    if (id >= records_.size())
    {
        throw std::logic_error(fmt::format("Result for unknown item {}", id));
    }
    if (records_[id])
    {
        throw std::logic_error(fmt::format("Item {} already has a result", id));
    }
    records_[id] = std::move(outcomeRecord);
    --remaining_;
}

bool ResultCollector::complete() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining_ == 0;
}

std::size_t ResultCollector::remaining() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining_;
}

std::vector<OutcomeRecord> ResultCollector::finish()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (remaining_ != 0)
    {
        throw std::logic_error(fmt::format("{} item(s) have not finished", remaining_));
    }

    std::vector<OutcomeRecord> result;
    result.reserve(records_.size());
    for (auto &entry : records_)
    {
        result.push_back(std::move(*entry));
    }
    records_.clear();
    return result;
}

OutcomeRecord ResultCollector::toRecord(FinishedItem item)
{
    OutcomeRecord out;
    out.finalPath = std::move(item.path);
    out.attempts = item.attempts;
    out.bytesWritten = item.bytesWritten;
    out.httpStatus = item.httpStatus;

    std::visit(detail::overloaded{
                   [&](const outcome::Success &) { out.status = ItemStatus::Success; },
                   [&](const outcome::AlreadyComplete &) { out.status = ItemStatus::AlreadyComplete; },
                   [&](const outcome::Failed &failed) {
                       out.status = ItemStatus::Fail;
                       out.errorMessage = failed.error.message;
                       out.errorKind = failed.error.kind;
                       if (failed.error.httpStatus)
                       {
                           out.httpStatus = failed.error.httpStatus;
                       }
                   },
                   [&](const outcome::Cancelled &) { out.status = ItemStatus::Cancelled; },
               },
               item.outcome);

    if (item.state.status != out.status)
    {
        throw std::logic_error(fmt::format("Item state {} disagrees with outcome {}",
                                           toString(item.state.status), toString(out.status)));
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(out.finalPath, ec);
    if (!ec)
    {
        out.fileSize = size;
    }
    return out;
}

RunSummary RunSummary::of(const std::vector<OutcomeRecord> &records)
{
    RunSummary summary;
    for (const auto &record : records)
    {
        summary.bytesWritten += record.bytesWritten;
        switch (record.status)
        {
        case ItemStatus::Success:
            ++summary.succeeded;
            break;
        case ItemStatus::AlreadyComplete:
            ++summary.alreadyComplete;
            break;
        case ItemStatus::Cancelled:
            ++summary.cancelled;
            break;
        default:
            ++summary.failed;
            break;
        }
    }
    return summary;
}

} // namespace bulkdl
