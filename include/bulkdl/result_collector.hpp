#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "bulkdl/errors.hpp"
#include "bulkdl/item_state.hpp"
#include "bulkdl/progress.hpp"

namespace bulkdl
{

/**
 * Final report for one item, in the same position as the item in the input.
 */
struct OutcomeRecord
{
    ItemStatus status = ItemStatus::NotStarted;
    std::optional<std::string> errorMessage;
    std::optional<ErrorKind> errorKind;
    std::filesystem::path finalPath;

    unsigned attempts = 0;
    std::uint64_t bytesWritten = 0;        // Written during this run, across attempts
    std::optional<std::uint64_t> fileSize; // On-disk size at the end, if the file exists
    std::optional<long> httpStatus;        // Last status code received
};

/**
 * Everything a finished item hands over to the collector.
 */
struct FinishedItem
{
    Outcome outcome;
    ItemState state;
    std::filesystem::path path;
    unsigned attempts = 0;
    std::uint64_t bytesWritten = 0;
    std::optional<long> httpStatus;
};

/**
 * Gathers terminal results as they arrive, in any order, and releases them in
 * input order once every item is terminal.
 */
class ResultCollector
{
public:
    explicit ResultCollector(std::size_t itemCount);

    /**
     * Record the terminal result of an item. Takes ownership of its state.
     * @throws std::logic_error if the item was already recorded
     */
    void record(ItemId id, FinishedItem item);

    bool complete() const;
    std::size_t remaining() const;

    /**
     * @return One record per item, ordered like the input
     * @throws std::logic_error if some item has no terminal result yet
     */
    std::vector<OutcomeRecord> finish();

private:
    static OutcomeRecord toRecord(FinishedItem item);

    mutable std::mutex mutex_;
    std::vector<std::optional<OutcomeRecord>> records_;
    std::size_t remaining_;
};

/**
 * Counts of outcomes by terminal status.
 */
struct RunSummary
{
    std::size_t succeeded = 0;
    std::size_t alreadyComplete = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    std::uint64_t bytesWritten = 0;

    static RunSummary of(const std::vector<OutcomeRecord> &records);

    // Every item ended in Success or AlreadyComplete
    bool allSucceeded() const { return failed == 0 && cancelled == 0; }
};

} // namespace bulkdl
