#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "bulkdl/item_state.hpp"

namespace bulkdl
{

// Position of an item in the caller's input list
using ItemId = std::size_t;

struct ItemProgress
{
    ItemStatus status = ItemStatus::NotStarted;
    std::uint64_t bytes = 0;
    std::optional<std::uint64_t> total;
};

/**
 * Sum over all items. `total` is only set when every item's total is known;
 * otherwise progress is bytes-only.
 */
struct AggregateProgress
{
    std::uint64_t bytes = 0;
    std::optional<std::uint64_t> total;
    std::size_t finishedItems = 0;
    std::size_t items = 0;
};

/**
 * Receives progress events, e.g. to draw progress bars. Events for one item
 * arrive in stream order; events for different items may come from
 * different threads.
 */
class ProgressObserver
{
public:
    virtual ~ProgressObserver() = default;

    virtual void itemStarted(ItemId id, const std::string &name)
    {
        (void)id;
        (void)name;
    }

    // A stream starts at an absolute offset (S on resume, 0 on restart)
    virtual void itemPositioned(ItemId id, std::uint64_t offset, std::optional<std::uint64_t> total)
    {
        (void)id;
        (void)offset;
        (void)total;
    }

    virtual void itemProgress(ItemId id, std::uint64_t bytesDelta, std::optional<std::uint64_t> total)
    {
        (void)id;
        (void)bytesDelta;
        (void)total;
    }

    virtual void itemFinished(ItemId id, ItemStatus status)
    {
        (void)id;
        (void)status;
    }

    virtual void allFinished(const AggregateProgress &aggregate) { (void)aggregate; }
};

/**
 * Per-item and aggregate progress for one run.
 *
 * Each item's record sits behind its own mutex, held only while that record
 * is updated and its event forwarded; aggregate counters are atomics. Updates
 * for different items may therefore come from different threads without lost
 * updates.
 */
class ProgressAggregator
{
public:
    /**
     * @param names Display name per item, indexed by ItemId
     * @param observer Optional renderer; must outlive the aggregator
     */
    explicit ProgressAggregator(std::vector<std::string> names, ProgressObserver *observer = nullptr);

    void itemStarted(ItemId id);

    // Non-terminal status change
    void itemStatus(ItemId id, ItemStatus status);

    void itemPositioned(ItemId id, std::uint64_t offset, std::optional<std::uint64_t> total);
    void itemProgress(ItemId id, std::uint64_t bytesDelta, std::optional<std::uint64_t> total);
    void itemFinished(ItemId id, ItemStatus status);
    void allFinished();

    ItemProgress item(ItemId id) const;
    AggregateProgress aggregate() const;

    std::size_t size() const { return slots_.size(); }

    // Items currently probing, resuming, restarting or downloading
    std::size_t activeCount() const { return active_.load(); }
    std::size_t peakActiveCount() const { return peakActive_.load(); }

private:
    struct Slot
    {
        mutable std::mutex mutex;
        std::string name;
        ItemProgress progress;
    };

    Slot &slot(ItemId id);
    const Slot &slot(ItemId id) const;

    // Caller holds the slot's mutex
    void setStatus(Slot &slot, ItemStatus status);
    void setTotal(Slot &slot, std::optional<std::uint64_t> total);
    void setBytes(Slot &slot, std::uint64_t bytes);

    std::vector<std::unique_ptr<Slot>> slots_;
    ProgressObserver *observer_;

    std::atomic<std::uint64_t> bytes_{0};
    std::atomic<std::uint64_t> knownTotal_{0};
    std::atomic<std::size_t> knownTotals_{0};
    std::atomic<std::size_t> finished_{0};
    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> peakActive_{0};
};

} // namespace bulkdl
