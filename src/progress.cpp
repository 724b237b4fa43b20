#include "bulkdl/progress.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace bulkdl
{

ProgressAggregator::ProgressAggregator(std::vector<std::string> names, ProgressObserver *observer)
    : observer_(observer)
{
    slots_.reserve(names.size());
    for (auto &name : names)
    {
        auto slot = std::make_unique<Slot>();
        slot->name = std::move(name);
        slots_.push_back(std::move(slot));
    }
}

ProgressAggregator::Slot &ProgressAggregator::slot(ItemId id)
{
    if (id >= slots_.size())
    {
        throw std::out_of_range(fmt::format("Unknown item id {}", id));
    }
    return *slots_[id];
}

const ProgressAggregator::Slot &ProgressAggregator::slot(ItemId id) const
{
    if (id >= slots_.size())
    {
        throw std::out_of_range(fmt::format("Unknown item id {}", id));
    }
    return *slots_[id];
}

void ProgressAggregator::setStatus(Slot &slot, ItemStatus status)
{
    bool wasActive = isActive(slot.progress.status);
    bool nowActive = isActive(status);
    slot.progress.status = status;

    if (!wasActive && nowActive)
    {
        std::size_t current = active_.fetch_add(1) + 1;
        std::size_t peak = peakActive_.load();
        while (current > peak && !peakActive_.compare_exchange_weak(peak, current))
        {
        }
    }
    else if (wasActive && !nowActive)
    {
        active_.fetch_sub(1);
    }
}

void ProgressAggregator::setTotal(Slot &slot, std::optional<std::uint64_t> total)
{
    const auto &previous = slot.progress.total;
    if (previous == total)
    {
        return;
    }

    if (previous)
    {
        knownTotal_.fetch_sub(*previous);
        knownTotals_.fetch_sub(1);
    }
    if (total)
    {
        knownTotal_.fetch_add(*total);
        knownTotals_.fetch_add(1);
    }
    slot.progress.total = total;
}

void ProgressAggregator::setBytes(Slot &slot, std::uint64_t bytes)
{
    std::uint64_t previous = slot.progress.bytes;
    if (bytes >= previous)
    {
        bytes_.fetch_add(bytes - previous);
    }
    else
    {
        bytes_.fetch_sub(previous - bytes);
    }
    slot.progress.bytes = bytes;
}

void ProgressAggregator::itemStarted(ItemId id)
{
    Slot &s = slot(id);
    std::lock_guard<std::mutex> lock(s.mutex);
    if (observer_)
    {
        observer_->itemStarted(id, s.name);
    }
}

void ProgressAggregator::itemStatus(ItemId id, ItemStatus status)
{
    Slot &s = slot(id);
    std::lock_guard<std::mutex> lock(s.mutex);
    setStatus(s, status);
}

void ProgressAggregator::itemPositioned(ItemId id, std::uint64_t offset, std::optional<std::uint64_t> total)
{
    Slot &s = slot(id);
    std::lock_guard<std::mutex> lock(s.mutex);
    setBytes(s, offset);
    setTotal(s, total);
    if (observer_)
    {
        observer_->itemPositioned(id, offset, total);
    }
}

void ProgressAggregator::itemProgress(ItemId id, std::uint64_t bytesDelta, std::optional<std::uint64_t> total)
{
    Slot &s = slot(id);
    std::lock_guard<std::mutex> lock(s.mutex);
    setBytes(s, s.progress.bytes + bytesDelta);
    if (total)
    {
        setTotal(s, total);
    }
    if (observer_)
    {
        observer_->itemProgress(id, bytesDelta, s.progress.total);
    }
}

void ProgressAggregator::itemFinished(ItemId id, ItemStatus status)
{
    Slot &s = slot(id);
    std::lock_guard<std::mutex> lock(s.mutex);
    if (isTerminal(s.progress.status))
    {
        throw std::logic_error(fmt::format("Item {} finished twice", id));
    }
    setStatus(s, status);
    finished_.fetch_add(1);
    if (observer_)
    {
        observer_->itemFinished(id, status);
    }
}

void ProgressAggregator::allFinished()
{
    if (observer_)
    {
        observer_->allFinished(aggregate());
    }
}

ItemProgress ProgressAggregator::item(ItemId id) const
{
    const Slot &s = slot(id);
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.progress;
}

AggregateProgress ProgressAggregator::aggregate() const
{
    AggregateProgress result;
    result.bytes = bytes_.load();
    result.items = slots_.size();
    result.finishedItems = finished_.load();
    if (knownTotals_.load() == slots_.size())
    {
        result.total = knownTotal_.load();
    }
    return result;
}

} // namespace bulkdl
