#include "bulkdl/item_state.hpp"

#include <stdexcept>

#include <fmt/core.h>

#include "overloaded.hpp"

namespace bulkdl
{

const char *toString(ItemStatus status)
{
    switch (status)
    {
    case ItemStatus::NotStarted:
        return "not-started";
    case ItemStatus::Probing:
        return "probing";
    case ItemStatus::Resuming:
        return "resuming";
    case ItemStatus::Restarting:
        return "restarting";
    case ItemStatus::AlreadyComplete:
        return "already-complete";
    case ItemStatus::Downloading:
        return "downloading";
    case ItemStatus::Success:
        return "success";
    case ItemStatus::Fail:
        return "fail";
    case ItemStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

bool isTerminal(ItemStatus status)
{
    return status == ItemStatus::Success || status == ItemStatus::Fail ||
           status == ItemStatus::AlreadyComplete || status == ItemStatus::Cancelled;
}

bool isActive(ItemStatus status)
{
    return status == ItemStatus::Probing || status == ItemStatus::Resuming ||
           status == ItemStatus::Restarting || status == ItemStatus::Downloading;
}

bool canTransition(ItemStatus from, ItemStatus to)
{
    if (isTerminal(from))
    {
        return false;
    }
    if (to == ItemStatus::Cancelled || to == ItemStatus::Fail)
    {
        return true;
    }

    switch (from)
    {
    case ItemStatus::NotStarted:
        return to == ItemStatus::Probing || to == ItemStatus::Downloading;
    case ItemStatus::Probing:
        return to == ItemStatus::Resuming || to == ItemStatus::Restarting ||
               to == ItemStatus::AlreadyComplete || to == ItemStatus::NotStarted;
    case ItemStatus::Resuming:
    case ItemStatus::Restarting:
        return to == ItemStatus::Downloading || to == ItemStatus::NotStarted;
    case ItemStatus::Downloading:
        return to == ItemStatus::Success || to == ItemStatus::NotStarted;
    default:
        return false;
    }
}

void ItemState::transition(ItemStatus next)
{
    if (!canTransition(status, next))
    {
        throw std::logic_error(
            fmt::format("Invalid item transition {} -> {}", toString(status), toString(next)));
    }
    status = next;
}

ItemStatus statusOf(const Outcome &outcome)
{
    return std::visit(detail::overloaded{
                          [](const outcome::Success &) { return ItemStatus::Success; },
                          [](const outcome::AlreadyComplete &) { return ItemStatus::AlreadyComplete; },
                          [](const outcome::Failed &) { return ItemStatus::Fail; },
                          [](const outcome::Cancelled &) { return ItemStatus::Cancelled; },
                      },
                      outcome);
}

} // namespace bulkdl
