#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include "bulkdl/errors.hpp"

namespace bulkdl
{

/**
 * Lifecycle of one item.
 *
 *   NotStarted -> Probing -> {Resuming, Restarting} -> Downloading -> {Success, Fail}
 *   NotStarted -> Probing -> {AlreadyComplete, Fail}
 *   NotStarted -> Downloading              (resume disabled)
 *
 * Any non-terminal status may move to Cancelled, and an active status returns
 * to NotStarted while the item waits for a retry.
 */
enum class ItemStatus
{
    NotStarted,
    Probing,
    Resuming,
    Restarting,
    AlreadyComplete,
    Downloading,
    Success,
    Fail,
    Cancelled
};

const char *toString(ItemStatus status);

bool isTerminal(ItemStatus status);

// Probing, Resuming, Restarting or Downloading
bool isActive(ItemStatus status);

bool canTransition(ItemStatus from, ItemStatus to);

/**
 * Mutable per-item record, owned by the item's task until it is terminal.
 */
struct ItemState
{
    ItemStatus status = ItemStatus::NotStarted;
    std::uint64_t bytes = 0;            // Bytes at the destination for the current stream
    std::optional<std::uint64_t> total; // Declared total, when the server sent one
    std::optional<TransferError> lastError;

    /**
     * Move to a new status.
     * @throws std::logic_error if the state machine forbids the transition
     */
    void transition(ItemStatus next);
};

namespace outcome
{

struct Success
{
    std::uint64_t bytesWritten = 0;
};

struct AlreadyComplete
{
};

struct Failed
{
    TransferError error;
};

struct Cancelled
{
};

} // namespace outcome

/**
 * Terminal result of one item. Every alternative maps to exactly one
 * terminal ItemStatus.
 */
using Outcome = std::variant<outcome::Success, outcome::AlreadyComplete, outcome::Failed, outcome::Cancelled>;

ItemStatus statusOf(const Outcome &outcome);

} // namespace bulkdl
