#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "bulkdl/config.hpp"
#include "bulkdl/progress.hpp"

namespace bulkdl
{

std::string formatBytes(std::uint64_t bytes);
std::string formatDuration(long seconds);

/**
 * Line-oriented progress output for the command-line tool.
 *
 * On a terminal a single status line is rewritten in place, at most 5 times
 * per second; otherwise a plain line is printed at most once per second.
 * Finished items are reported on their own line when per-item progress is
 * visible, including items cancelled before they were started.
 */
class ConsoleRenderer : public ProgressObserver
{
public:
    /**
     * @param names Display name per item, indexed by ItemId
     */
    ConsoleRenderer(const std::vector<std::string> &names, ProgressVisibility visibility, bool clearOnFinish,
                    std::FILE *out = stdout);

    void itemStarted(ItemId id, const std::string &name) override;
    void itemPositioned(ItemId id, std::uint64_t offset, std::optional<std::uint64_t> total) override;
    void itemProgress(ItemId id, std::uint64_t bytesDelta, std::optional<std::uint64_t> total) override;
    void itemFinished(ItemId id, ItemStatus status) override;
    void allFinished(const AggregateProgress &aggregate) override;

private:
    struct Item
    {
        std::string name;
        std::uint64_t bytes = 0;
        std::optional<std::uint64_t> total;
    };

    bool showItems() const;
    bool showAggregate() const;

    void draw();
    void clearLine();
    std::string itemLine(const Item &item) const;
    std::string aggregateLine(std::uint64_t bytes, std::optional<std::uint64_t> total) const;
    std::string speed() const;

    ProgressVisibility visibility_;
    bool clearOnFinish_;
    std::FILE *out_;
    bool isTerminal_;

    std::vector<Item> items_;
    std::size_t finished_ = 0;
    ItemId current_ = 0;
    std::uint64_t sessionBytes_ = 0; // Received during this run, for the speed

    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point lastDraw_;
    bool lineDrawn_ = false;
};

} // namespace bulkdl
