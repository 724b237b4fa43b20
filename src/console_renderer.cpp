#include "console_renderer.hpp"

#include <unistd.h>

#include <fmt/core.h>

namespace bulkdl
{

namespace
{

std::string makeBar(double percentage, int width)
{
    int filled = static_cast<int>((percentage / 100.0) * width);
    std::string bar = "[";
    for (int i = 0; i < width; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";
    return bar;
}

double percentOf(std::uint64_t bytes, std::uint64_t total)
{
    if (total == 0)
    {
        return 100.0;
    }
    return (static_cast<double>(bytes) / static_cast<double>(total)) * 100.0;
}

} // namespace

std::string formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    auto value = static_cast<double>(bytes);
    if (value >= GB)
    {
        return fmt::format("{:.2f} GB", value / GB);
    }
    else if (value >= MB)
    {
        return fmt::format("{:.2f} MB", value / MB);
    }
    else if (value >= KB)
    {
        return fmt::format("{:.2f} KB", value / KB);
    }
    else
    {
        return fmt::format("{} B", bytes);
    }
}

std::string formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        return fmt::format("{}m {}s", seconds / 60, seconds % 60);
    }
    else
    {
        return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
    }
}

ConsoleRenderer::ConsoleRenderer(const std::vector<std::string> &names, ProgressVisibility visibility,
                                 bool clearOnFinish, std::FILE *out)
    : visibility_(visibility),
      clearOnFinish_(clearOnFinish),
      out_(out),
      isTerminal_(::isatty(fileno(out))),
      items_(names.size()),
      start_(std::chrono::steady_clock::now()),
      lastDraw_(start_)
{
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        items_[i].name = names[i];
    }
}

bool ConsoleRenderer::showItems() const
{
    return visibility_ == ProgressVisibility::PerItem || visibility_ == ProgressVisibility::Both;
}

bool ConsoleRenderer::showAggregate() const
{
    return visibility_ == ProgressVisibility::Aggregate || visibility_ == ProgressVisibility::Both;
}

void ConsoleRenderer::itemStarted(ItemId id, const std::string &name)
{
    items_.at(id).name = name;
    current_ = id;
}

void ConsoleRenderer::itemPositioned(ItemId id, std::uint64_t offset, std::optional<std::uint64_t> total)
{
    Item &item = items_.at(id);
    item.bytes = offset;
    item.total = total;
    current_ = id;
}

void ConsoleRenderer::itemProgress(ItemId id, std::uint64_t bytesDelta, std::optional<std::uint64_t> total)
{
    Item &item = items_.at(id);
    item.bytes += bytesDelta;
    item.total = total;
    sessionBytes_ += bytesDelta;
    current_ = id;
    draw();
}

void ConsoleRenderer::itemFinished(ItemId id, ItemStatus status)
{
    ++finished_;
    if (!showItems())
    {
        draw();
        return;
    }

    const Item &item = items_.at(id);
    const char *mark = (status == ItemStatus::Success || status == ItemStatus::AlreadyComplete) ? "✓" : "✗";
    clearLine();
    fmt::print(out_, "{} {} {} ({})\n", mark, item.name, toString(status), formatBytes(item.bytes));
    std::fflush(out_);
}

void ConsoleRenderer::allFinished(const AggregateProgress &aggregate)
{
    if (visibility_ == ProgressVisibility::Hidden)
    {
        return;
    }

    clearLine();
    if (!clearOnFinish_ && showAggregate())
    {
        fmt::print(out_, "{}\n", aggregateLine(aggregate.bytes, aggregate.total));
    }
    std::fflush(out_);
}

std::string ConsoleRenderer::speed() const
{
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_);
    double seconds = static_cast<double>(elapsed.count()) / 1000.0;
    double rate = seconds > 0.0 ? static_cast<double>(sessionBytes_) / seconds : 0.0;

    if (rate >= 1024 * 1024)
    {
        return fmt::format("{:.2f} MB/s", rate / (1024.0 * 1024.0));
    }
    else if (rate >= 1024)
    {
        return fmt::format("{:.2f} KB/s", rate / 1024.0);
    }
    return fmt::format("{:.0f} B/s", rate);
}

std::string ConsoleRenderer::itemLine(const Item &item) const
{
    if (!item.total)
    {
        return fmt::format("{}: {}", item.name, formatBytes(item.bytes));
    }
    double percentage = percentOf(item.bytes, *item.total);
    return fmt::format("{}: {} {:.1f}% | {} / {}", item.name, makeBar(percentage, 20), percentage,
                       formatBytes(item.bytes), formatBytes(*item.total));
}

std::string ConsoleRenderer::aggregateLine(std::uint64_t bytes, std::optional<std::uint64_t> total) const
{
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start_);
    std::string items = fmt::format("{}/{} items", finished_, items_.size());
    if (!total)
    {
        return fmt::format("Total: {} | {} | {} | Elapsed: {}", formatBytes(bytes), items, speed(),
                           formatDuration(static_cast<long>(elapsed.count())));
    }
    double percentage = percentOf(bytes, *total);
    return fmt::format("Total: {} {:.1f}% | {} / {} | {} | {} | Elapsed: {}", makeBar(percentage, 30), percentage,
                       formatBytes(bytes), formatBytes(*total), items, speed(),
                       formatDuration(static_cast<long>(elapsed.count())));
}

void ConsoleRenderer::draw()
{
    if (visibility_ == ProgressVisibility::Hidden || items_.empty())
    {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    auto sinceLast = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastDraw_).count();

    // Update at most 5 times per second on a terminal, once per second otherwise
    if (sinceLast < (isTerminal_ ? 200 : 1000))
    {
        return;
    }
    lastDraw_ = now;

    std::string line;
    if (showAggregate())
    {
        std::uint64_t bytes = 0;
        std::uint64_t total = 0;
        bool totalKnown = true;
        for (const auto &item : items_)
        {
            bytes += item.bytes;
            if (item.total)
            {
                total += *item.total;
            }
            else
            {
                totalKnown = false;
            }
        }
        line = aggregateLine(bytes, totalKnown ? std::optional<std::uint64_t>(total) : std::nullopt);
    }
    if (showItems())
    {
        line += line.empty() ? itemLine(items_.at(current_)) : " | " + itemLine(items_.at(current_));
    }

    if (isTerminal_)
    {
        fmt::print(out_, "\r{}\033[K", line);
        lineDrawn_ = true;
    }
    else
    {
        fmt::print(out_, "{}\n", line);
    }
    std::fflush(out_);
}

void ConsoleRenderer::clearLine()
{
    if (lineDrawn_)
    {
        fmt::print(out_, "\r\033[K");
        lineDrawn_ = false;
    }
}

} // namespace bulkdl
