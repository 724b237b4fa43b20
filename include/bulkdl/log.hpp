#pragma once

#include <string>
#include <utility>

#include <fmt/core.h>

namespace bulkdl::log
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error
};

void setLevel(Level level);
Level level();

/**
 * Write one line to stderr as "<timestamp> [LEVEL] message".
 * Lines from different threads never interleave.
 */
void write(Level level, const std::string &message);

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args &&...args)
{
    if (level() <= Level::Debug)
    {
        write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args &&...args)
{
    if (level() <= Level::Info)
    {
        write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args &&...args)
{
    if (level() <= Level::Warn)
    {
        write(Level::Warn, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args &&...args)
{
    if (level() <= Level::Error)
    {
        write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
    }
}

} // namespace bulkdl::log
