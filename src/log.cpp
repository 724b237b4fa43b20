#include "bulkdl/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace bulkdl::log
{

namespace
{

std::atomic<Level> currentLevel{Level::Info};
std::mutex writeMutex;

const char *levelToString(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

std::string currentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return fmt::format("{}.{:03}", buffer, ms.count());
}

} // namespace

void setLevel(Level level)
{
    currentLevel.store(level);
}

Level level()
{
    return currentLevel.load();
}

void write(Level level, const std::string &message)
{
    std::string timestamp = currentTimestamp();

    std::lock_guard<std::mutex> lock(writeMutex);
    fmt::print(stderr, "{} [{}] {}\n", timestamp, levelToString(level), message);
    std::fflush(stderr);
}

} // namespace bulkdl::log
