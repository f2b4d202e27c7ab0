// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <fstream>
#include <mutex>
#include <ostream>
#include <print>
#include <string>

namespace supervox::log
{

namespace
{
    std::atomic<Level> globalLevel = Level::Info;

    // Guards the callback and the file sink; capture and worker threads may log concurrently.
    std::mutex sinkMutex;
    auto globalCallback = LogCallback {};
    auto fileSink = std::ofstream {};
    auto fileSinkPath = std::optional<std::filesystem::path> {};

    constexpr auto levelPrefix(Level l) -> std::string_view
    {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(sinkMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto upper = std::string(name);
    std::ranges::transform(upper, upper.begin(), [](unsigned char c) { return std::toupper(c); });

    if (upper == "ERROR")
        return Level::Error;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "INFO")
        return Level::Info;
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "TRACE")
        return Level::Trace;
    return std::nullopt;
}

auto openFile(const std::filesystem::path& path) -> VoidResult
{
    auto ec = std::error_code {};
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return makeError(
                ErrorCode::IoError,
                std::format("Failed to create log directory '{}': {}", path.parent_path().string(), ec.message()));
    }

    auto lock = std::lock_guard(sinkMutex);
    if (fileSink.is_open())
        fileSink.close();

    fileSink.open(path, std::ios::app);
    if (!fileSink.is_open())
    {
        fileSinkPath.reset();
        return makeError(ErrorCode::IoError, std::format("Cannot open log file: {}", path.string()));
    }

    fileSinkPath = path;
    return {};
}

void closeFile()
{
    auto lock = std::lock_guard(sinkMutex);
    if (fileSink.is_open())
        fileSink.close();
    fileSinkPath.reset();
}

auto currentFile() -> std::optional<std::filesystem::path>
{
    auto lock = std::lock_guard(sinkMutex);
    return fileSinkPath;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto lock = std::lock_guard(sinkMutex);

    if (fileSink.is_open())
    {
        auto const now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        std::println(fileSink, "{:%Y-%m-%d %H:%M:%S} | {} | {}", now, levelPrefix(level), message);
        fileSink.flush();
    }

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace supervox::log
