// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <chrono>
#include <fstream>
#include <mutex>
#include <print>
#include <string>

namespace toolbridge::log
{

namespace
{
    auto globalLevel = Level::Info;
    auto globalCallback = LogCallback {};
    auto globalFile = std::ofstream {};
    auto globalMutex = std::mutex {};

    constexpr auto levelPrefix(Level level) -> std::string_view
    {
        switch (level)
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
    auto const lock = std::lock_guard { globalMutex };
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

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto openFile(std::string_view path) -> bool
{
    auto const lock = std::lock_guard { globalMutex };
    globalFile = std::ofstream(std::string(path), std::ios::app);
    return globalFile.is_open();
}

void closeFile()
{
    auto const lock = std::lock_guard { globalMutex };
    globalFile.close();
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto const lock = std::lock_guard { globalMutex };

    if (globalFile.is_open())
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::println(globalFile, "{:%F %T} [{}] {}", now, levelPrefix(level), message);
        globalFile.flush();
    }

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace toolbridge::log
