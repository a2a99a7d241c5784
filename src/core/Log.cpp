// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <mutex>
#include <print>

namespace tailview::log
{

namespace
{
    auto globalLevel = Level::Info;
    auto globalCallback = LogCallback {};

    // The event reader logs from its own thread.
    auto globalMutex = std::mutex {};
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

auto parseLevel(std::string_view name) -> Result<Level>
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
    return makeError(ErrorCode::InvalidArgument, std::format("Unknown log level: {}", name));
}

auto levelTag(Level level) noexcept -> std::string_view
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

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto const lock = std::lock_guard { globalMutex };
    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "[{}] {}", levelTag(level), message);
}

} // namespace tailview::log
