// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <cctype>
#include <mutex>
#include <print>
#include <string>

namespace vaultlink::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalSink = Sink {};
    auto sinkMutex = std::mutex {};

    void writeStderr(Level level, std::string_view message)
    {
        auto tag = std::string(levelName(level));
        for (auto& c: tag)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        std::println(stderr, "[vaultlink] [{}] {}", tag, message);
    }
} // namespace

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "warn")
        return Level::Warning;
    for (auto const level: { Level::Error, Level::Warning, Level::Info, Level::Debug, Level::Trace })
        if (levelName(level) == name)
            return level;
    return std::nullopt;
}

auto setSink(Sink sink) -> Sink
{
    auto const lock = std::lock_guard(sinkMutex);
    std::swap(globalSink, sink);
    return sink;
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto const lock = std::lock_guard(sinkMutex);
    if (globalSink)
        globalSink(level, message);
    else
        writeStderr(level, message);
}

} // namespace vaultlink::log
