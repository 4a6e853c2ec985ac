// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace vaultlink::log
{

/// @brief Verbosity level for log messages, most severe first.
enum class Level : std::uint8_t
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

[[nodiscard]] constexpr auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "unknown";
}

/// @brief Parses a level name as written by levelName(); "warn" is accepted as well.
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Receives every message that passes the level filter.
///
/// Calls are serialized; a sink never runs concurrently with itself.
using Sink = std::function<void(Level level, std::string_view message)>;

/// @brief Replaces the sink. An empty sink restores the stderr default.
/// @return The previously installed sink (empty if it was the default).
auto setSink(Sink sink) -> Sink;

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Delivers an already formatted message to the sink, if @p level is enabled.
void write(Level level, std::string_view message);

/// @brief Formats and writes; the arguments are not formatted when @p level is filtered out.
template <typename... Args>
void print(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Debug, fmt, std::forward<Args>(args)...);
}

/// @brief Logs wire-level detail such as raw JSON-RPC traffic.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    print(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace vaultlink::log
