// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace vaultlink
{

/// @brief Connection state of one tool server as tracked by the supervisor.
enum class ConnectionStatus : std::uint8_t
{
    Disconnected,
    Connecting,
    Connected,
    Stopped,
    Error,
};

/// @brief Converts a ConnectionStatus to its string representation.
[[nodiscard]] constexpr auto statusToString(ConnectionStatus status) -> std::string_view
{
    switch (status)
    {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Stopped: return "stopped";
        case ConnectionStatus::Error: return "error";
    }
    return "unknown";
}

/// @brief Parses a status name as reported by the host.
///
/// The host spells some states differently ("Connected", "starting", "stopping"),
/// those are folded onto the nearest supervisor state.
/// @return The corresponding status, or ConnectionStatus::Disconnected if unknown.
[[nodiscard]] constexpr auto statusFromString(std::string_view str) -> ConnectionStatus
{
    if (str == "connected" || str == "Connected")
        return ConnectionStatus::Connected;
    if (str == "connecting" || str == "starting" || str == "Starting")
        return ConnectionStatus::Connecting;
    if (str == "stopped" || str == "stopping" || str == "Stopped")
        return ConnectionStatus::Stopped;
    if (str == "error" || str == "Error")
        return ConnectionStatus::Error;
    return ConnectionStatus::Disconnected;
}

/// @brief A status transition published to status subscribers.
struct StatusEvent
{
    std::string serverId;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::string error; // Empty unless status is Error
};

/// @brief Outcome of one item of a best-effort loop over many servers.
struct ServerOutcome
{
    std::string serverId;
    VoidResult result;

    [[nodiscard]] auto succeeded() const -> bool { return result.has_value(); }
};

} // namespace vaultlink
