// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace vaultlink
{

/// @brief Handler for an event emitted by the host. Receives the event payload.
using HostEventHandler = std::function<void(const nlohmann::json& payload)>;

/// @brief Removes the subscription it was returned for. Calling it more than once is harmless.
using Unsubscribe = std::function<void()>;

/// @brief Abstract interface to the privileged host process.
///
/// The host owns the actual server processes and HTTP connections. Calls block until the
/// host answers; events may be delivered on any thread.
class HostBridge
{
  public:
    virtual ~HostBridge() = default;

    /// @brief Performs a host call.
    /// @param command The host command name (e.g. "start_mcp_server").
    /// @param args The command arguments as a JSON object.
    /// @return The command's result or an error.
    [[nodiscard]] virtual auto invoke(std::string_view command, const nlohmann::json& args)
        -> Result<nlohmann::json> = 0;

    /// @brief Registers a handler for a named host event.
    /// @param eventName The event channel (e.g. "mcp-server-connected-<id>").
    /// @param handler The handler to invoke for each emitted event.
    /// @return A callable that removes the subscription.
    [[nodiscard]] virtual auto subscribe(std::string_view eventName, HostEventHandler handler)
        -> Unsubscribe = 0;
};

/// @brief Host command names used by this layer.
namespace host
{
    inline constexpr auto StartServer = std::string_view { "start_mcp_server" };
    inline constexpr auto StopServer = std::string_view { "stop_mcp_server" };
    inline constexpr auto SendMessage = std::string_view { "send_mcp_message" };
    inline constexpr auto ServerInfo = std::string_view { "get_mcp_server_info" };
    inline constexpr auto ServerStatuses = std::string_view { "get_mcp_server_statuses" };
    inline constexpr auto KillAllProcesses = std::string_view { "kill_all_mcp_processes" };
    inline constexpr auto VaultInfo = std::string_view { "get_vault_info" };
    inline constexpr auto CurrentDirectory = std::string_view { "get_current_directory" };
    inline constexpr auto HomeDir = std::string_view { "get_home_dir" };
    inline constexpr auto BundlePath = std::string_view { "get_bundle_path" };
    inline constexpr auto LoadSettings = std::string_view { "get_mcp_settings" };
    inline constexpr auto SaveSettings = std::string_view { "save_mcp_settings" };
    inline constexpr auto WriteFile = std::string_view { "write_file" };

    /// @brief Event channel names for one server.
    [[nodiscard]] inline auto connectedEvent(std::string_view serverId) -> std::string
    {
        return std::format("mcp-server-connected-{}", serverId);
    }

    [[nodiscard]] inline auto messageEvent(std::string_view serverId) -> std::string
    {
        return std::format("mcp-message-{}", serverId);
    }

    [[nodiscard]] inline auto stoppedEvent(std::string_view serverId) -> std::string
    {
        return std::format("mcp-server-stopped-{}", serverId);
    }
} // namespace host

} // namespace vaultlink
