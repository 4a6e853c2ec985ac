// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/HostBridge.hpp>
#include <mcp/RpcSession.hpp>
#include <mcp/ServerDescriptor.hpp>
#include <mcp/ServerRegistry.hpp>
#include <mcp/SettingsStore.hpp>
#include <mcp/StatusChannel.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace vaultlink
{

/// @brief Delays and timeouts used by the connection lifecycle.
struct SupervisorTimings
{
    std::chrono::milliseconds requestTimeout = DefaultRequestTimeout;
    std::chrono::milliseconds statusCheckDelay { 2'000 };   ///< Delay before re-querying a started server.
    std::chrono::milliseconds stopSettleDelay { 100 };      ///< Pause after the pre-connect stop.
    std::chrono::milliseconds restartSettleDelay { 2'000 }; ///< Pause between kill-all and reconnect.
};

/// @brief Owns the live sessions, their connection status and cached capabilities.
///
/// Host events may arrive on any thread. The maps are guarded by one mutex which is never
/// held across host calls or status notifications.
class ConnectionSupervisor
{
  public:
    using StatusMap = std::map<std::string, ConnectionStatus, std::less<>>;

    ConnectionSupervisor(HostBridge& host, StatusChannel& channel, SupervisorTimings timings = {});
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /// @brief Starts the server and opens a session for it.
    ///
    /// Returns success without doing anything if the server is already connecting or connected.
    /// The status becomes Connected once the host reports the server as up, either by event or
    /// by the delayed status check.
    [[nodiscard]] auto connect(std::string_view id, const ServerDescriptor& descriptor) -> VoidResult;

    /// @brief Stops the server and discards its session. Cleanup happens even if the host call fails.
    [[nodiscard]] auto disconnect(std::string_view id) -> VoidResult;

    /// @brief Disconnects every known server, collecting one outcome per server, then forgets all state.
    [[nodiscard]] auto disconnectAll() -> std::vector<ServerOutcome>;

    /// @brief Disconnects and connects again with the descriptor of the current session.
    [[nodiscard]] auto reconnect(std::string_view id) -> VoidResult;

    [[nodiscard]] auto invokeTool(std::string_view id, std::string_view toolName, const nlohmann::json& args)
        -> Result<nlohmann::json>;
    [[nodiscard]] auto readResource(std::string_view id, std::string_view uri) -> Result<nlohmann::json>;

    /// @brief Returns the server's tool list (a JSON array, possibly empty).
    [[nodiscard]] auto listTools(std::string_view id) -> Result<nlohmann::json>;

    /// @brief Returns the server's resource list (a JSON array, possibly empty).
    [[nodiscard]] auto listResources(std::string_view id) -> Result<nlohmann::json>;

    /// @brief Merges the host's view of all server statuses into the status map.
    [[nodiscard]] auto refreshStatuses() -> VoidResult;

    [[nodiscard]] auto serverInfo(std::string_view id) -> Result<nlohmann::json>;

    /// @brief Connects every enabled built-in and every enabled user server from @p settings.
    ///
    /// User stdio servers are bound to @p rootPath (working directory and VAULT_PATH).
    /// Failures are collected per server and never abort the loop.
    [[nodiscard]] auto startAllEnabled(std::string_view rootPath,
                                       std::string_view bundlePath,
                                       const McpSettings& settings,
                                       const ServerRegistry& registry) -> std::vector<ServerOutcome>;

    [[nodiscard]] auto status(std::string_view id) const -> ConnectionStatus;
    [[nodiscard]] auto statuses() const -> StatusMap;
    [[nodiscard]] auto capabilities(std::string_view id) const -> nlohmann::json;
    [[nodiscard]] auto connectedServers() const -> std::vector<std::string>;
    [[nodiscard]] auto sessionDescriptor(std::string_view id) const -> std::optional<ServerDescriptor>;
    [[nodiscard]] auto serverIds() const -> std::vector<std::string>;
    [[nodiscard]] auto timings() const noexcept -> const SupervisorTimings& { return _timings; }

    /// @brief Binds a stored user server to @p rootPath.
    ///
    /// Placeholders are expanded, the stdio working directory becomes the root and an
    /// existing VAULT_PATH env entry is overwritten with it.
    [[nodiscard]] static auto bindUserServer(std::string_view id,
                                             const ServerDescriptor& stored,
                                             std::string_view rootPath,
                                             std::string_view bundlePath) -> ServerDescriptor;

    /// @brief Builds the start_mcp_server config for @p descriptor.
    ///
    /// Http descriptors get the protocol headers and, if an API key is set, a bearer
    /// Authorization header; the key itself is not sent.
    [[nodiscard]] static auto toHostConfig(const ServerDescriptor& descriptor) -> nlohmann::json;

  private:
    struct StatusCheck
    {
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    void setStatus(std::string_view id, ConnectionStatus status, std::string error = {});
    auto subscribeEvents(const std::string& id) -> std::vector<Unsubscribe>;
    void onConnected(const std::string& id, const nlohmann::json& payload);
    void onMessage(const std::string& id, const nlohmann::json& payload);
    void scheduleStatusCheck(std::string id);
    void checkStatus(const std::string& id);
    void releaseSession(std::string_view id);
    auto sessionFor(std::string_view id) const -> std::shared_ptr<RpcSession>;
    auto request(std::string_view id, std::string_view method, nlohmann::json params, std::string_view failure)
        -> Result<nlohmann::json>;

    HostBridge& _host;
    StatusChannel& _channel;
    SupervisorTimings _timings;

    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<RpcSession>, std::less<>> _sessions;
    StatusMap _statuses;
    std::map<std::string, nlohmann::json, std::less<>> _capabilities;
    std::map<std::string, std::vector<Unsubscribe>, std::less<>> _subscriptions;

    std::mutex _checkMutex;
    std::condition_variable_any _checkCv;
    std::vector<StatusCheck> _statusChecks;
};

} // namespace vaultlink
