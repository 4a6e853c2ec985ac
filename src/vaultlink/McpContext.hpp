// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ConfigGenerator.hpp>
#include <mcp/ConnectionSupervisor.hpp>
#include <mcp/HostBridge.hpp>
#include <mcp/RootReconciler.hpp>
#include <mcp/ServerRegistry.hpp>
#include <mcp/SettingsStore.hpp>
#include <mcp/StatusChannel.hpp>
#include <mcp/ToolRouter.hpp>

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace vaultlink
{

struct McpContextOptions
{
    std::string rootPath;
    std::string bundlePath; ///< Empty means "ask the host".
    SupervisorTimings timings;
    ReconcilerOptions reconciler;
};

/// @brief Owns every component of the integration layer for one process.
///
/// Constructed once in main and passed by reference to whatever needs it. The registry and
/// the settings blob are edited in memory and persisted with saveSettings().
class McpContext
{
  public:
    McpContext(HostBridge& host, McpContextOptions options);

    McpContext(const McpContext&) = delete;
    McpContext& operator=(const McpContext&) = delete;

    /// @brief Loads the settings blob and the registry embedded in it.
    [[nodiscard]] auto loadSettings() -> VoidResult;

    /// @brief Embeds the registry into the settings blob and persists it.
    [[nodiscard]] auto saveSettings() -> VoidResult;

    /// @brief Registers a user server, enabled, in both the registry and the settings blob.
    [[nodiscard]] auto addServer(ServerDescriptor descriptor) -> VoidResult;

    /// @brief Removes a user server. Built-in servers can only be disabled.
    [[nodiscard]] auto removeServer(std::string_view id) -> VoidResult;

    /// @brief Enables or disables a built-in or user server.
    [[nodiscard]] auto setServerEnabled(std::string_view id, bool enabled) -> VoidResult;

    /// @brief Returns the descriptor @p id would be started with under the current root.
    [[nodiscard]] auto boundDescriptor(std::string_view id) -> Result<ServerDescriptor>;

    /// @brief Connects a single server, enabled or not.
    [[nodiscard]] auto connectServer(std::string_view id) -> VoidResult;

    /// @brief Connects every enabled server under the current root.
    [[nodiscard]] auto startServers() -> Result<std::vector<ServerOutcome>>;

    /// @brief Returns the current root, asking the reconciler if none is set yet.
    [[nodiscard]] auto resolveRoot() -> Result<std::string>;

    /// @brief Returns the bundle path, asking the host once if none was configured.
    [[nodiscard]] auto bundlePath() -> std::string;

    [[nodiscard]] auto rootPath() const -> std::string;
    void setRootPath(std::string rootPath);

    [[nodiscard]] auto host() noexcept -> HostBridge& { return _host; }
    [[nodiscard]] auto statusChannel() noexcept -> StatusChannel& { return _statusChannel; }
    [[nodiscard]] auto registry() noexcept -> ServerRegistry& { return _registry; }
    [[nodiscard]] auto settings() noexcept -> McpSettings& { return _settings; }
    [[nodiscard]] auto supervisor() noexcept -> ConnectionSupervisor& { return _supervisor; }
    [[nodiscard]] auto generator() noexcept -> ConfigGenerator& { return _generator; }
    [[nodiscard]] auto reconciler() noexcept -> RootReconciler& { return _reconciler; }
    [[nodiscard]] auto router() noexcept -> ToolRouter& { return _router; }

  private:
    HostBridge& _host;

    mutable std::mutex _pathMutex;
    std::string _rootPath;
    std::string _bundlePath;

    StatusChannel _statusChannel;
    ServerRegistry _registry;
    McpSettings _settings;
    SettingsStore _settingsStore;
    ConnectionSupervisor _supervisor;
    ConfigGenerator _generator;
    RootReconciler _reconciler;
    ToolRouter _router;
};

} // namespace vaultlink
