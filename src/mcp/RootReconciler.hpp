// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ConnectionSupervisor.hpp>
#include <mcp/HostBridge.hpp>
#include <mcp/ServerRegistry.hpp>

#include <functional>
#include <string>
#include <vector>

namespace vaultlink
{

struct ReconcilerOptions
{
    /// If the working directory contains this marker, fallbackRoot is taken as the root.
    std::string cwdMarker;
    std::string fallbackRoot;

    /// Servers whose id contains this marker get their root from the working directory only,
    /// their VAULT_PATH environment entry is removed on restart.
    std::string envlessMarker = "vault-";
};

/// @brief Result of a coordinated restart.
struct RestartReport
{
    std::string rootPath;
    std::vector<ServerOutcome> stopped;
    std::vector<ServerOutcome> started;
};

/// @brief The root one session is bound to, compared with the current root.
struct RootCheck
{
    std::string serverId;
    std::string boundRoot; ///< working_dir, else the VAULT_PATH env entry, else empty.
    bool correct = false;
    ConnectionStatus status = ConnectionStatus::Disconnected;
};

/// @brief Detects sessions bound to a stale root and restarts the built-in servers against the current one.
class RootReconciler
{
  public:
    /// Returns the path held in memory by the application, or an empty string.
    using PathProvider = std::function<std::string()>;

    RootReconciler(HostBridge& host,
                   ConnectionSupervisor& supervisor,
                   const ServerRegistry& registry,
                   PathProvider currentRoot,
                   PathProvider bundlePath,
                   ReconcilerOptions options = {});

    /// @brief Resolves the current root: in-memory value, then the host's vault info,
    ///        then the host's working directory.
    [[nodiscard]] auto resolveCurrentRoot() -> Result<std::string>;

    /// @brief Kills all server processes and reconnects the enabled built-in servers against the current root.
    [[nodiscard]] auto forceRestartWithCurrentRoot() -> Result<RestartReport>;

    [[nodiscard]] auto verifyRootPaths() -> Result<std::vector<RootCheck>>;

  private:
    HostBridge& _host;
    ConnectionSupervisor& _supervisor;
    const ServerRegistry& _registry;
    PathProvider _currentRoot;
    PathProvider _bundlePath;
    ReconcilerOptions _options;
};

} // namespace vaultlink
