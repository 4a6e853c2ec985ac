// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HostBridge.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace vaultlink
{

/// @brief Settings of the in-process host.
struct LocalHostConfig
{
    std::string rootPath;     ///< Reported by get_vault_info; empty means no vault is open.
    std::string bundlePath;   ///< Reported by get_bundle_path; empty means the executable's directory.
    std::string settingsPath; ///< JSON file backing get_mcp_settings / save_mcp_settings.
    std::chrono::milliseconds handshakeTimeout { 10'000 };
    std::chrono::milliseconds responseTimeout { 30'000 };
};

/// @brief HostBridge implementation that runs stdio tool servers as child processes of this process.
///
/// Each server is spawned with pipes for stdin and stdout and speaks newline-delimited JSON-RPC.
/// A reader thread per server completes outstanding send_mcp_message calls and emits every
/// other message as an mcp-message-<id> event. Events are delivered on the reader thread,
/// except mcp-server-connected-<id> which is emitted by the start_mcp_server call.
class LocalHost: public HostBridge
{
  public:
    explicit LocalHost(LocalHostConfig config);
    ~LocalHost() override;

    LocalHost(const LocalHost&) = delete;
    LocalHost& operator=(const LocalHost&) = delete;

    [[nodiscard]] auto invoke(std::string_view command, const nlohmann::json& args)
        -> Result<nlohmann::json> override;

    [[nodiscard]] auto subscribe(std::string_view eventName, HostEventHandler handler) -> Unsubscribe override;

    /// @brief Changes the root reported by get_vault_info.
    void setRootPath(std::string rootPath);

    /// @brief Returns the ids of servers whose process is alive.
    [[nodiscard]] auto runningServers() const -> std::vector<std::string>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace vaultlink
