// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/HostBridge.hpp>
#include <mcp/ServerDescriptor.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace vaultlink
{

/// @brief Default time a request may wait for its response.
inline constexpr auto DefaultRequestTimeout = std::chrono::milliseconds { 30'000 };

/// @brief One JSON-RPC 2.0 conversation with one tool server, carried over the host.
///
/// Requests are correlated with responses by integer id. A response can arrive either as the
/// reply of the host's send call or later through deliver(); whichever comes first completes
/// the request. Requests that see neither within the timeout fail with ErrorCode::Timeout.
///
/// All member functions are thread-safe. Calls block the calling thread only.
class RpcSession
{
  public:
    /// @brief Constructs a session for one server.
    /// @param host The host that carries the traffic. Must outlive the session.
    /// @param descriptor The descriptor the server was started with.
    /// @param requestTimeout How long a request may wait for its response.
    RpcSession(HostBridge& host,
               ServerDescriptor descriptor,
               std::chrono::milliseconds requestTimeout = DefaultRequestTimeout);

    /// @brief Closes the session and waits until no host call issued by it is still running.
    ~RpcSession();

    RpcSession(const RpcSession&) = delete;
    RpcSession& operator=(const RpcSession&) = delete;

    /// @brief Sends a request built from @p method and @p params.
    /// @return The full response message. Error responses fail with ErrorCode::ProtocolError.
    [[nodiscard]] auto call(std::string_view method, nlohmann::json params = nullptr) -> Result<nlohmann::json>;

    /// @brief Sends a prepared request message, assigning an id if it has none.
    [[nodiscard]] auto request(nlohmann::json message) -> Result<nlohmann::json>;

    /// @brief Sends a notification (no id, no response bookkeeping).
    [[nodiscard]] auto notify(std::string_view method, nlohmann::json params = nullptr) -> VoidResult;

    /// @brief Routes an inbound message from the server.
    ///
    /// Completes the matching pending request, if any. Anything else is treated as a
    /// server-initiated message and only logged.
    void deliver(const nlohmann::json& message);

    /// @brief Fails every pending request with ErrorCode::Disconnected. Idempotent.
    void close();

    [[nodiscard]] auto isClosed() const -> bool;
    [[nodiscard]] auto pendingCount() const -> std::size_t;
    [[nodiscard]] auto serverId() const -> const std::string&;
    [[nodiscard]] auto descriptor() const -> const ServerDescriptor&;

  private:
    struct State;
    std::shared_ptr<State> _state;
    ServerDescriptor _descriptor;
    std::chrono::milliseconds _requestTimeout;
};

} // namespace vaultlink
