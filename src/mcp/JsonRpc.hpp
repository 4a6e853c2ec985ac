// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vaultlink::jsonrpc
{

/// @brief Protocol version announced in the initialize handshake and HTTP headers.
inline constexpr auto ProtocolVersion = std::string_view { "2025-06-18" };

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
///
/// A string error is taken as the error message; an error object without a message
/// reads as "Unknown error".
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Returns the integer id of a message, if it carries one.
///
/// Zero and non-integer ids are treated as absent, matching how requests without
/// an id get one assigned.
[[nodiscard]] auto integerId(const nlohmann::json& message) -> std::optional<int64_t>;

/// @brief Returns true if the message is a response (has an id and a result or error, no method).
[[nodiscard]] auto isResponse(const nlohmann::json& message) -> bool;

} // namespace vaultlink::jsonrpc
