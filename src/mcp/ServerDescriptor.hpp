// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vaultlink
{

/// @brief Transport for a server that runs as a local child process speaking over stdio.
struct StdioTransport
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> workingDir;

    auto operator==(const StdioTransport&) const -> bool = default;
};

/// @brief Transport for a remote server reached over HTTP/SSE.
struct HttpTransport
{
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::string> apiKey; ///< Bearer credential, turned into an Authorization header on connect.

    auto operator==(const HttpTransport&) const -> bool = default;
};

/// @brief Exactly one transport shape per descriptor.
using TransportSpec = std::variant<StdioTransport, HttpTransport>;

/// @brief What the server is expected to offer.
struct ServerCapabilities
{
    bool tools = true;
    bool resources = false;
    bool prompts = false;
    bool sampling = false;

    auto operator==(const ServerCapabilities&) const -> bool = default;
};

/// @brief What the server is allowed to do.
struct ServerPermissions
{
    bool read = true;
    bool write = false;
    bool remove = false;
    bool externalAccess = false;

    auto operator==(const ServerPermissions&) const -> bool = default;
};

/// @brief Declarative description of how to reach one tool server and what to allow it.
struct ServerDescriptor
{
    std::string id;
    std::string name;
    std::string description;
    bool enabled = false;
    TransportSpec transport = StdioTransport {};
    ServerCapabilities capabilities;
    ServerPermissions permissions;
    bool builtin = false;

    /// @brief Returns the stdio transport, or nullptr for an http descriptor.
    [[nodiscard]] auto stdio() -> StdioTransport* { return std::get_if<StdioTransport>(&transport); }
    [[nodiscard]] auto stdio() const -> const StdioTransport*
    {
        return std::get_if<StdioTransport>(&transport);
    }

    /// @brief Returns the http transport, or nullptr for a stdio descriptor.
    [[nodiscard]] auto http() -> HttpTransport* { return std::get_if<HttpTransport>(&transport); }
    [[nodiscard]] auto http() const -> const HttpTransport*
    {
        return std::get_if<HttpTransport>(&transport);
    }

    auto operator==(const ServerDescriptor&) const -> bool = default;
};

/// @brief Returns "stdio" or "http".
[[nodiscard]] auto transportTypeName(const TransportSpec& transport) -> std::string_view;

/// @brief Parses a descriptor from JSON.
///
/// Accepts the nested shape (`{"transport": {"type": ...}}`) as well as the flat shape
/// user-added servers are stored in (`{"type", "command", "args", "env", "url"}`).
/// @param id The server id; used when the JSON carries no "id" field.
/// @param value The JSON to parse.
/// @return The descriptor or an InvalidArgument error.
[[nodiscard]] auto descriptorFromJson(std::string_view id, const nlohmann::json& value)
    -> Result<ServerDescriptor>;

/// @brief Serializes a descriptor to the nested JSON shape.
[[nodiscard]] auto descriptorToJson(const ServerDescriptor& descriptor) -> nlohmann::json;

/// @brief Serializes only the transport, in the shape the host expects ("type" tagged).
[[nodiscard]] auto transportToJson(const TransportSpec& transport) -> nlohmann::json;

} // namespace vaultlink
