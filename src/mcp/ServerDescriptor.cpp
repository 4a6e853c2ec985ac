// SPDX-License-Identifier: Apache-2.0
#include "ServerDescriptor.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace vaultlink
{

namespace
{

    auto optionalString(const nlohmann::json& obj, std::string_view key) -> std::optional<std::string>
    {
        auto const keyStr = std::string(key);
        if (obj.contains(keyStr) && obj[keyStr].is_string())
            return obj[keyStr].get<std::string>();
        return std::nullopt;
    }

    /// @brief Parses a transport from an object that carries the transport fields directly.
    auto transportFromFields(std::string_view id, const nlohmann::json& fields) -> Result<TransportSpec>
    {
        auto type = json::getStringOr(fields, "type", "");
        if (type.empty())
        {
            auto const hasUrl = fields.contains("url");
            auto const hasCommand = fields.contains("command");
            if (hasUrl && hasCommand)
                return makeError(ErrorCode::InvalidArgument,
                                 std::format("Server '{}' has both a command and a url", id));
            if (!hasUrl && !hasCommand)
                return makeError(ErrorCode::InvalidArgument,
                                 std::format("Server '{}' has neither a command nor a url", id));
            type = hasUrl ? "http" : "stdio";
        }

        if (type == "stdio")
        {
            auto command = json::getString(fields, "command");
            if (!command)
                return makeError(ErrorCode::InvalidArgument,
                                 std::format("Server '{}': stdio transport needs a command", id));

            return StdioTransport {
                .command = std::move(*command),
                .args = json::getStringList(fields, "args"),
                .env = json::getStringMap(fields, "env"),
                .workingDir = optionalString(fields, "working_dir"),
            };
        }

        if (type == "http" || type == "sse")
        {
            auto url = json::getString(fields, "url");
            if (!url)
                return makeError(ErrorCode::InvalidArgument,
                                 std::format("Server '{}': http transport needs a url", id));

            auto apiKey = optionalString(fields, "api_key");
            if (!apiKey)
                apiKey = optionalString(fields, "apiKey");

            return HttpTransport {
                .url = std::move(*url),
                .headers = json::getStringMap(fields, "headers"),
                .apiKey = std::move(apiKey),
            };
        }

        return makeError(ErrorCode::InvalidArgument,
                         std::format("Server '{}' has unsupported transport type '{}'", id, type));
    }

} // namespace

auto transportTypeName(const TransportSpec& transport) -> std::string_view
{
    return std::holds_alternative<HttpTransport>(transport) ? "http" : "stdio";
}

auto descriptorFromJson(std::string_view id, const nlohmann::json& value) -> Result<ServerDescriptor>
{
    if (!value.is_object())
        return makeError(ErrorCode::InvalidArgument, std::format("Server '{}' is not a JSON object", id));

    auto const transportJson = value.contains("transport") && value["transport"].is_object()
                                   ? value["transport"]
                                   : value;

    auto transport = transportFromFields(id, transportJson);
    if (!transport)
        return std::unexpected(transport.error());

    auto descriptor = ServerDescriptor {};
    descriptor.id = json::getStringOr(value, "id", id);
    descriptor.name = json::getStringOr(value, "name", json::getStringOr(value, "displayName", descriptor.id));
    descriptor.description = json::getStringOr(value, "description", "");
    descriptor.enabled = json::getBoolOr(value, "enabled", false);
    descriptor.builtin = json::getBoolOr(value, "builtin", false);
    descriptor.transport = std::move(*transport);

    if (value.contains("capabilities") && value["capabilities"].is_object())
    {
        auto const& caps = value["capabilities"];
        descriptor.capabilities = ServerCapabilities {
            .tools = json::getBoolOr(caps, "tools", true),
            .resources = json::getBoolOr(caps, "resources", false),
            .prompts = json::getBoolOr(caps, "prompts", false),
            .sampling = json::getBoolOr(caps, "sampling", false),
        };
    }

    if (value.contains("permissions") && value["permissions"].is_object())
    {
        auto const& perms = value["permissions"];
        descriptor.permissions = ServerPermissions {
            .read = json::getBoolOr(perms, "read", true),
            .write = json::getBoolOr(perms, "write", false),
            .remove = json::getBoolOr(perms, "delete", false),
            .externalAccess = json::getBoolOr(perms, "external_access", false),
        };
    }

    return descriptor;
}

auto transportToJson(const TransportSpec& transport) -> nlohmann::json
{
    if (auto const* http = std::get_if<HttpTransport>(&transport))
    {
        auto out = nlohmann::json {
            { "type", "http" },
            { "url", http->url },
            { "headers", http->headers },
        };
        if (http->apiKey)
            out["api_key"] = *http->apiKey;
        return out;
    }

    auto const& stdio = std::get<StdioTransport>(transport);
    auto out = nlohmann::json {
        { "type", "stdio" },
        { "command", stdio.command },
        { "args", stdio.args },
        { "env", nlohmann::json(stdio.env) },
    };
    if (stdio.workingDir)
        out["working_dir"] = *stdio.workingDir;
    return out;
}

auto descriptorToJson(const ServerDescriptor& descriptor) -> nlohmann::json
{
    return nlohmann::json {
        { "id", descriptor.id },
        { "name", descriptor.name },
        { "description", descriptor.description },
        { "enabled", descriptor.enabled },
        { "builtin", descriptor.builtin },
        { "transport", transportToJson(descriptor.transport) },
        { "capabilities",
          {
              { "tools", descriptor.capabilities.tools },
              { "resources", descriptor.capabilities.resources },
              { "prompts", descriptor.capabilities.prompts },
              { "sampling", descriptor.capabilities.sampling },
          } },
        { "permissions",
          {
              { "read", descriptor.permissions.read },
              { "write", descriptor.permissions.write },
              { "delete", descriptor.permissions.remove },
              { "external_access", descriptor.permissions.externalAccess },
          } },
    };
}

} // namespace vaultlink
