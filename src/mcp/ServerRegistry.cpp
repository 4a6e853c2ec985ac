// SPDX-License-Identifier: Apache-2.0
#include "ServerRegistry.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace vaultlink
{

auto expandString(std::string_view input, const ExpansionVars& vars) -> std::string
{
    auto output = std::string {};
    output.reserve(input.size());

    auto pos = std::size_t { 0 };
    while (pos < input.size())
    {
        auto const open = input.find("${", pos);
        if (open == std::string_view::npos)
            break;

        output.append(input.substr(pos, open - pos));

        // Only a complete ${NAME} of a known variable is replaced. Anything else is kept
        // literally and scanning resumes right after the '$'.
        auto const rest = input.substr(open + 2);
        auto const match = std::ranges::find_if(vars, [rest](const auto& var) {
            return rest.starts_with(var.first) && rest.substr(var.first.size()).starts_with('}');
        });
        if (match == vars.end())
        {
            output.push_back('$');
            pos = open + 1;
            continue;
        }

        output.append(match->second);
        pos = open + 2 + match->first.size() + 1;
    }

    output.append(input.substr(std::min(pos, input.size())));
    return output;
}

auto ServerRegistry::addUserServer(std::string_view id, ServerDescriptor descriptor) -> VoidResult
{
    if (_userServers.contains(id))
        return makeError(ErrorCode::DuplicateName, std::format("Server name already exists: {}", id));

    descriptor.builtin = false;
    descriptor.id = std::string(id);

    _userServers.emplace(std::string(id), std::move(descriptor));
    log::debug("Registered user server '{}'", id);
    return {};
}

void ServerRegistry::removeUserServer(std::string_view id)
{
    auto const it = _userServers.find(id);
    if (it == _userServers.end())
        return;

    _userServers.erase(it);
    if (auto const enabled = _enabledServers.find(id); enabled != _enabledServers.end())
        _enabledServers.erase(enabled);
}

void ServerRegistry::setServerEnabled(std::string_view id, bool enabled)
{
    if (enabled)
    {
        _enabledServers.emplace(id);
        return;
    }

    if (auto const it = _enabledServers.find(id); it != _enabledServers.end())
        _enabledServers.erase(it);
}

auto ServerRegistry::isEnabled(std::string_view id) const -> bool
{
    return _enabledServers.contains(id);
}

auto ServerRegistry::hasUserServer(std::string_view id) const -> bool
{
    return _userServers.contains(id);
}

auto ServerRegistry::enabledIds() const -> const IdSet&
{
    return _enabledServers;
}

auto ServerRegistry::userServers() const -> const ServerMap&
{
    return _userServers;
}

auto ServerRegistry::getEnabledServers() const -> ServerMap
{
    auto enabled = ServerMap {};
    for (const auto& [id, descriptor]: _userServers)
    {
        if (_enabledServers.contains(id))
            enabled.emplace(id, descriptor);
    }
    return enabled;
}

auto ServerRegistry::expand(const ServerDescriptor& descriptor, const ExpansionVars& vars) -> ServerDescriptor
{
    auto expanded = descriptor;

    if (auto* stdio = expanded.stdio())
    {
        stdio->command = expandString(stdio->command, vars);
        for (auto& arg: stdio->args)
            arg = expandString(arg, vars);
        for (auto& [key, value]: stdio->env)
            value = expandString(value, vars);
    }

    return expanded;
}

auto ServerRegistry::toJson() const -> nlohmann::json
{
    auto servers = nlohmann::json::object();
    for (const auto& [id, descriptor]: _userServers)
        servers[id] = descriptorToJson(descriptor);

    auto enabled = nlohmann::json::array();
    for (const auto& id: _enabledServers)
        enabled.push_back(id);

    return nlohmann::json {
        { "userServers", std::move(servers) },
        { "enabledServers", std::move(enabled) },
    };
}

auto ServerRegistry::fromJson(const nlohmann::json& value) -> Result<ServerRegistry>
{
    if (!value.is_object())
        return makeError(ErrorCode::InvalidArgument, "Server registry must be a JSON object");

    auto registry = ServerRegistry {};

    if (value.contains("userServers") && value["userServers"].is_object())
    {
        for (const auto& [id, serverJson]: value["userServers"].items())
        {
            auto descriptor = descriptorFromJson(id, serverJson);
            if (!descriptor)
            {
                log::warning("Skipping stored server '{}': {}", id, descriptor.error().message);
                continue;
            }
            descriptor->id = id;
            descriptor->builtin = false;
            registry._userServers.emplace(id, std::move(*descriptor));
        }
    }

    if (value.contains("enabledServers") && value["enabledServers"].is_array())
    {
        for (const auto& id: value["enabledServers"])
        {
            if (id.is_string())
                registry._enabledServers.emplace(id.get<std::string>());
        }
    }

    return registry;
}

} // namespace vaultlink
