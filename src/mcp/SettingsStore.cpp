// SPDX-License-Identifier: Apache-2.0
#include "SettingsStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace vaultlink
{

auto settingsFromJson(const nlohmann::json& value) -> Result<McpSettings>
{
    auto settings = McpSettings {};
    if (value.is_null())
        return settings;

    if (!value.is_object())
        return makeError(ErrorCode::ConfigError, "MCP settings must be a JSON object");

    settings.enabled = json::getBoolOr(value, "enabled", true);

    if (value.contains("servers") && value["servers"].is_object())
    {
        for (const auto& [id, serverJson]: value["servers"].items())
        {
            auto descriptor = descriptorFromJson(id, serverJson);
            if (!descriptor)
            {
                log::warning("Ignoring saved server '{}': {}", id, descriptor.error().message);
                continue;
            }
            settings.servers.emplace(id, std::move(*descriptor));
        }
    }

    if (value.contains("mcpServerRegistry") && value["mcpServerRegistry"].is_object())
        settings.registry = value["mcpServerRegistry"];

    return settings;
}

auto settingsToJson(const McpSettings& settings) -> nlohmann::json
{
    auto servers = nlohmann::json::object();
    for (const auto& [id, descriptor]: settings.servers)
        servers[id] = descriptorToJson(descriptor);

    auto out = nlohmann::json {
        { "enabled", settings.enabled },
        { "servers", std::move(servers) },
    };

    if (settings.registry)
        out["mcpServerRegistry"] = *settings.registry;

    return out;
}

auto stripWorkingDirs(McpSettings& settings) -> int
{
    auto stripped = 0;
    for (auto& [id, descriptor]: settings.servers)
    {
        auto* stdio = descriptor.stdio();
        if (stdio && stdio->workingDir)
        {
            log::debug("Clearing stale working_dir for server '{}'", id);
            stdio->workingDir.reset();
            ++stripped;
        }
    }
    return stripped;
}

SettingsStore::SettingsStore(HostBridge& host): _host(host)
{
}

auto SettingsStore::load() -> Result<McpSettings>
{
    auto blob = _host.invoke(host::LoadSettings, nlohmann::json::object());
    if (!blob)
        return std::unexpected(blob.error());

    auto settings = settingsFromJson(*blob);
    if (!settings)
        return std::unexpected(settings.error());

    if (auto const stripped = stripWorkingDirs(*settings); stripped > 0)
        log::info("Cleared {} persisted working director{}", stripped, stripped == 1 ? "y" : "ies");

    return settings;
}

auto SettingsStore::save(McpSettings settings) -> VoidResult
{
    stripWorkingDirs(settings);

    auto result = _host.invoke(host::SaveSettings, nlohmann::json { { "settings", settingsToJson(settings) } });
    if (!result)
        return std::unexpected(result.error());

    log::debug("MCP settings saved ({} servers)", settings.servers.size());
    return {};
}

auto SettingsStore::loadRegistry(const McpSettings& settings) -> ServerRegistry
{
    if (!settings.registry)
        return ServerRegistry {};

    auto registry = ServerRegistry::fromJson(*settings.registry);
    if (!registry)
    {
        log::warning("Stored server registry is invalid, starting empty: {}", registry.error().message);
        return ServerRegistry {};
    }
    return std::move(*registry);
}

void SettingsStore::storeRegistry(McpSettings& settings, const ServerRegistry& registry)
{
    settings.registry = registry.toJson();
}

} // namespace vaultlink
