// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/HostBridge.hpp>
#include <mcp/ServerDescriptor.hpp>
#include <mcp/ServerRegistry.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace vaultlink
{

/// @brief The persisted settings blob.
struct McpSettings
{
    bool enabled = true;
    std::map<std::string, ServerDescriptor, std::less<>> servers;
    std::optional<nlohmann::json> registry; ///< Serialized ServerRegistry ("mcpServerRegistry").
};

/// @brief Parses the settings blob. Server entries that fail to parse are skipped with a warning.
[[nodiscard]] auto settingsFromJson(const nlohmann::json& value) -> Result<McpSettings>;

/// @brief Serializes the settings blob.
[[nodiscard]] auto settingsToJson(const McpSettings& settings) -> nlohmann::json;

/// @brief Clears the working directory of every stdio server.
///
/// The working directory always comes from the current root at runtime and must never be persisted.
/// @return The number of entries that had one.
auto stripWorkingDirs(McpSettings& settings) -> int;

/// @brief Loads and saves the settings blob through the host.
class SettingsStore
{
  public:
    explicit SettingsStore(HostBridge& host);

    /// @brief Loads the settings; a host without stored settings yields the defaults.
    [[nodiscard]] auto load() -> Result<McpSettings>;

    /// @brief Saves the settings with working directories stripped.
    [[nodiscard]] auto save(McpSettings settings) -> VoidResult;

    /// @brief Returns the registry embedded in @p settings, or an empty registry.
    [[nodiscard]] static auto loadRegistry(const McpSettings& settings) -> ServerRegistry;

    /// @brief Embeds @p registry into @p settings.
    static void storeRegistry(McpSettings& settings, const ServerRegistry& registry);

  private:
    HostBridge& _host;
};

} // namespace vaultlink
