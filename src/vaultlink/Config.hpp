// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ConnectionSupervisor.hpp>
#include <mcp/RootReconciler.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace vaultlink
{

/// @brief Timeout and delay section, in milliseconds.
struct TimeoutConfig
{
    int requestMs = 30'000;
    int statusCheckMs = 2'000;
    int stopSettleMs = 100;
    int restartSettleMs = 2'000;
};

/// @brief Root reconciler section.
struct ReconcilerConfig
{
    std::string cwdMarker;
    std::string fallbackRoot;
    std::string envlessMarker = "vault-";
};

/// @brief Top-level application configuration.
struct AppConfig
{
    std::string logLevel = "info";

    /// @brief The vault the servers are bound to. Empty means "ask the host".
    std::string rootPath;

    /// @brief Directory of the shipped server binaries. Empty means the executable's directory.
    std::string bundlePath;

    /// @brief Settings blob file. Empty means defaultSettingsPath().
    std::string settingsPath;

    TimeoutConfig timeouts;
    ReconcilerConfig reconciler;
};

/// @brief Parses a configuration from its JSON form. Missing fields keep their defaults.
[[nodiscard]] auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Serializes a configuration to its JSON form.
[[nodiscard]] auto configToJson(const AppConfig& config) -> nlohmann::json;

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, the defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory ($XDG_CONFIG_HOME/vaultlink or ~/.config/vaultlink).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory ($XDG_DATA_HOME/vaultlink or ~/.local/share/vaultlink).
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the default settings blob path inside the data directory.
[[nodiscard]] auto defaultSettingsPath() -> std::string;

[[nodiscard]] auto toSupervisorTimings(const TimeoutConfig& timeouts) -> SupervisorTimings;
[[nodiscard]] auto toReconcilerOptions(const ReconcilerConfig& reconciler) -> ReconcilerOptions;

} // namespace vaultlink
