// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace vaultlink
{

namespace
{

    /// Reads a non-negative millisecond value; negative values are a configuration error.
    auto readMilliseconds(const nlohmann::json& section, std::string_view key, int defaultValue) -> Result<int>
    {
        auto const value = json::getIntOr(section, key, defaultValue);
        if (value < 0)
            return makeError(ErrorCode::ConfigError, std::format("timeouts.{} must not be negative", key));
        return value;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/vaultlink";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/vaultlink";
    return ".";
}

auto defaultDataDir() -> std::string
{
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && *xdgData)
        return std::string(xdgData) + "/vaultlink";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/vaultlink";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultSettingsPath() -> std::string
{
    return defaultDataDir() + "/mcp-settings.json";
}

auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};
    config.logLevel = json::getStringOr(root, "logLevel", config.logLevel);
    if (!log::levelFromString(config.logLevel))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", config.logLevel));

    config.rootPath = json::getStringOr(root, "rootPath", "");
    config.bundlePath = json::getStringOr(root, "bundlePath", "");
    config.settingsPath = json::getStringOr(root, "settingsPath", "");

    // Timeouts section
    if (root.contains("timeouts"))
    {
        auto const& timeouts = root["timeouts"];
        auto& target = config.timeouts;

        auto request = readMilliseconds(timeouts, "requestMs", target.requestMs);
        auto statusCheck = readMilliseconds(timeouts, "statusCheckMs", target.statusCheckMs);
        auto stopSettle = readMilliseconds(timeouts, "stopSettleMs", target.stopSettleMs);
        auto restartSettle = readMilliseconds(timeouts, "restartSettleMs", target.restartSettleMs);
        for (auto const* value: { &request, &statusCheck, &stopSettle, &restartSettle })
        {
            if (!*value)
                return std::unexpected(value->error());
        }

        target.requestMs = *request;
        target.statusCheckMs = *statusCheck;
        target.stopSettleMs = *stopSettle;
        target.restartSettleMs = *restartSettle;
    }

    // Reconciler section
    if (root.contains("reconciler"))
    {
        auto const& reconciler = root["reconciler"];
        config.reconciler.cwdMarker = json::getStringOr(reconciler, "cwdMarker", "");
        config.reconciler.fallbackRoot = json::getStringOr(reconciler, "fallbackRoot", "");
        config.reconciler.envlessMarker =
            json::getStringOr(reconciler, "envlessMarker", config.reconciler.envlessMarker);
    }

    return config;
}

auto configToJson(const AppConfig& config) -> nlohmann::json
{
    auto root = nlohmann::json::object();
    root["logLevel"] = config.logLevel;
    if (!config.rootPath.empty())
        root["rootPath"] = config.rootPath;
    if (!config.bundlePath.empty())
        root["bundlePath"] = config.bundlePath;
    if (!config.settingsPath.empty())
        root["settingsPath"] = config.settingsPath;

    root["timeouts"] = nlohmann::json {
        { "requestMs", config.timeouts.requestMs },
        { "statusCheckMs", config.timeouts.statusCheckMs },
        { "stopSettleMs", config.timeouts.stopSettleMs },
        { "restartSettleMs", config.timeouts.restartSettleMs },
    };

    auto reconciler = nlohmann::json::object();
    if (!config.reconciler.cwdMarker.empty())
        reconciler["cwdMarker"] = config.reconciler.cwdMarker;
    if (!config.reconciler.fallbackRoot.empty())
        reconciler["fallbackRoot"] = config.reconciler.fallbackRoot;
    reconciler["envlessMarker"] = config.reconciler.envlessMarker;
    root["reconciler"] = std::move(reconciler);

    return root;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    return json::parse(ss.str())
        .transform_error([path](Error error) {
            return Error { ErrorCode::ConfigError, std::format("{}: {}", path, error.message) };
        })
        .and_then([](const nlohmann::json& root) { return configFromJson(root); });
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << configToJson(config).dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto toSupervisorTimings(const TimeoutConfig& timeouts) -> SupervisorTimings
{
    return SupervisorTimings {
        .requestTimeout = std::chrono::milliseconds { timeouts.requestMs },
        .statusCheckDelay = std::chrono::milliseconds { timeouts.statusCheckMs },
        .stopSettleDelay = std::chrono::milliseconds { timeouts.stopSettleMs },
        .restartSettleDelay = std::chrono::milliseconds { timeouts.restartSettleMs },
    };
}

auto toReconcilerOptions(const ReconcilerConfig& reconciler) -> ReconcilerOptions
{
    return ReconcilerOptions {
        .cwdMarker = reconciler.cwdMarker,
        .fallbackRoot = reconciler.fallbackRoot,
        .envlessMarker = reconciler.envlessMarker,
    };
}

} // namespace vaultlink
