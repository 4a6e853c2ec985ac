// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/HostBridge.hpp>
#include <mcp/ServerRegistry.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace vaultlink
{

/// @brief Downstream command-line agents that configuration can be generated for.
enum class AgentKind : std::uint8_t
{
    Claude,
    Gemini,
    Codex,
    Unknown,
};

[[nodiscard]] constexpr auto agentName(AgentKind agent) -> std::string_view
{
    switch (agent)
    {
        case AgentKind::Claude: return "claude";
        case AgentKind::Gemini: return "gemini";
        case AgentKind::Codex: return "codex";
        case AgentKind::Unknown: return "unknown";
    }
    return "unknown";
}

/// @brief Detects the agent a command line launches.
///
/// Case-insensitive substring match, checked in the order claude, gemini, codex.
[[nodiscard]] auto detectAgent(std::string_view command) -> AgentKind;

enum class ConfigFormat : std::uint8_t
{
    Json,
    Toml,
};

[[nodiscard]] constexpr auto formatName(ConfigFormat format) -> std::string_view
{
    return format == ConfigFormat::Toml ? "toml" : "json";
}

/// @brief A generated configuration file. Regenerated on every request.
struct ConfigOutput
{
    std::string path;
    std::string content;
    ConfigFormat format = ConfigFormat::Json;
};

/// @brief Renders the enabled servers into the configuration format of one agent.
class ConfigGenerator
{
  public:
    ConfigGenerator(const ServerRegistry& registry, HostBridge& host);

    /// @brief Returns the enabled built-in and user servers, expanded against the given paths.
    ///
    /// A user server replaces a built-in server with the same id.
    [[nodiscard]] auto collectServers(std::string_view rootPath, std::string_view bundlePath) const
        -> ServerRegistry::ServerMap;

    /// @brief Generates the configuration file for @p agent.
    /// @return The output, or UnknownAgent / a host error (home directory lookup).
    [[nodiscard]] auto generateConfig(AgentKind agent, std::string_view rootPath, std::string_view bundlePath)
        -> Result<ConfigOutput>;

    /// @brief Writes @p output through the host.
    [[nodiscard]] auto writeConfig(const ConfigOutput& output) -> VoidResult;

    [[nodiscard]] static auto claudeConfig(const ServerRegistry::ServerMap& servers, std::string_view rootPath)
        -> ConfigOutput;
    [[nodiscard]] static auto geminiConfig(const ServerRegistry::ServerMap& servers, std::string_view homeDir)
        -> ConfigOutput;
    [[nodiscard]] static auto codexConfig(const ServerRegistry::ServerMap& servers, std::string_view homeDir)
        -> ConfigOutput;

    /// @brief Rewrites every `${VAR}` to `$VAR`, the syntax Gemini expands.
    [[nodiscard]] static auto geminiEnvValue(std::string_view value) -> std::string;

    /// @brief Quotes and escapes @p value as a TOML basic string.
    [[nodiscard]] static auto tomlString(std::string_view value) -> std::string;

  private:
    auto homeDir() -> Result<std::string>;

    const ServerRegistry& _registry;
    HostBridge& _host;
};

} // namespace vaultlink
