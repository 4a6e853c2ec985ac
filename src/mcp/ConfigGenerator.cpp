// SPDX-License-Identifier: Apache-2.0
#include "ConfigGenerator.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/BuiltinCatalogue.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace vaultlink
{

namespace
{

    constexpr auto GeminiTimeoutMs = 60'000;

    auto toLower(std::string_view text) -> std::string
    {
        auto out = std::string(text);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    auto prettyJson(const nlohmann::json& value) -> std::string
    {
        return value.dump(2);
    }

    auto envToJson(const std::map<std::string, std::string>& env) -> nlohmann::json
    {
        auto out = nlohmann::json::object();
        for (const auto& [key, value]: env)
            out[key] = value;
        return out;
    }

    auto isBareKey(std::string_view key) -> bool
    {
        return !key.empty() && std::ranges::all_of(key, [](unsigned char c) {
            return std::isalnum(c) || c == '_' || c == '-';
        });
    }

    auto tomlKey(std::string_view key) -> std::string
    {
        return isBareKey(key) ? std::string(key) : ConfigGenerator::tomlString(key);
    }

} // namespace

auto detectAgent(std::string_view command) -> AgentKind
{
    auto const lower = toLower(command);
    for (auto const agent: { AgentKind::Claude, AgentKind::Gemini, AgentKind::Codex })
        if (lower.contains(agentName(agent)))
            return agent;
    return AgentKind::Unknown;
}

ConfigGenerator::ConfigGenerator(const ServerRegistry& registry, HostBridge& host): _registry(registry), _host(host)
{
}

auto ConfigGenerator::collectServers(std::string_view rootPath, std::string_view bundlePath) const
    -> ServerRegistry::ServerMap
{
    auto const vars = ExpansionVars {
        { std::string(VaultPathVar), std::string(rootPath) },
        { std::string(BundlePathVar), std::string(bundlePath) },
    };

    auto servers = ServerRegistry::ServerMap {};
    for (auto& descriptor: builtinServers(rootPath, bundlePath))
        if (_registry.isEnabled(descriptor.id))
            servers.insert_or_assign(descriptor.id, std::move(descriptor));

    for (const auto& [id, descriptor]: _registry.getEnabledServers())
        servers.insert_or_assign(id, ServerRegistry::expand(descriptor, vars));

    return servers;
}

auto ConfigGenerator::generateConfig(AgentKind agent, std::string_view rootPath, std::string_view bundlePath)
    -> Result<ConfigOutput>
{
    if (agent == AgentKind::Unknown)
        return makeError(ErrorCode::UnknownAgent, "Unknown agent");

    auto const servers = collectServers(rootPath, bundlePath);
    log::debug("Generating {} config with {} server(s)", agentName(agent), servers.size());

    switch (agent)
    {
        case AgentKind::Claude: return claudeConfig(servers, rootPath);
        case AgentKind::Gemini:
            return homeDir().transform([&](const std::string& home) { return geminiConfig(servers, home); });
        case AgentKind::Codex:
            return homeDir().transform([&](const std::string& home) { return codexConfig(servers, home); });
        case AgentKind::Unknown: break;
    }
    return makeError(ErrorCode::UnknownAgent, std::format("Unknown agent: {}", agentName(agent)));
}

auto ConfigGenerator::writeConfig(const ConfigOutput& output) -> VoidResult
{
    auto const args = nlohmann::json {
        { "path", output.path },
        { "content", output.content },
        { "format", formatName(output.format) },
    };

    if (auto written = _host.invoke(host::WriteFile, args); !written)
        return makeError(ErrorCode::HostCallFailure,
                         std::format("Failed to write {}: {}", output.path, written.error().message));

    log::info("Wrote {} config to {}", formatName(output.format), output.path);
    return {};
}

auto ConfigGenerator::claudeConfig(const ServerRegistry::ServerMap& servers, std::string_view rootPath) -> ConfigOutput
{
    auto mcpServers = nlohmann::json::object();
    for (const auto& [id, descriptor]: servers)
    {
        if (auto const* http = descriptor.http())
        {
            mcpServers[id] = { { "type", "http" }, { "url", http->url } };
            continue;
        }

        auto const& stdio = *descriptor.stdio();
        auto entry = nlohmann::json {
            { "command", stdio.command },
            { "args", stdio.args },
        };
        if (!stdio.env.empty())
            entry["env"] = envToJson(stdio.env);
        mcpServers[id] = std::move(entry);
    }

    return ConfigOutput {
        .path = std::format("{}/.mcp.json", rootPath),
        .content = prettyJson(nlohmann::json { { "mcpServers", std::move(mcpServers) } }),
        .format = ConfigFormat::Json,
    };
}

auto ConfigGenerator::geminiConfig(const ServerRegistry::ServerMap& servers, std::string_view homeDir) -> ConfigOutput
{
    auto mcpServers = nlohmann::json::object();
    for (const auto& [id, descriptor]: servers)
    {
        if (auto const* http = descriptor.http())
        {
            mcpServers[id] = {
                { "url", http->url },
                { "timeout", GeminiTimeoutMs },
                { "trust", false },
            };
            continue;
        }

        auto const& stdio = *descriptor.stdio();
        auto env = nlohmann::json::object();
        for (const auto& [key, value]: stdio.env)
            env[key] = geminiEnvValue(value);

        mcpServers[id] = {
            { "command", stdio.command },
            { "args", stdio.args },
            { "env", std::move(env) },
            { "timeout", GeminiTimeoutMs },
            { "trust", false },
        };
    }

    return ConfigOutput {
        .path = std::format("{}/.gemini/settings.json", homeDir),
        .content = prettyJson(nlohmann::json { { "mcpServers", std::move(mcpServers) } }),
        .format = ConfigFormat::Json,
    };
}

auto ConfigGenerator::codexConfig(const ServerRegistry::ServerMap& servers, std::string_view homeDir) -> ConfigOutput
{
    auto toml = std::string {};
    for (const auto& [id, descriptor]: servers)
    {
        auto const section = std::format("mcp_servers.{}", tomlString(id));
        toml += std::format("[{}]\n", section);

        if (auto const* http = descriptor.http())
        {
            toml += std::format("url = {}\n", tomlString(http->url));
        }
        else
        {
            auto const& stdio = *descriptor.stdio();
            toml += std::format("command = {}\n", tomlString(stdio.command));

            if (!stdio.args.empty())
            {
                auto args = std::string {};
                for (const auto& arg: stdio.args)
                {
                    if (!args.empty())
                        args += ", ";
                    args += tomlString(arg);
                }
                toml += std::format("args = [{}]\n", args);
            }

            if (!stdio.env.empty())
            {
                toml += std::format("\n[{}.env]\n", section);
                for (const auto& [key, value]: stdio.env)
                    toml += std::format("{} = {}\n", tomlKey(key), tomlString(value));
            }
        }

        toml += '\n';
    }

    return ConfigOutput {
        .path = std::format("{}/.codex/config.toml", homeDir),
        .content = std::move(toml),
        .format = ConfigFormat::Toml,
    };
}

auto ConfigGenerator::geminiEnvValue(std::string_view value) -> std::string
{
    auto out = std::string {};
    out.reserve(value.size());

    auto pos = std::size_t { 0 };
    while (pos < value.size())
    {
        auto const start = value.find("${", pos);
        if (start == std::string_view::npos)
            break;
        auto const end = value.find('}', start + 2);
        if (end == std::string_view::npos)
            break;

        out.append(value.substr(pos, start - pos));
        if (end == start + 2)
            out.append("${}"); // Nothing to rewrite for an empty name.
        else
        {
            out += '$';
            out.append(value.substr(start + 2, end - start - 2));
        }
        pos = end + 1;
    }
    out.append(value.substr(pos));
    return out;
}

auto ConfigGenerator::tomlString(std::string_view value) -> std::string
{
    auto out = std::string { '"' };
    for (auto const c: value)
    {
        switch (c)
        {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\f': out += "\\f"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f)
                    out += std::format("\\u{:04X}", static_cast<unsigned>(static_cast<unsigned char>(c)));
                else
                    out += c;
        }
    }
    out += '"';
    return out;
}

auto ConfigGenerator::homeDir() -> Result<std::string>
{
    auto home = _host.invoke(host::HomeDir, nlohmann::json::object());
    if (!home)
        return makeError(ErrorCode::HostCallFailure, std::format("Cannot determine home directory: {}", home.error().message));

    auto path = home->is_string() ? home->get<std::string>() : json::getStringOr(*home, "path", "");
    if (path.empty())
        return makeError(ErrorCode::HostCallFailure, "Host returned an empty home directory");

    while (path.size() > 1 && path.ends_with('/'))
        path.pop_back();
    return path;
}

} // namespace vaultlink
