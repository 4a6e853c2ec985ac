// SPDX-License-Identifier: Apache-2.0
#include "BuiltinCatalogue.hpp"

#include <mcp/ServerRegistry.hpp>

#include <algorithm>
#include <array>

namespace vaultlink
{

namespace
{

    /// @brief Static description of a shipped server, before path substitution.
    struct BuiltinServerInfo
    {
        std::string_view id;
        std::string_view name;
        std::string_view description;
        std::string_view command;
        std::array<std::string_view, 3> args;
        ServerCapabilities capabilities;
        ServerPermissions permissions;
    };

    constexpr auto BuiltinServers = std::array<BuiltinServerInfo, 2> { {
        {
            .id = "vault-filesystem",
            .name = "Filesystem Tools",
            .description = "File operations within your vault - list, read, write, search files",
            .command = "${BUNDLE_PATH}/mcp-filesystem-server",
            .args = { "--line-transport", "--allowed-paths", "${VAULT_PATH}" },
            .capabilities = { .tools = true, .resources = true, .prompts = false, .sampling = false },
            .permissions = { .read = true, .write = true, .remove = true, .externalAccess = false },
        },
        {
            .id = "vault-search",
            .name = "Vault Search",
            .description = "Full-text search over the vault",
            .command = "${BUNDLE_PATH}/mcp-search-server",
            .args = { "--line-transport", "--index-path", "${VAULT_PATH}/.vault/search" },
            .capabilities = { .tools = true, .resources = false, .prompts = false, .sampling = false },
            .permissions = { .read = true, .write = true, .remove = false, .externalAccess = false },
        },
    } };

    constexpr auto MacResourcesSuffix = std::string_view { "/Contents/Resources" };
    constexpr auto MacBinariesSuffix = std::string_view { "/Contents/MacOS" };

} // namespace

auto builtinServerIds() -> std::vector<std::string>
{
    auto ids = std::vector<std::string> {};
    ids.reserve(BuiltinServers.size());
    for (const auto& info: BuiltinServers)
        ids.emplace_back(info.id);
    return ids;
}

auto isBuiltinServer(std::string_view id) -> bool
{
    return std::ranges::any_of(BuiltinServers, [id](const auto& info) { return info.id == id; });
}

auto builtinServers(std::string_view rootPath, std::string_view bundlePath) -> std::vector<ServerDescriptor>
{
    auto const vars = ExpansionVars {
        { std::string(VaultPathVar), std::string(rootPath) },
        { std::string(BundlePathVar), std::string(bundlePath) },
    };

    auto servers = std::vector<ServerDescriptor> {};
    servers.reserve(BuiltinServers.size());

    for (const auto& info: BuiltinServers)
    {
        auto transport = StdioTransport {
            .command = std::string(info.command),
            .args = {},
            .env = {},
            .workingDir = std::string(rootPath),
        };
        for (auto const arg: info.args)
            transport.args.emplace_back(arg);

        auto descriptor = ServerDescriptor {
            .id = std::string(info.id),
            .name = std::string(info.name),
            .description = std::string(info.description),
            .enabled = false,
            .transport = std::move(transport),
            .capabilities = info.capabilities,
            .permissions = info.permissions,
            .builtin = true,
        };

        servers.push_back(ServerRegistry::expand(descriptor, vars));
    }

    return servers;
}

auto bundlePathFromResourceDir(std::string_view resourceDir) -> std::string
{
    auto path = std::string(resourceDir);
    while (path.size() > 1 && path.ends_with('/'))
        path.pop_back();

    if (auto const pos = path.find(MacResourcesSuffix); pos != std::string::npos)
        path.replace(pos, MacResourcesSuffix.size(), MacBinariesSuffix);

    return path;
}

} // namespace vaultlink
