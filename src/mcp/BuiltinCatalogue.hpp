// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/ServerDescriptor.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace vaultlink
{

/// @brief Returns the ids of all servers shipped with the application.
[[nodiscard]] auto builtinServerIds() -> std::vector<std::string>;

/// @brief Returns true if @p id names a shipped server.
[[nodiscard]] auto isBuiltinServer(std::string_view id) -> bool;

/// @brief Returns the shipped server descriptors with ${VAULT_PATH} and ${BUNDLE_PATH} substituted.
///
/// Every returned stdio descriptor has its working directory set to @p rootPath, the
/// shipped servers resolve the vault from their working directory.
/// @param rootPath The current root (vault) path.
/// @param bundlePath The directory holding the server binaries.
[[nodiscard]] auto builtinServers(std::string_view rootPath, std::string_view bundlePath)
    -> std::vector<ServerDescriptor>;

/// @brief Maps the host's resource directory to the directory the server binaries live in.
///
/// On packaged macOS builds the binaries are in Contents/MacOS while resources are in
/// Contents/Resources.
[[nodiscard]] auto bundlePathFromResourceDir(std::string_view resourceDir) -> std::string;

} // namespace vaultlink
