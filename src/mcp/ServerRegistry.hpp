// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerDescriptor.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace vaultlink
{

/// @brief Placeholder values substituted into descriptors, keyed by variable name.
using ExpansionVars = std::map<std::string, std::string, std::less<>>;

/// @brief Variable holding the current root (vault) path.
inline constexpr auto VaultPathVar = std::string_view { "VAULT_PATH" };

/// @brief Variable holding the directory of the shipped server binaries.
inline constexpr auto BundlePathVar = std::string_view { "BUNDLE_PATH" };

/// @brief Replaces every `${KEY}` in @p input whose KEY is in @p vars.
///
/// Unknown placeholders are kept verbatim. Substituted values are not expanded again.
[[nodiscard]] auto expandString(std::string_view input, const ExpansionVars& vars) -> std::string;

/// @brief Bookkeeping of user-defined servers and of which servers (user or built-in) are enabled.
///
/// Built-in descriptors are never stored here; only their enabled state is.
class ServerRegistry
{
  public:
    using ServerMap = std::map<std::string, ServerDescriptor, std::less<>>;
    using IdSet = std::set<std::string, std::less<>>;

    /// @brief Adds a user-defined server. The stored copy always has builtin = false.
    /// @return DuplicateName if the id is already registered; the registry is unchanged then.
    [[nodiscard]] auto addUserServer(std::string_view id, ServerDescriptor descriptor) -> VoidResult;

    /// @brief Removes a user server and its enabled flag. Unknown and built-in ids are ignored.
    void removeUserServer(std::string_view id);

    /// @brief Enables or disables a server id. The id does not need to resolve to a descriptor.
    void setServerEnabled(std::string_view id, bool enabled);

    [[nodiscard]] auto isEnabled(std::string_view id) const -> bool;
    [[nodiscard]] auto hasUserServer(std::string_view id) const -> bool;
    [[nodiscard]] auto enabledIds() const -> const IdSet&;
    [[nodiscard]] auto userServers() const -> const ServerMap&;

    /// @brief Returns the enabled user servers. Built-ins are merged in by the caller.
    [[nodiscard]] auto getEnabledServers() const -> ServerMap;

    /// @brief Returns a copy of @p descriptor with placeholders in command, args and env values expanded.
    [[nodiscard]] static auto expand(const ServerDescriptor& descriptor, const ExpansionVars& vars)
        -> ServerDescriptor;

    /// @brief Serializes `{userServers, enabledServers}`.
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /// @brief Restores a registry from toJson() output. Malformed server entries are skipped.
    [[nodiscard]] static auto fromJson(const nlohmann::json& value) -> Result<ServerRegistry>;

    auto operator==(const ServerRegistry&) const -> bool = default;

  private:
    ServerMap _userServers;
    IdSet _enabledServers;
};

} // namespace vaultlink
