// SPDX-License-Identifier: Apache-2.0
#include "McpContext.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/BuiltinCatalogue.hpp>

#include <format>

namespace vaultlink
{

McpContext::McpContext(HostBridge& host, McpContextOptions options):
    _host(host),
    _rootPath(std::move(options.rootPath)),
    _bundlePath(std::move(options.bundlePath)),
    _settingsStore(host),
    _supervisor(host, _statusChannel, options.timings),
    _generator(_registry, host),
    _reconciler(
        host,
        _supervisor,
        _registry,
        [this] { return rootPath(); },
        [this] { return bundlePath(); },
        std::move(options.reconciler)),
    _router(_supervisor)
{
}

auto McpContext::loadSettings() -> VoidResult
{
    return _settingsStore.load().transform([this](McpSettings settings) {
        _registry = SettingsStore::loadRegistry(settings);
        _settings = std::move(settings);
        log::debug("Loaded {} saved server(s), {} enabled id(s)",
                   _settings.servers.size(),
                   _registry.enabledIds().size());
    });
}

auto McpContext::saveSettings() -> VoidResult
{
    SettingsStore::storeRegistry(_settings, _registry);
    return _settingsStore.save(_settings);
}

auto McpContext::addServer(ServerDescriptor descriptor) -> VoidResult
{
    if (isBuiltinServer(descriptor.id))
        return makeError(ErrorCode::DuplicateName,
                         std::format("Server '{}' is a built-in server", descriptor.id));

    auto const id = descriptor.id;
    descriptor.enabled = true;
    auto added = _registry.addUserServer(id, descriptor);
    if (!added)
        return added;

    _registry.setServerEnabled(id, true);
    _settings.servers.insert_or_assign(id, std::move(descriptor));
    log::info("Added server {}", id);
    return {};
}

auto McpContext::removeServer(std::string_view id) -> VoidResult
{
    if (isBuiltinServer(id))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Server '{}' is a built-in server and cannot be removed", id));

    auto const known = _registry.hasUserServer(id) || _settings.servers.contains(id);
    if (!known)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown server: {}", id));

    _registry.removeUserServer(id);
    if (auto it = _settings.servers.find(id); it != _settings.servers.end())
        _settings.servers.erase(it);
    log::info("Removed server {}", id);
    return {};
}

auto McpContext::setServerEnabled(std::string_view id, bool enabled) -> VoidResult
{
    auto settingsEntry = _settings.servers.find(id);
    if (!isBuiltinServer(id) && !_registry.hasUserServer(id) && settingsEntry == _settings.servers.end())
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown server: {}", id));

    _registry.setServerEnabled(id, enabled);
    if (settingsEntry != _settings.servers.end())
        settingsEntry->second.enabled = enabled;
    return {};
}

auto McpContext::boundDescriptor(std::string_view id) -> Result<ServerDescriptor>
{
    auto const root = resolveRoot();
    if (!root)
        return std::unexpected(root.error());

    auto const bundle = bundlePath();

    if (isBuiltinServer(id))
    {
        for (auto& descriptor: builtinServers(*root, bundle))
        {
            if (descriptor.id == id)
                return std::move(descriptor);
        }
    }

    if (auto it = _settings.servers.find(id); it != _settings.servers.end())
        return ConnectionSupervisor::bindUserServer(id, it->second, *root, bundle);

    if (auto const& user = _registry.userServers(); user.contains(id))
        return ConnectionSupervisor::bindUserServer(id, user.find(id)->second, *root, bundle);

    return makeError(ErrorCode::InvalidArgument, std::format("Unknown server: {}", id));
}

auto McpContext::connectServer(std::string_view id) -> VoidResult
{
    return boundDescriptor(id).and_then(
        [this, id](const ServerDescriptor& descriptor) { return _supervisor.connect(id, descriptor); });
}

auto McpContext::startServers() -> Result<std::vector<ServerOutcome>>
{
    return resolveRoot().transform([this](const std::string& root) {
        return _supervisor.startAllEnabled(root, bundlePath(), _settings, _registry);
    });
}

auto McpContext::resolveRoot() -> Result<std::string>
{
    return _reconciler.resolveCurrentRoot().transform([this](std::string root) {
        setRootPath(root);
        return root;
    });
}

auto McpContext::bundlePath() -> std::string
{
    {
        auto lock = std::lock_guard(_pathMutex);
        if (!_bundlePath.empty())
            return _bundlePath;
    }

    auto reply = _host.invoke(host::BundlePath, nlohmann::json::object());
    if (!reply)
    {
        log::warning("Failed to get bundle path from host: {}", reply.error().message);
        return {};
    }

    auto path = reply->is_string() ? reply->get<std::string>() : json::getStringOr(*reply, "path", "");
    auto lock = std::lock_guard(_pathMutex);
    _bundlePath = path;
    return path;
}

auto McpContext::rootPath() const -> std::string
{
    auto lock = std::lock_guard(_pathMutex);
    return _rootPath;
}

void McpContext::setRootPath(std::string rootPath)
{
    auto lock = std::lock_guard(_pathMutex);
    _rootPath = std::move(rootPath);
}

} // namespace vaultlink
