// SPDX-License-Identifier: Apache-2.0
#include "RootReconciler.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/BuiltinCatalogue.hpp>

#include <thread>

namespace vaultlink
{

namespace
{

    /// Host path queries answer with a bare string or with `{"path": ...}`.
    auto pathFrom(const nlohmann::json& value) -> std::string
    {
        if (value.is_string())
            return value.get<std::string>();
        return json::getStringOr(value, "path", "");
    }

} // namespace

RootReconciler::RootReconciler(HostBridge& host,
                               ConnectionSupervisor& supervisor,
                               const ServerRegistry& registry,
                               PathProvider currentRoot,
                               PathProvider bundlePath,
                               ReconcilerOptions options):
    _host(host),
    _supervisor(supervisor),
    _registry(registry),
    _currentRoot(std::move(currentRoot)),
    _bundlePath(std::move(bundlePath)),
    _options(std::move(options))
{
}

auto RootReconciler::resolveCurrentRoot() -> Result<std::string>
{
    if (_currentRoot)
    {
        if (auto root = _currentRoot(); !root.empty())
        {
            log::debug("Root from application state: {}", root);
            return root;
        }
    }

    if (auto info = _host.invoke(host::VaultInfo, nlohmann::json::object()); !info)
        log::warning("Failed to get vault info from host: {}", info.error().message);
    else if (auto root = pathFrom(*info); !root.empty())
    {
        log::debug("Root from host: {}", root);
        return root;
    }

    if (auto cwd = _host.invoke(host::CurrentDirectory, nlohmann::json::object()); !cwd)
        log::warning("Failed to get working directory from host: {}", cwd.error().message);
    else if (auto dir = pathFrom(*cwd); !dir.empty())
    {
        if (!_options.cwdMarker.empty() && !_options.fallbackRoot.empty() && dir.contains(_options.cwdMarker))
        {
            log::debug("Working directory {} matches {}, using {}", dir, _options.cwdMarker, _options.fallbackRoot);
            return _options.fallbackRoot;
        }
        log::debug("Root from working directory: {}", dir);
        return dir;
    }

    return makeError(ErrorCode::ConfigError, "Could not determine current root path");
}

auto RootReconciler::forceRestartWithCurrentRoot() -> Result<RestartReport>
{
    auto root = resolveCurrentRoot();
    if (!root)
        return std::unexpected(root.error());

    log::info("Force restarting servers with root {}", *root);
    auto report = RestartReport { .rootPath = *root, .stopped = {}, .started = {} };

    if (auto killed = _host.invoke(host::KillAllProcesses, nlohmann::json::object()); !killed)
        log::warning("Failed to kill server processes: {}", killed.error().message);

    report.stopped = _supervisor.disconnectAll();
    for (const auto& outcome: report.stopped)
        if (!outcome.succeeded())
            log::error("Failed to disconnect {}: {}", outcome.serverId, outcome.result.error().message);

    std::this_thread::sleep_for(_supervisor.timings().restartSettleDelay);

    auto const bundle = _bundlePath ? _bundlePath() : std::string {};
    for (auto& descriptor: builtinServers(*root, bundle))
    {
        descriptor.enabled = _registry.isEnabled(descriptor.id);
        if (!descriptor.enabled)
            continue;

        if (auto* stdio = descriptor.stdio())
        {
            stdio->workingDir = *root;
            if (!_options.envlessMarker.empty() && descriptor.id.contains(_options.envlessMarker))
                stdio->env.erase(std::string(VaultPathVar));
        }

        log::info("Starting {} with root {}", descriptor.id, *root);
        auto result = _supervisor.connect(descriptor.id, descriptor);
        if (!result)
            log::error("Failed to start {}: {}", descriptor.id, result.error().message);
        report.started.push_back(ServerOutcome { .serverId = descriptor.id, .result = std::move(result) });
    }

    log::info("Servers restarted with root {}", *root);
    return report;
}

auto RootReconciler::verifyRootPaths() -> Result<std::vector<RootCheck>>
{
    auto root = resolveCurrentRoot();
    if (!root)
        return std::unexpected(root.error());

    auto checks = std::vector<RootCheck> {};
    for (auto const& id: _supervisor.serverIds())
    {
        auto descriptor = _supervisor.sessionDescriptor(id);
        if (!descriptor)
            continue;

        auto bound = std::string {};
        if (auto const* stdio = descriptor->stdio())
        {
            if (stdio->workingDir)
                bound = *stdio->workingDir;
            else if (auto it = stdio->env.find(std::string(VaultPathVar)); it != stdio->env.end())
                bound = it->second;
        }

        checks.push_back(RootCheck {
            .serverId = id,
            .boundRoot = bound,
            .correct = bound == *root,
            .status = _supervisor.status(id),
        });
    }
    return checks;
}

} // namespace vaultlink
