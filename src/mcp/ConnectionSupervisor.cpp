// SPDX-License-Identifier: Apache-2.0
#include "ConnectionSupervisor.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/BuiltinCatalogue.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>

namespace vaultlink
{

namespace
{

    /// The host reports status either as a plain string or as `{"status": "..."}`.
    auto statusValue(const nlohmann::json& status) -> std::string
    {
        if (status.is_string())
            return status.get<std::string>();
        if (status.is_object())
            return json::getStringOr(status, "status", "");
        return {};
    }

    auto listFrom(const nlohmann::json& response, std::string_view key) -> nlohmann::json
    {
        auto const result = response.value("result", nlohmann::json::object());
        auto const name = std::string(key);
        if (result.is_object() && result.contains(name) && result[name].is_array())
            return result[name];
        return nlohmann::json::array();
    }

} // namespace

ConnectionSupervisor::ConnectionSupervisor(HostBridge& host, StatusChannel& channel, SupervisorTimings timings):
    _host(host), _channel(channel), _timings(timings)
{
}

ConnectionSupervisor::~ConnectionSupervisor()
{
    auto checks = std::vector<StatusCheck> {};
    {
        auto lock = std::lock_guard(_checkMutex);
        checks.swap(_statusChecks);
    }
    for (auto& check: checks)
        check.thread.request_stop();
    checks.clear();

    for (const auto& outcome: disconnectAll())
        if (!outcome.succeeded())
            log::warning("Failed to stop {} on shutdown: {}", outcome.serverId, outcome.result.error().message);
}

auto ConnectionSupervisor::connect(std::string_view id, const ServerDescriptor& descriptor) -> VoidResult
{
    auto const serverId = std::string(id);

    {
        auto lock = std::lock_guard(_mutex);
        if (auto it = _statuses.find(serverId);
            it != _statuses.end()
            && (it->second == ConnectionStatus::Connecting || it->second == ConnectionStatus::Connected))
        {
            log::info("Server {} is already {}", serverId, statusToString(it->second));
            return {};
        }
        _statuses[serverId] = ConnectionStatus::Connecting;
    }

    log::info("Connecting to server {} ({})", serverId, transportTypeName(descriptor.transport));

    // Drop the previous instance's handlers first, so its stop event cannot overwrite the
    // Connecting claim taken above.
    releaseSession(serverId);

    // Best effort: the server is usually not running.
    if (auto stopped = _host.invoke(host::StopServer, nlohmann::json { { "serverId", serverId } }); !stopped)
        log::debug("Pre-connect stop of {}: {}", serverId, stopped.error().message);
    else
        std::this_thread::sleep_for(_timings.stopSettleDelay);

    auto bound = descriptor;
    bound.id = serverId;

    auto session = std::make_shared<RpcSession>(_host, bound, _timings.requestTimeout);
    auto subscriptions = subscribeEvents(serverId);
    {
        auto lock = std::lock_guard(_mutex);
        _sessions[serverId] = std::move(session);
        _subscriptions[serverId] = std::move(subscriptions);
    }

    setStatus(serverId, ConnectionStatus::Connecting);

    auto const args = nlohmann::json {
        { "serverId", serverId },
        { "config", toHostConfig(bound) },
    };
    if (auto started = _host.invoke(host::StartServer, args); !started)
    {
        log::error("Failed to connect to {}: {}", serverId, started.error().message);
        setStatus(serverId, ConnectionStatus::Error, started.error().message);
        return makeError(ErrorCode::HostCallFailure, started.error().message);
    }

    scheduleStatusCheck(serverId);
    return {};
}

auto ConnectionSupervisor::disconnect(std::string_view id) -> VoidResult
{
    log::info("Disconnecting from server {}", id);

    auto const stopped = _host.invoke(host::StopServer, nlohmann::json { { "serverId", id } });

    releaseSession(id);
    {
        auto lock = std::lock_guard(_mutex);
        _capabilities.erase(std::string(id));
    }
    setStatus(id, ConnectionStatus::Disconnected);

    if (!stopped)
    {
        log::error("Failed to stop {}: {}", id, stopped.error().message);
        return makeError(ErrorCode::HostCallFailure, stopped.error().message);
    }
    return {};
}

auto ConnectionSupervisor::disconnectAll() -> std::vector<ServerOutcome>
{
    auto outcomes = std::vector<ServerOutcome> {};
    for (auto const& id: serverIds())
        outcomes.push_back(ServerOutcome { .serverId = id, .result = disconnect(id) });

    {
        auto lock = std::lock_guard(_mutex);
        _sessions.clear();
        _statuses.clear();
        _capabilities.clear();
    }

    if (!outcomes.empty())
        log::info("All servers stopped ({})", outcomes.size());
    return outcomes;
}

auto ConnectionSupervisor::reconnect(std::string_view id) -> VoidResult
{
    auto descriptor = sessionDescriptor(id);
    if (!descriptor)
        return makeError(ErrorCode::NotConnected, std::format("Server {} not connected", id));

    if (auto result = disconnect(id); !result)
        log::warning("Reconnect of {}: {}", id, result.error().message);

    return connect(id, *descriptor);
}

auto ConnectionSupervisor::invokeTool(std::string_view id, std::string_view toolName, const nlohmann::json& args)
    -> Result<nlohmann::json>
{
    auto params = nlohmann::json {
        { "name", toolName },
        { "arguments", args.is_null() ? nlohmann::json::object() : args },
    };
    return request(id, "tools/call", std::move(params), "Tool invocation failed")
        .transform([](const nlohmann::json& response) {
            return response.value("result", nlohmann::json::object());
        });
}

auto ConnectionSupervisor::readResource(std::string_view id, std::string_view uri) -> Result<nlohmann::json>
{
    return request(id, "resources/read", nlohmann::json { { "uri", uri } }, "Resource read failed")
        .transform([](const nlohmann::json& response) {
            return response.value("result", nlohmann::json::object());
        });
}

auto ConnectionSupervisor::listTools(std::string_view id) -> Result<nlohmann::json>
{
    return request(id, "tools/list", nlohmann::json::object(), "Failed to list tools")
        .transform([](const nlohmann::json& response) { return listFrom(response, "tools"); });
}

auto ConnectionSupervisor::listResources(std::string_view id) -> Result<nlohmann::json>
{
    return request(id, "resources/list", nlohmann::json::object(), "Failed to list resources")
        .transform([](const nlohmann::json& response) { return listFrom(response, "resources"); });
}

auto ConnectionSupervisor::refreshStatuses() -> VoidResult
{
    auto reported = _host.invoke(host::ServerStatuses, nlohmann::json::object());
    if (!reported)
    {
        log::error("Failed to refresh statuses: {}", reported.error().message);
        return makeError(ErrorCode::HostCallFailure, reported.error().message);
    }
    if (!reported->is_object())
        return {};

    for (const auto& [id, value]: reported->items())
    {
        auto const next = statusFromString(statusValue(value));
        if (status(id) != next)
            setStatus(id, next);
    }
    return {};
}

auto ConnectionSupervisor::serverInfo(std::string_view id) -> Result<nlohmann::json>
{
    auto info = _host.invoke(host::ServerInfo, nlohmann::json { { "serverId", id } });
    if (!info)
    {
        log::error("Failed to get info for {}: {}", id, info.error().message);
        return makeError(ErrorCode::HostCallFailure, info.error().message);
    }
    return info;
}

auto ConnectionSupervisor::startAllEnabled(std::string_view rootPath,
                                           std::string_view bundlePath,
                                           const McpSettings& settings,
                                           const ServerRegistry& registry) -> std::vector<ServerOutcome>
{
    auto outcomes = std::vector<ServerOutcome> {};
    if (rootPath.empty())
    {
        log::error("No root path available, not starting any server");
        return outcomes;
    }

    log::info("Starting enabled servers for root {}", rootPath);

    for (auto const& descriptor: builtinServers(rootPath, bundlePath))
    {
        if (!registry.isEnabled(descriptor.id))
            continue;
        outcomes.push_back(ServerOutcome { .serverId = descriptor.id, .result = connect(descriptor.id, descriptor) });
    }

    for (auto const& [id, stored]: settings.servers)
    {
        if (isBuiltinServer(id) || !registry.isEnabled(id))
            continue;

        auto const descriptor = bindUserServer(id, stored, rootPath, bundlePath);
        outcomes.push_back(ServerOutcome { .serverId = id, .result = connect(id, descriptor) });
    }

    for (auto const& outcome: outcomes)
        if (!outcome.succeeded())
            log::error("Failed to start {}: {}", outcome.serverId, outcome.result.error().message);

    return outcomes;
}

auto ConnectionSupervisor::bindUserServer(std::string_view id,
                                          const ServerDescriptor& stored,
                                          std::string_view rootPath,
                                          std::string_view bundlePath) -> ServerDescriptor
{
    auto const vars = ExpansionVars {
        { std::string(VaultPathVar), std::string(rootPath) },
        { std::string(BundlePathVar), std::string(bundlePath) },
    };

    auto descriptor = ServerRegistry::expand(stored, vars);
    descriptor.id = std::string(id);
    if (auto* stdio = descriptor.stdio())
    {
        stdio->workingDir = std::string(rootPath);
        if (auto it = stdio->env.find(std::string(VaultPathVar)); it != stdio->env.end())
            it->second = std::string(rootPath);
    }
    return descriptor;
}

auto ConnectionSupervisor::status(std::string_view id) const -> ConnectionStatus
{
    auto lock = std::lock_guard(_mutex);
    auto it = _statuses.find(id);
    return it != _statuses.end() ? it->second : ConnectionStatus::Disconnected;
}

auto ConnectionSupervisor::statuses() const -> StatusMap
{
    auto lock = std::lock_guard(_mutex);
    return _statuses;
}

auto ConnectionSupervisor::capabilities(std::string_view id) const -> nlohmann::json
{
    auto lock = std::lock_guard(_mutex);
    auto it = _capabilities.find(id);
    return it != _capabilities.end() ? it->second : nlohmann::json {};
}

auto ConnectionSupervisor::connectedServers() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto ids = std::vector<std::string> {};
    for (const auto& [id, status]: _statuses)
        if (status == ConnectionStatus::Connected)
            ids.push_back(id);
    return ids;
}

auto ConnectionSupervisor::sessionDescriptor(std::string_view id) const -> std::optional<ServerDescriptor>
{
    auto session = sessionFor(id);
    if (!session)
        return std::nullopt;
    return session->descriptor();
}

auto ConnectionSupervisor::serverIds() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto ids = std::vector<std::string> {};
    for (const auto& [id, session]: _sessions)
        ids.push_back(id);
    return ids;
}

auto ConnectionSupervisor::toHostConfig(const ServerDescriptor& descriptor) -> nlohmann::json
{
    auto config = descriptorToJson(descriptor);

    if (auto const* http = descriptor.http())
    {
        auto headers = nlohmann::json::object();
        for (const auto& [name, value]: http->headers)
            headers[name] = value;
        headers["Accept"] = "application/json, text/event-stream";
        headers["Content-Type"] = "application/json";
        headers["MCP-Protocol-Version"] = jsonrpc::ProtocolVersion;
        if (http->apiKey && !http->apiKey->empty())
            headers["Authorization"] = std::format("Bearer {}", *http->apiKey);

        config["transport"] = nlohmann::json {
            { "type", "http" },
            { "url", http->url },
            { "headers", std::move(headers) },
        };
    }

    return config;
}

void ConnectionSupervisor::setStatus(std::string_view id, ConnectionStatus status, std::string error)
{
    {
        auto lock = std::lock_guard(_mutex);
        _statuses[std::string(id)] = status;
    }

    log::debug("Server {} is now {}", id, statusToString(status));
    _channel.publish(StatusEvent { .serverId = std::string(id), .status = status, .error = std::move(error) });
}

auto ConnectionSupervisor::subscribeEvents(const std::string& id) -> std::vector<Unsubscribe>
{
    auto subscriptions = std::vector<Unsubscribe> {};
    subscriptions.push_back(_host.subscribe(host::connectedEvent(id),
                                            [this, id](const nlohmann::json& payload) { onConnected(id, payload); }));
    subscriptions.push_back(_host.subscribe(host::messageEvent(id),
                                            [this, id](const nlohmann::json& payload) { onMessage(id, payload); }));
    subscriptions.push_back(_host.subscribe(host::stoppedEvent(id), [this, id](const nlohmann::json&) {
        log::info("Server {} stopped", id);
        setStatus(id, ConnectionStatus::Stopped);
    }));
    return subscriptions;
}

void ConnectionSupervisor::onConnected(const std::string& id, const nlohmann::json& payload)
{
    log::info("Server {} connected", id);
    {
        auto lock = std::lock_guard(_mutex);
        _capabilities[id] = payload.is_object() ? payload.value("capabilities", nlohmann::json {}) : nlohmann::json {};
    }
    setStatus(id, ConnectionStatus::Connected);
}

void ConnectionSupervisor::onMessage(const std::string& id, const nlohmann::json& payload)
{
    auto session = sessionFor(id);
    if (!session)
    {
        log::debug("Message for {} without a session", id);
        return;
    }

    if (!payload.is_string())
    {
        session->deliver(payload);
        return;
    }

    auto message = json::parse(payload.get<std::string>());
    if (!message)
    {
        log::warning("Unparsable message from {}: {}", id, message.error().message);
        return;
    }
    session->deliver(*message);
}

void ConnectionSupervisor::scheduleStatusCheck(std::string id)
{
    auto lock = std::lock_guard(_checkMutex);
    std::erase_if(_statusChecks, [](const StatusCheck& check) { return check.done->load(); });

    auto done = std::make_shared<std::atomic<bool>>(false);
    auto thread = std::jthread([this, id = std::move(id), done](const std::stop_token& token) {
        {
            auto waitLock = std::unique_lock(_checkMutex);
            (void) _checkCv.wait_for(waitLock, token, _timings.statusCheckDelay, [] { return false; });
        }
        if (!token.stop_requested())
            checkStatus(id);
        done->store(true);
    });
    _statusChecks.push_back(StatusCheck { .done = std::move(done), .thread = std::move(thread) });
}

void ConnectionSupervisor::checkStatus(const std::string& id)
{
    log::debug("Checking status of {}", id);

    auto info = _host.invoke(host::ServerInfo, nlohmann::json { { "serverId", id } });
    if (!info)
    {
        log::warning("Status check for {} failed: {}", id, info.error().message);
        return;
    }

    auto const reported = info->is_object() ? statusValue(info->value("status", nlohmann::json {})) : "";
    if (statusFromString(reported) == ConnectionStatus::Connected && status(id) == ConnectionStatus::Connecting)
        setStatus(id, ConnectionStatus::Connected);
}

void ConnectionSupervisor::releaseSession(std::string_view id)
{
    auto session = std::shared_ptr<RpcSession> {};
    auto subscriptions = std::vector<Unsubscribe> {};
    {
        auto lock = std::lock_guard(_mutex);
        if (auto it = _sessions.find(id); it != _sessions.end())
        {
            session = std::move(it->second);
            _sessions.erase(it);
        }
        if (auto it = _subscriptions.find(id); it != _subscriptions.end())
        {
            subscriptions = std::move(it->second);
            _subscriptions.erase(it);
        }
    }

    for (auto& unsubscribe: subscriptions)
        if (unsubscribe)
            unsubscribe();

    if (session)
        session->close();
}

auto ConnectionSupervisor::sessionFor(std::string_view id) const -> std::shared_ptr<RpcSession>
{
    auto lock = std::lock_guard(_mutex);
    auto it = _sessions.find(id);
    return it != _sessions.end() ? it->second : nullptr;
}

auto ConnectionSupervisor::request(std::string_view id,
                                   std::string_view method,
                                   nlohmann::json params,
                                   std::string_view failure) -> Result<nlohmann::json>
{
    auto session = sessionFor(id);
    if (!session)
        return makeError(ErrorCode::NotConnected, std::format("Server {} not connected", id));

    auto response = session->call(method, std::move(params));
    if (!response)
    {
        log::error("{} on {}: {}", failure, id, response.error().message);
        return makeError(response.error().code, std::format("{}: {}", failure, response.error().message));
    }
    return response;
}

} // namespace vaultlink
