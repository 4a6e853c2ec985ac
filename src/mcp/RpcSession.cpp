// SPDX-License-Identifier: Apache-2.0
#include "RpcSession.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <condition_variable>
#include <format>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace vaultlink
{

struct RpcSession::State
{
    struct PendingRequest
    {
        std::promise<Result<nlohmann::json>> promise;
        std::chrono::steady_clock::time_point deadline;
    };

    State(HostBridge& host, std::string serverId): host(host), serverId(std::move(serverId)) {}

    HostBridge& host;
    std::string const serverId;

    mutable std::mutex mutex;
    std::condition_variable idle;
    std::map<int64_t, PendingRequest> pending;
    int64_t nextId = 1;
    int inFlight = 0;
    bool closed = false;

    /// Completes the request with @p id if it is still pending. Returns false otherwise.
    auto complete(int64_t id, Result<nlohmann::json> outcome) -> bool
    {
        auto promise = std::promise<Result<nlohmann::json>> {};
        {
            auto lock = std::lock_guard(mutex);
            auto it = pending.find(id);
            if (it == pending.end())
                return false;
            promise = std::move(it->second.promise);
            pending.erase(it);
        }
        promise.set_value(std::move(outcome));
        return true;
    }

    auto evict(int64_t id) -> bool
    {
        auto lock = std::lock_guard(mutex);
        return pending.erase(id) > 0;
    }

    void hostCallFinished()
    {
        auto lock = std::lock_guard(mutex);
        --inFlight;
        if (inFlight == 0)
            idle.notify_all();
    }
};

namespace
{

    /// Turns the reply of a send call into a response message, if it is one.
    auto responseFromReply(const nlohmann::json& reply) -> Result<std::optional<nlohmann::json>>
    {
        if (reply.is_string())
        {
            auto const& text = reply.get_ref<const std::string&>();
            if (text.empty())
                return std::nullopt;
            return json::parse(text).transform(
                [](nlohmann::json message) { return std::optional { std::move(message) }; });
        }

        if (reply.is_object() && jsonrpc::integerId(reply))
            return std::optional { reply };

        // The host acknowledged the send only; the response arrives as an event.
        return std::nullopt;
    }

    auto outcomeFromMessage(const nlohmann::json& message) -> Result<nlohmann::json>
    {
        auto response = jsonrpc::parseResponse(message);
        if (!response)
            return std::unexpected(response.error());
        if (response->error)
            return makeError(ErrorCode::ProtocolError, response->error->message);
        return message;
    }

} // namespace

RpcSession::RpcSession(HostBridge& host,
                       ServerDescriptor descriptor,
                       std::chrono::milliseconds requestTimeout):
    _state(std::make_shared<State>(host, descriptor.id)),
    _descriptor(std::move(descriptor)),
    _requestTimeout(requestTimeout)
{
}

RpcSession::~RpcSession()
{
    close();

    auto lock = std::unique_lock(_state->mutex);
    _state->idle.wait(lock, [this] { return _state->inFlight == 0; });
}

auto RpcSession::call(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    auto message = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };
    if (!params.is_null())
        message["params"] = std::move(params);
    return request(std::move(message));
}

auto RpcSession::request(nlohmann::json message) -> Result<nlohmann::json>
{
    auto future = std::future<Result<nlohmann::json>> {};
    auto id = int64_t { 0 };
    {
        auto lock = std::lock_guard(_state->mutex);
        if (_state->closed)
            return makeError(ErrorCode::Disconnected, std::format("Session for {} is closed", serverId()));

        if (auto const existing = jsonrpc::integerId(message); existing && !_state->pending.contains(*existing))
            id = *existing;
        else
            id = _state->nextId++;
        message["id"] = id;

        auto entry = State::PendingRequest {
            .promise = {},
            .deadline = std::chrono::steady_clock::now() + _requestTimeout,
        };
        future = entry.promise.get_future();
        _state->pending.emplace(id, std::move(entry));
        ++_state->inFlight;
    }

    log::trace("[{}] -> {}", serverId(), message.dump());

    auto worker = std::thread([state = _state, id, args = nlohmann::json {
                                                       { "serverId", _state->serverId },
                                                       { "message", message.dump() },
                                                   }] {
        auto reply = state->host.invoke(host::SendMessage, args);
        if (!reply)
            state->complete(id, makeError(ErrorCode::HostCallFailure, reply.error().message));
        else if (auto response = responseFromReply(*reply); !response)
            state->complete(id, std::unexpected(response.error()));
        else if (*response)
        {
            auto const responseId = jsonrpc::integerId(**response);
            if (responseId && *responseId != id)
                log::warning("[{}] Reply id {} does not match request id {}", state->serverId, *responseId, id);
            state->complete(id, outcomeFromMessage(**response));
        }
        state->hostCallFinished();
    });
    worker.detach();

    if (future.wait_for(_requestTimeout) == std::future_status::timeout && _state->evict(id))
    {
        log::warning("[{}] Request {} timed out after {}", serverId(), id, _requestTimeout);
        return makeError(ErrorCode::Timeout,
                         std::format("Request {} to {} timed out after {}", id, serverId(), _requestTimeout));
    }

    return future.get();
}

auto RpcSession::notify(std::string_view method, nlohmann::json params) -> VoidResult
{
    if (isClosed())
        return makeError(ErrorCode::Disconnected, std::format("Session for {} is closed", serverId()));

    auto const message = jsonrpc::makeNotification(method, std::move(params));
    auto reply = _state->host.invoke(host::SendMessage,
                                     nlohmann::json {
                                         { "serverId", serverId() },
                                         { "message", message.dump() },
                                     });
    if (!reply)
        return makeError(ErrorCode::HostCallFailure, reply.error().message);
    return {};
}

void RpcSession::deliver(const nlohmann::json& message)
{
    if (auto const id = jsonrpc::integerId(message); id && jsonrpc::isResponse(message))
    {
        if (!_state->complete(*id, outcomeFromMessage(message)))
            log::debug("[{}] Dropping response for unknown or expired request {}", serverId(), *id);
        return;
    }

    log::debug("[{}] Server message: {}", serverId(), message.value("method", std::string { "<none>" }));
}

void RpcSession::close()
{
    auto pending = std::map<int64_t, State::PendingRequest> {};
    {
        auto lock = std::lock_guard(_state->mutex);
        if (_state->closed)
            return;
        _state->closed = true;
        pending.swap(_state->pending);
    }

    for (auto& [id, entry]: pending)
        entry.promise.set_value(makeError(ErrorCode::Disconnected, std::format("{} disconnected", serverId())));

    if (!pending.empty())
        log::debug("[{}] Rejected {} pending request(s) on close", serverId(), pending.size());
}

auto RpcSession::isClosed() const -> bool
{
    auto lock = std::lock_guard(_state->mutex);
    return _state->closed;
}

auto RpcSession::pendingCount() const -> std::size_t
{
    auto lock = std::lock_guard(_state->mutex);
    return _state->pending.size();
}

auto RpcSession::serverId() const -> const std::string&
{
    return _state->serverId;
}

auto RpcSession::descriptor() const -> const ServerDescriptor&
{
    return _descriptor;
}

} // namespace vaultlink
