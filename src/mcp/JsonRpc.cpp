// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace vaultlink::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (err.is_object())
        {
            response.error = RpcError {
                .code = err.value("code", 0),
                .message = err.value("message", std::string("Unknown error")),
                .data = err.value("data", nlohmann::json {}),
            };
        }
        else
        {
            auto text = err.is_string() ? err.get<std::string>() : err.dump();
            response.error = RpcError { .code = 0, .message = std::move(text), .data = {} };
        }
    }
    else if (!message.contains("method"))
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto integerId(const nlohmann::json& message) -> std::optional<int64_t>
{
    if (!message.is_object() || !message.contains("id"))
        return std::nullopt;

    auto const& id = message["id"];
    if (!id.is_number_integer())
        return std::nullopt;

    auto const value = id.get<int64_t>();
    if (value == 0)
        return std::nullopt;
    return value;
}

auto isResponse(const nlohmann::json& message) -> bool
{
    return message.is_object() && message.contains("id") && !message.contains("method")
           && (message.contains("result") || message.contains("error"));
}

} // namespace vaultlink::jsonrpc
