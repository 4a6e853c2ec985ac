// SPDX-License-Identifier: Apache-2.0
#include <mcp/RpcSession.hpp>

#include "FakeHost.hpp"

#include <catch2/catch_test_macros.hpp>

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace vaultlink;
using namespace std::chrono_literals;
using vaultlink::test::FakeHost;

namespace
{

auto descriptorFor(std::string id) -> ServerDescriptor
{
    return ServerDescriptor { .id = std::move(id), .transport = StdioTransport { .command = "srv" } };
}

} // namespace

TEST_CASE("RpcSession::call returns the response the host replies with", "[session]")
{
    auto host = FakeHost {};
    host.serve([](const std::string& method, const nlohmann::json&) {
        return nlohmann::json { { "echo", method } };
    });

    auto session = RpcSession(host, descriptorFor("srv"), 1s);
    auto first = session.call("tools/list");
    auto second = session.call("resources/list", nlohmann::json { { "cursor", "x" } });

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK((*first)["result"]["echo"] == "tools/list");
    CHECK((*second)["result"]["echo"] == "resources/list");
    CHECK(session.pendingCount() == 0);

    auto const sent = host.callsTo(host::SendMessage);
    REQUIRE(sent.size() == 2);
    CHECK(sent[0]["serverId"] == "srv");
    auto const firstMessage = FakeHost::messageOf(sent[0]);
    auto const secondMessage = FakeHost::messageOf(sent[1]);
    CHECK(firstMessage["jsonrpc"] == "2.0");
    CHECK(firstMessage["id"] == 1);
    CHECK(!firstMessage.contains("params"));
    CHECK(secondMessage["id"] == 2);
    CHECK(secondMessage["params"]["cursor"] == "x");
}

TEST_CASE("RpcSession parses a reply delivered as a JSON string", "[session]")
{
    auto host = FakeHost {};
    host.on(host::SendMessage, [](const nlohmann::json& args) -> Result<nlohmann::json> {
        auto const message = FakeHost::messageOf(args);
        auto const response = nlohmann::json { { "jsonrpc", "2.0" }, { "id", message["id"] }, { "result", 7 } };
        return nlohmann::json(response.dump());
    });

    auto session = RpcSession(host, descriptorFor("srv"), 1s);
    auto result = session.call("ping");
    REQUIRE(result.has_value());
    CHECK((*result)["result"] == 7);
}

TEST_CASE("RpcSession keeps concurrent calls in flight together with distinct ids", "[session]")
{
    constexpr auto Callers = std::size_t { 4 };

    auto host = FakeHost {};
    auto arrivedMutex = std::mutex {};
    auto arrivedCv = std::condition_variable {};
    auto arrived = std::size_t { 0 };

    // Every reply waits until all callers have sent, so one blocked call would stall the rest.
    host.on(host::SendMessage, [&](const nlohmann::json& args) -> Result<nlohmann::json> {
        auto const message = FakeHost::messageOf(args);
        auto lock = std::unique_lock(arrivedMutex);
        ++arrived;
        arrivedCv.notify_all();
        if (!arrivedCv.wait_for(lock, 2s, [&] { return arrived == Callers; }))
            return makeError(ErrorCode::HostCallFailure, "callers were serialized");
        return nlohmann::json { { "jsonrpc", "2.0" }, { "id", message["id"] }, { "result", message["method"] } };
    });

    auto session = RpcSession(host, descriptorFor("srv"), 5s);

    auto resultsMutex = std::mutex {};
    auto results = std::vector<Result<nlohmann::json>> {};
    {
        auto callers = std::vector<std::jthread> {};
        for (auto i = std::size_t { 0 }; i < Callers; ++i)
            callers.emplace_back([&] {
                auto result = session.call("tools/list");
                auto lock = std::lock_guard(resultsMutex);
                results.push_back(std::move(result));
            });
    }

    REQUIRE(results.size() == Callers);
    auto ids = std::set<int64_t> {};
    for (auto const& result: results)
    {
        REQUIRE(result.has_value());
        CHECK((*result)["result"] == "tools/list");
        ids.insert((*result)["id"].get<int64_t>());
    }
    CHECK(ids.size() == Callers);
    CHECK(session.pendingCount() == 0);
}

TEST_CASE("RpcSession turns error responses into ProtocolError", "[session]")
{
    auto host = FakeHost {};
    host.on(host::SendMessage, [](const nlohmann::json& args) -> Result<nlohmann::json> {
        auto const message = FakeHost::messageOf(args);
        return nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", message["id"] },
            { "error", { { "code", -32601 }, { "message", "Method not found" } } },
        };
    });

    auto session = RpcSession(host, descriptorFor("srv"), 1s);
    auto result = session.call("nope");
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::ProtocolError);
    CHECK(result.error().message == "Method not found");
}

TEST_CASE("RpcSession reports host failures", "[session]")
{
    auto host = FakeHost {};
    host.fail(host::SendMessage, "pipe closed");

    auto session = RpcSession(host, descriptorFor("srv"), 1s);
    auto result = session.call("tools/list");
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::HostCallFailure);
    CHECK(result.error().message == "pipe closed");
    CHECK(session.pendingCount() == 0);
}

TEST_CASE("RpcSession completes requests from delivered messages", "[session]")
{
    auto host = FakeHost {};
    auto session = RpcSession(host, descriptorFor("srv"), 2s);

    auto deliverersMutex = std::mutex {};
    auto deliverers = std::vector<std::jthread> {};
    host.on(host::SendMessage, [&](const nlohmann::json& args) -> Result<nlohmann::json> {
        auto const id = FakeHost::messageOf(args)["id"];
        auto lock = std::lock_guard(deliverersMutex);
        deliverers.emplace_back([&session, id] {
            std::this_thread::sleep_for(20ms);
            session.deliver(nlohmann::json { { "method", "notifications/progress" } });
            session.deliver(nlohmann::json { { "jsonrpc", "2.0" }, { "id", id }, { "result", "late" } });
        });
        return nlohmann::json(nullptr);
    });

    auto result = session.call("tools/call");
    REQUIRE(result.has_value());
    CHECK((*result)["result"] == "late");

    auto lock = std::lock_guard(deliverersMutex);
    deliverers.clear();
}

TEST_CASE("RpcSession times out and forgets the request", "[session]")
{
    auto host = FakeHost {};
    host.reply(host::SendMessage, nullptr);

    auto session = RpcSession(host, descriptorFor("slow"), 50ms);
    auto result = session.call("tools/list");
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::Timeout);
    CHECK(result.error().message.contains("slow"));
    CHECK(session.pendingCount() == 0);

    // A response arriving after the timeout is dropped.
    session.deliver(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 }, { "result", 1 } });
    CHECK(session.pendingCount() == 0);
}

TEST_CASE("RpcSession::close rejects pending requests and later calls", "[session]")
{
    auto host = FakeHost {};
    host.reply(host::SendMessage, nullptr);

    auto session = RpcSession(host, descriptorFor("srv"), 5s);
    auto closer = std::jthread([&session] {
        while (session.pendingCount() == 0)
            std::this_thread::sleep_for(1ms);
        session.close();
    });

    auto pending = session.call("tools/list");
    REQUIRE(!pending);
    CHECK(pending.error().code == ErrorCode::Disconnected);
    closer.join();

    CHECK(session.isClosed());
    auto afterClose = session.call("tools/list");
    REQUIRE(!afterClose);
    CHECK(afterClose.error().code == ErrorCode::Disconnected);
    CHECK(!session.notify("notifications/cancelled"));

    session.close();
    CHECK(session.isClosed());
}

TEST_CASE("RpcSession::request keeps a caller-supplied id", "[session]")
{
    auto host = FakeHost {};
    host.serve([](const std::string&, const nlohmann::json&) { return nlohmann::json::object(); });

    auto session = RpcSession(host, descriptorFor("srv"), 1s);
    auto result = session.request(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 42 }, { "method", "ping" } });
    REQUIRE(result.has_value());
    CHECK((*result)["id"] == 42);
    CHECK(FakeHost::messageOf(host.callsTo(host::SendMessage).at(0))["id"] == 42);
}

TEST_CASE("RpcSession::notify sends a message without id", "[session]")
{
    auto host = FakeHost {};
    auto session = RpcSession(host, descriptorFor("srv"), 1s);

    REQUIRE(session.notify("notifications/initialized").has_value());

    auto const sent = host.callsTo(host::SendMessage);
    REQUIRE(sent.size() == 1);
    auto const message = FakeHost::messageOf(sent[0]);
    CHECK(message["method"] == "notifications/initialized");
    CHECK(!message.contains("id"));
    CHECK(session.pendingCount() == 0);
}
