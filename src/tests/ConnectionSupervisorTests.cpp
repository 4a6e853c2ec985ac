// SPDX-License-Identifier: Apache-2.0
#include <mcp/BuiltinCatalogue.hpp>
#include <mcp/ConnectionSupervisor.hpp>

#include "FakeHost.hpp"

#include <catch2/catch_test_macros.hpp>

#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using namespace vaultlink;
using namespace std::chrono_literals;
using vaultlink::test::FakeHost;

namespace
{

constexpr auto FastTimings = SupervisorTimings {
    .requestTimeout = 2'000ms,
    .statusCheckDelay = 10ms,
    .stopSettleDelay = 0ms,
    .restartSettleDelay = 0ms,
};

/// Status check delay long enough that the check never runs during a test.
constexpr auto NoStatusCheck = SupervisorTimings {
    .requestTimeout = 2'000ms,
    .statusCheckDelay = 60'000ms,
    .stopSettleDelay = 0ms,
    .restartSettleDelay = 0ms,
};

auto stdioDescriptor(std::string command = "srv") -> ServerDescriptor
{
    return ServerDescriptor { .id = "", .transport = StdioTransport { .command = std::move(command) } };
}

/// Records every published status event.
struct StatusRecorder
{
    explicit StatusRecorder(StatusChannel& channel)
    {
        (void) channel.subscribe([this](const StatusEvent& event) {
            auto lock = std::lock_guard(mutex);
            events.push_back(event);
        });
    }

    auto snapshot() -> std::vector<StatusEvent>
    {
        auto lock = std::lock_guard(mutex);
        return events;
    }

    std::mutex mutex;
    std::vector<StatusEvent> events;
};

template <typename Predicate>
auto waitUntil(Predicate predicate, std::chrono::milliseconds timeout = 2'000ms) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

} // namespace

TEST_CASE("connect stops stale instances, starts the server and tracks its status", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto recorder = StatusRecorder(channel);
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);

    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());
    CHECK(supervisor.status("fs") == ConnectionStatus::Connecting);

    auto const calls = host.calls();
    REQUIRE(calls.size() == 2);
    CHECK(calls[0].command == host::StopServer);
    CHECK(calls[1].command == host::StartServer);
    CHECK(calls[1].args["serverId"] == "fs");
    CHECK(calls[1].args["config"]["id"] == "fs");
    CHECK(calls[1].args["config"]["transport"]["command"] == "srv");

    host.emit(host::connectedEvent("fs"), nlohmann::json { { "capabilities", { { "tools", nlohmann::json::object() } } } });
    CHECK(supervisor.status("fs") == ConnectionStatus::Connected);
    CHECK(supervisor.capabilities("fs").contains("tools"));
    CHECK(supervisor.connectedServers() == std::vector<std::string> { "fs" });
    CHECK(supervisor.sessionDescriptor("fs")->id == "fs");

    auto const events = recorder.snapshot();
    REQUIRE(events.size() == 2);
    CHECK(events[0].status == ConnectionStatus::Connecting);
    CHECK(events[1].status == ConnectionStatus::Connected);
}

TEST_CASE("connect is a no-op while the server is connecting or connected", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);

    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());
    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());
    CHECK(host.countCalls(host::StartServer) == 1);

    host.emit(host::connectedEvent("fs"), nlohmann::json::object());
    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());
    CHECK(host.countCalls(host::StartServer) == 1);
}

TEST_CASE("concurrent connects start the server once", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);

    {
        auto threads = std::vector<std::jthread> {};
        for (auto i = 0; i < 8; ++i)
            threads.emplace_back([&] { (void) supervisor.connect("fs", stdioDescriptor()); });
    }

    CHECK(host.countCalls(host::StartServer) == 1);
}

TEST_CASE("a failed start marks the server as errored", "[supervisor]")
{
    auto host = FakeHost {};
    host.fail(host::StartServer, "binary not found");
    auto channel = StatusChannel {};
    auto recorder = StatusRecorder(channel);
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);

    auto result = supervisor.connect("fs", stdioDescriptor());
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::HostCallFailure);
    CHECK(result.error().message == "binary not found");
    CHECK(supervisor.status("fs") == ConnectionStatus::Error);

    auto const events = recorder.snapshot();
    REQUIRE(!events.empty());
    CHECK(events.back().status == ConnectionStatus::Error);
    CHECK(events.back().error == "binary not found");

    SECTION("an errored server may be connected again")
    {
        host.reply(host::StartServer, nullptr);
        REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());
        CHECK(supervisor.status("fs") == ConnectionStatus::Connecting);
    }
}

TEST_CASE("the delayed status check promotes a connecting server", "[supervisor]")
{
    auto host = FakeHost {};
    host.reply(host::ServerInfo, nlohmann::json { { "status", "Connected" } });
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, FastTimings);

    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());
    CHECK(waitUntil([&] { return supervisor.status("fs") == ConnectionStatus::Connected; }));
    CHECK(host.callsTo(host::ServerInfo).at(0)["serverId"] == "fs");
}

TEST_CASE("the status check leaves servers alone that are no longer connecting", "[supervisor]")
{
    auto host = FakeHost {};
    host.reply(host::ServerInfo, nlohmann::json { { "status", "Connected" } });
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, FastTimings);

    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());
    host.emit(host::stoppedEvent("fs"), nlohmann::json::object());
    REQUIRE(waitUntil([&] { return host.countCalls(host::ServerInfo) == 1; }));
    std::this_thread::sleep_for(20ms);
    CHECK(supervisor.status("fs") == ConnectionStatus::Stopped);
}

TEST_CASE("invokeTool routes responses delivered as host message events", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);
    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());

    auto emittersMutex = std::mutex {};
    auto emitters = std::vector<std::jthread> {};
    host.on(host::SendMessage, [&](const nlohmann::json& args) -> Result<nlohmann::json> {
        auto const message = FakeHost::messageOf(args);
        auto const response = nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", message["id"] },
            { "result", { { "content", { { { "type", "text" }, { "text", message["params"]["name"] } } } } } },
        };
        auto lock = std::lock_guard(emittersMutex);
        emitters.emplace_back([&host, response] {
            std::this_thread::sleep_for(10ms);
            host.emit(host::messageEvent("fs"), nlohmann::json(response.dump()));
        });
        return nlohmann::json(nullptr);
    });

    auto result = supervisor.invokeTool("fs", "read_file", nlohmann::json { { "path", "a.md" } });
    REQUIRE(result.has_value());
    CHECK((*result)["content"][0]["text"] == "read_file");

    auto const sent = FakeHost::messageOf(host.callsTo(host::SendMessage).at(0));
    CHECK(sent["method"] == "tools/call");
    CHECK(sent["params"]["arguments"]["path"] == "a.md");

    auto lock = std::lock_guard(emittersMutex);
    emitters.clear();
}

TEST_CASE("requests fail for servers without a session", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);

    auto tool = supervisor.invokeTool("ghost", "x", nlohmann::json::object());
    REQUIRE(!tool);
    CHECK(tool.error().code == ErrorCode::NotConnected);
    CHECK(tool.error().message == "Server ghost not connected");

    CHECK(supervisor.listTools("ghost").error().code == ErrorCode::NotConnected);
    CHECK(supervisor.readResource("ghost", "file:///a").error().code == ErrorCode::NotConnected);
    CHECK(supervisor.reconnect("ghost").error().code == ErrorCode::NotConnected);
    CHECK(host.countCalls(host::SendMessage) == 0);
}

TEST_CASE("tool errors carry the protocol error text", "[supervisor]")
{
    auto host = FakeHost {};
    host.on(host::SendMessage, [](const nlohmann::json& args) -> Result<nlohmann::json> {
        return nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", FakeHost::messageOf(args)["id"] },
            { "error", { { "code", -32000 }, { "message", "file not found" } } },
        };
    });
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);
    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());

    auto result = supervisor.invokeTool("fs", "read_file", nlohmann::json::object());
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::ProtocolError);
    CHECK(result.error().message == "Tool invocation failed: file not found");

    auto resource = supervisor.readResource("fs", "file:///missing");
    REQUIRE(!resource);
    CHECK(resource.error().message == "Resource read failed: file not found");
}

TEST_CASE("listTools and listResources return arrays", "[supervisor]")
{
    auto host = FakeHost {};
    host.serve([](const std::string& method, const nlohmann::json&) -> nlohmann::json {
        if (method == "tools/list")
            return nlohmann::json { { "tools", { { { "name", "read_file" } }, { { "name", "write_file" } } } } };
        return nlohmann::json::object();
    });
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);
    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());

    auto tools = supervisor.listTools("fs");
    REQUIRE(tools.has_value());
    REQUIRE(tools->is_array());
    CHECK(tools->size() == 2);
    CHECK((*tools)[1]["name"] == "write_file");

    auto resources = supervisor.listResources("fs");
    REQUIRE(resources.has_value());
    CHECK(resources->is_array());
    CHECK(resources->empty());
}

TEST_CASE("disconnect cleans up even when the host fails to stop the server", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);
    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());
    host.emit(host::connectedEvent("fs"), nlohmann::json { { "capabilities", { { "tools", true } } } });
    CHECK(host.subscriberCount(host::messageEvent("fs")) == 1);

    host.fail(host::StopServer, "no such process");
    auto result = supervisor.disconnect("fs");
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::HostCallFailure);

    CHECK(supervisor.status("fs") == ConnectionStatus::Disconnected);
    CHECK(supervisor.serverIds().empty());
    CHECK(supervisor.capabilities("fs").is_null());
    CHECK(host.subscriberCount(host::connectedEvent("fs")) == 0);
    CHECK(host.subscriberCount(host::messageEvent("fs")) == 0);
    CHECK(host.subscriberCount(host::stoppedEvent("fs")) == 0);
}

TEST_CASE("disconnectAll continues past failures and forgets all servers", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);
    REQUIRE(supervisor.connect("a", stdioDescriptor()).has_value());
    REQUIRE(supervisor.connect("b", stdioDescriptor()).has_value());

    host.on(host::StopServer, [](const nlohmann::json& args) -> Result<nlohmann::json> {
        if (args["serverId"] == "a")
            return makeError(ErrorCode::HostCallFailure, "stuck");
        return nlohmann::json(nullptr);
    });

    auto const outcomes = supervisor.disconnectAll();
    REQUIRE(outcomes.size() == 2);
    CHECK(outcomes[0].serverId == "a");
    CHECK(!outcomes[0].succeeded());
    CHECK(outcomes[1].succeeded());
    CHECK(supervisor.serverIds().empty());
    CHECK(supervisor.statuses().empty());
}

TEST_CASE("reconnect restarts the server with its session descriptor", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);
    REQUIRE(supervisor.connect("fs", stdioDescriptor("first")).has_value());
    host.emit(host::connectedEvent("fs"), nlohmann::json::object());

    REQUIRE(supervisor.reconnect("fs").has_value());
    auto const starts = host.callsTo(host::StartServer);
    REQUIRE(starts.size() == 2);
    CHECK(starts[1]["config"]["transport"]["command"] == "first");
    CHECK(supervisor.status("fs") == ConnectionStatus::Connecting);
}

TEST_CASE("stopped events mark the server as stopped", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);
    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());

    host.emit(host::stoppedEvent("fs"), nullptr);
    CHECK(supervisor.status("fs") == ConnectionStatus::Stopped);
}

TEST_CASE("refreshStatuses merges the host view and broadcasts changes only", "[supervisor]")
{
    auto host = FakeHost {};
    host.reply(host::ServerStatuses,
               nlohmann::json { { "a", "Connected" }, { "b", { { "status", "stopped" } } } });
    auto channel = StatusChannel {};
    auto recorder = StatusRecorder(channel);
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);

    REQUIRE(supervisor.refreshStatuses().has_value());
    CHECK(supervisor.status("a") == ConnectionStatus::Connected);
    CHECK(supervisor.status("b") == ConnectionStatus::Stopped);
    CHECK(recorder.snapshot().size() == 2);

    REQUIRE(supervisor.refreshStatuses().has_value());
    CHECK(recorder.snapshot().size() == 2);

    host.fail(host::ServerStatuses, "host gone");
    CHECK(supervisor.refreshStatuses().error().code == ErrorCode::HostCallFailure);
}

TEST_CASE("toHostConfig synthesizes http headers and a bearer token", "[supervisor]")
{
    auto const descriptor = ServerDescriptor {
        .id = "remote",
        .transport = HttpTransport {
            .url = "https://example.com/mcp",
            .headers = { { "X-Team", "docs" } },
            .apiKey = "s3cret",
        },
    };

    auto const config = ConnectionSupervisor::toHostConfig(descriptor);
    auto const& transport = config["transport"];
    CHECK(transport["type"] == "http");
    CHECK(transport["url"] == "https://example.com/mcp");
    CHECK(!transport.contains("api_key"));

    auto const& headers = transport["headers"];
    CHECK(headers["X-Team"] == "docs");
    CHECK(headers["Authorization"] == "Bearer s3cret");
    CHECK(headers["Accept"] == "application/json, text/event-stream");
    CHECK(headers["Content-Type"] == "application/json");
    CHECK(headers.contains("MCP-Protocol-Version"));

    SECTION("no Authorization header without a key")
    {
        auto anonymous = descriptor;
        anonymous.http()->apiKey.reset();
        CHECK(!ConnectionSupervisor::toHostConfig(anonymous)["transport"]["headers"].contains("Authorization"));
    }
}

TEST_CASE("bindUserServer expands placeholders and binds the root", "[supervisor]")
{
    auto const stored = ServerDescriptor {
        .id = "",
        .transport = StdioTransport {
            .command = "${BUNDLE_PATH}/tool",
            .args = { "${VAULT_PATH}/notes" },
            .env = { { "VAULT_PATH", "/stale" }, { "MODE", "fast" } },
        },
    };

    auto const bound = ConnectionSupervisor::bindUserServer("tool", stored, "/vault", "/bundle");
    CHECK(bound.id == "tool");
    REQUIRE(bound.stdio() != nullptr);
    CHECK(bound.stdio()->command == "/bundle/tool");
    CHECK(bound.stdio()->args == std::vector<std::string> { "/vault/notes" });
    CHECK(bound.stdio()->workingDir == "/vault");
    CHECK(bound.stdio()->env.at("VAULT_PATH") == "/vault");
    CHECK(bound.stdio()->env.at("MODE") == "fast");
}

TEST_CASE("startAllEnabled connects enabled built-ins and user servers", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);

    auto registry = ServerRegistry {};
    registry.setServerEnabled("vault-filesystem", true);
    registry.setServerEnabled("custom", true);

    auto settings = McpSettings {};
    settings.servers.emplace("custom", ServerDescriptor { .id = "custom", .transport = StdioTransport { .command = "c" } });
    settings.servers.emplace("disabled", ServerDescriptor { .id = "disabled", .transport = StdioTransport { .command = "d" } });

    SECTION("nothing is started without a root")
    {
        CHECK(supervisor.startAllEnabled("", "/bundle", settings, registry).empty());
        CHECK(host.countCalls(host::StartServer) == 0);
    }

    SECTION("enabled servers are bound to the root")
    {
        auto const outcomes = supervisor.startAllEnabled("/vault", "/bundle", settings, registry);
        REQUIRE(outcomes.size() == 2);
        CHECK(outcomes[0].serverId == "vault-filesystem");
        CHECK(outcomes[1].serverId == "custom");
        CHECK(outcomes[0].succeeded());
        CHECK(outcomes[1].succeeded());

        auto const starts = host.callsTo(host::StartServer);
        REQUIRE(starts.size() == 2);
        CHECK(starts[1]["config"]["transport"]["working_dir"] == "/vault");
        CHECK(supervisor.status("disabled") == ConnectionStatus::Disconnected);
    }

    SECTION("one failure does not stop the others")
    {
        host.on(host::StartServer, [](const nlohmann::json& args) -> Result<nlohmann::json> {
            if (args["serverId"] == "vault-filesystem")
                return makeError(ErrorCode::HostCallFailure, "missing binary");
            return nlohmann::json(nullptr);
        });

        auto const outcomes = supervisor.startAllEnabled("/vault", "/bundle", settings, registry);
        REQUIRE(outcomes.size() == 2);
        CHECK(!outcomes[0].succeeded());
        CHECK(outcomes[1].succeeded());
    }
}

TEST_CASE("a stop event from the previous instance does not release the connect claim", "[supervisor]")
{
    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);

    auto starts = 0;
    host.on(host::StartServer, [&](const nlohmann::json&) -> Result<nlohmann::json> {
        if (++starts == 1)
            return makeError(ErrorCode::HostCallFailure, "crashed");
        return nlohmann::json(nullptr);
    });
    REQUIRE(!supervisor.connect("fs", stdioDescriptor()));
    REQUIRE(supervisor.status("fs") == ConnectionStatus::Error);

    // The old instance reports its stop while the next connect is in progress, and another
    // caller tries to connect right then.
    auto nested = std::optional<VoidResult> {};
    host.on(host::StopServer, [&](const nlohmann::json&) -> Result<nlohmann::json> {
        if (!nested)
        {
            host.emit(host::stoppedEvent("fs"), nlohmann::json::object());
            nested = supervisor.connect("fs", stdioDescriptor());
        }
        return nlohmann::json(nullptr);
    });

    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());
    REQUIRE(nested.has_value());
    CHECK(nested->has_value());
    CHECK(host.countCalls(host::StartServer) == 2);
    CHECK(supervisor.status("fs") == ConnectionStatus::Connecting);
}

TEST_CASE("connect waits for the stop to settle only after a successful stop", "[supervisor]")
{
    auto timings = NoStatusCheck;
    timings.stopSettleDelay = 300ms;

    auto host = FakeHost {};
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, timings);

    auto timedConnect = [&] {
        auto const start = std::chrono::steady_clock::now();
        REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());
        return std::chrono::steady_clock::now() - start;
    };

    SECTION("stop succeeded")
    {
        CHECK(timedConnect() >= 300ms);
    }

    SECTION("stop failed")
    {
        host.fail(host::StopServer, "not running");
        CHECK(timedConnect() < 300ms);
    }
}

TEST_CASE("disconnect rejects every outstanding call on the server", "[supervisor]")
{
    auto host = FakeHost {};
    host.reply(host::SendMessage, nullptr);
    auto channel = StatusChannel {};
    auto supervisor = ConnectionSupervisor(host, channel, NoStatusCheck);
    REQUIRE(supervisor.connect("fs", stdioDescriptor()).has_value());

    auto resultsMutex = std::mutex {};
    auto results = std::vector<Result<nlohmann::json>> {};
    {
        auto callers = std::vector<std::jthread> {};
        for (auto const* tool: { "read_file", "search" })
            callers.emplace_back([&, tool] {
                auto result = supervisor.invokeTool("fs", tool, nlohmann::json::object());
                auto lock = std::lock_guard(resultsMutex);
                results.push_back(std::move(result));
            });

        REQUIRE(waitUntil([&] { return host.countCalls(host::SendMessage) == 2; }));
        CHECK(supervisor.disconnect("fs").has_value());
    }

    REQUIRE(results.size() == 2);
    for (auto const& result: results)
    {
        REQUIRE(!result);
        CHECK(result.error().code == ErrorCode::Disconnected);
    }
    CHECK(supervisor.status("fs") == ConnectionStatus::Disconnected);

    auto const sent = host.callsTo(host::SendMessage);
    CHECK(FakeHost::messageOf(sent[0])["id"] != FakeHost::messageOf(sent[1])["id"]);
}
