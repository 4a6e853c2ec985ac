// SPDX-License-Identifier: Apache-2.0
#include <mcp/SettingsStore.hpp>

#include "FakeHost.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace vaultlink;
using vaultlink::test::FakeHost;

TEST_CASE("SettingsStore::load yields defaults when the host has nothing stored", "[settings]")
{
    auto host = FakeHost {};
    auto store = SettingsStore(host);

    auto settings = store.load();
    REQUIRE(settings.has_value());
    CHECK(settings->enabled);
    CHECK(settings->servers.empty());
    CHECK(!settings->registry);
    CHECK(host.countCalls(host::LoadSettings) == 1);
}

TEST_CASE("SettingsStore::load clears persisted working directories", "[settings]")
{
    auto host = FakeHost {};
    host.reply(host::LoadSettings, nlohmann::json::parse(R"({
        "enabled": false,
        "servers": {
            "local": {"transport": {"type": "stdio", "command": "srv", "working_dir": "/old/vault"}},
            "remote": {"transport": {"type": "http", "url": "https://example.com"}},
            "broken": {"transport": {"type": "stdio"}}
        },
        "mcpServerRegistry": {"userServers": {}, "enabledServers": ["local"]}
    })"));

    auto settings = SettingsStore(host).load();
    REQUIRE(settings.has_value());
    CHECK(!settings->enabled);
    REQUIRE(settings->servers.size() == 2);
    CHECK(!settings->servers.at("local").stdio()->workingDir);
    CHECK(settings->servers.at("remote").http() != nullptr);

    auto const registry = SettingsStore::loadRegistry(*settings);
    CHECK(registry.isEnabled("local"));
}

TEST_CASE("SettingsStore::load propagates host failures", "[settings]")
{
    auto host = FakeHost {};
    host.fail(host::LoadSettings, "no settings backend");

    auto settings = SettingsStore(host).load();
    REQUIRE(!settings);
    CHECK(settings.error().code == ErrorCode::HostCallFailure);
}

TEST_CASE("SettingsStore::save strips working directories before sending", "[settings]")
{
    auto host = FakeHost {};
    auto store = SettingsStore(host);

    auto settings = McpSettings {};
    settings.servers.emplace(
        "local",
        ServerDescriptor {
            .id = "local",
            .transport = StdioTransport { .command = "srv", .workingDir = std::string("/vault") },
        });

    REQUIRE(store.save(settings).has_value());

    auto const saved = host.callsTo(host::SaveSettings);
    REQUIRE(saved.size() == 1);
    auto const& transport = saved[0]["settings"]["servers"]["local"]["transport"];
    CHECK(transport["command"] == "srv");
    CHECK(!transport.contains("working_dir"));

    // The caller's copy is untouched.
    CHECK(settings.servers.at("local").stdio()->workingDir == "/vault");
}

TEST_CASE("storeRegistry embeds the registry that loadRegistry restores", "[settings]")
{
    auto registry = ServerRegistry {};
    REQUIRE(registry
                .addUserServer("custom",
                               ServerDescriptor { .id = "custom", .transport = StdioTransport { .command = "node" } })
                .has_value());
    registry.setServerEnabled("custom", true);

    auto settings = McpSettings {};
    SettingsStore::storeRegistry(settings, registry);
    REQUIRE(settings.registry.has_value());
    CHECK(SettingsStore::loadRegistry(settings) == registry);

    SECTION("an invalid embedded registry falls back to an empty one")
    {
        settings.registry = nlohmann::json::array();
        CHECK(SettingsStore::loadRegistry(settings) == ServerRegistry {});
    }
}

TEST_CASE("settingsFromJson rejects a non-object blob", "[settings]")
{
    auto result = settingsFromJson(nlohmann::json::array());
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::ConfigError);
}
