// SPDX-License-Identifier: Apache-2.0
#include <mcp/ConfigGenerator.hpp>

#include "FakeHost.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>
#include <vector>

using namespace vaultlink;
using vaultlink::test::FakeHost;

namespace
{

auto userStdio(std::string command, std::vector<std::string> args = {}, std::map<std::string, std::string> env = {})
    -> ServerDescriptor
{
    return ServerDescriptor {
        .id = "",
        .transport = StdioTransport { .command = std::move(command), .args = std::move(args), .env = std::move(env) },
    };
}

} // namespace

TEST_CASE("detectAgent matches agent names case-insensitively in priority order", "[generator]")
{
    CHECK(detectAgent("claude") == AgentKind::Claude);
    CHECK(detectAgent("/usr/local/bin/Claude --resume") == AgentKind::Claude);
    CHECK(detectAgent("npx @google/gemini-cli") == AgentKind::Gemini);
    CHECK(detectAgent("CODEX") == AgentKind::Codex);
    CHECK(detectAgent("claude-wrapper --for gemini") == AgentKind::Claude);
    CHECK(detectAgent("vim") == AgentKind::Unknown);
    CHECK(detectAgent("") == AgentKind::Unknown);
}

TEST_CASE("collectServers merges enabled built-ins and user servers", "[generator]")
{
    auto host = FakeHost {};
    auto registry = ServerRegistry {};
    REQUIRE(registry.addUserServer("notes", userStdio("${BUNDLE_PATH}/notes", { "${VAULT_PATH}" })).has_value());
    REQUIRE(registry.addUserServer("off", userStdio("off")).has_value());
    registry.setServerEnabled("notes", true);
    registry.setServerEnabled("vault-filesystem", true);

    auto generator = ConfigGenerator(registry, host);
    auto const servers = generator.collectServers("/vault", "/bundle");

    REQUIRE(servers.size() == 2);
    CHECK(servers.contains("vault-filesystem"));
    CHECK(!servers.contains("vault-search"));
    CHECK(!servers.contains("off"));
    CHECK(servers.at("notes").stdio()->command == "/bundle/notes");
    CHECK(servers.at("notes").stdio()->args.at(0) == "/vault");

    SECTION("a user server overrides a built-in with the same id")
    {
        REQUIRE(registry.addUserServer("vault-filesystem", userStdio("custom-fs")).has_value());
        auto const merged = generator.collectServers("/vault", "/bundle");
        CHECK(merged.at("vault-filesystem").stdio()->command == "custom-fs");
    }
}

TEST_CASE("claudeConfig writes .mcp.json into the root", "[generator]")
{
    auto servers = ServerRegistry::ServerMap {};
    servers.emplace("local", userStdio("node", { "server.js" }, { { "TOKEN", "abc" } }));
    servers.emplace("bare", userStdio("bare"));
    servers.emplace("remote", ServerDescriptor { .id = "remote", .transport = HttpTransport { .url = "https://x/mcp" } });

    auto const output = ConfigGenerator::claudeConfig(servers, "/vault");
    CHECK(output.path == "/vault/.mcp.json");
    CHECK(output.format == ConfigFormat::Json);
    CHECK(output.content.contains("\n  \"mcpServers\""));

    auto const json = nlohmann::json::parse(output.content)["mcpServers"];
    CHECK(json["local"]["command"] == "node");
    CHECK(json["local"]["args"][0] == "server.js");
    CHECK(json["local"]["env"]["TOKEN"] == "abc");
    CHECK(!json["local"].contains("type"));
    CHECK(!json["bare"].contains("env"));
    CHECK(json["remote"] == nlohmann::json { { "type", "http" }, { "url", "https://x/mcp" } });
}

TEST_CASE("geminiConfig rewrites env placeholders and adds timeout and trust", "[generator]")
{
    auto servers = ServerRegistry::ServerMap {};
    servers.emplace("local", userStdio("node", {}, { { "KEY", "${API_KEY}/x" } }));
    servers.emplace("remote", ServerDescriptor { .id = "remote", .transport = HttpTransport { .url = "https://x" } });

    auto const output = ConfigGenerator::geminiConfig(servers, "/home/me");
    CHECK(output.path == "/home/me/.gemini/settings.json");

    auto const json = nlohmann::json::parse(output.content)["mcpServers"];
    CHECK(json["local"]["env"]["KEY"] == "$API_KEY/x");
    CHECK(json["local"]["timeout"] == 60000);
    CHECK(json["local"]["trust"] == false);
    CHECK(json["remote"]["url"] == "https://x");
    CHECK(json["remote"]["timeout"] == 60000);

    CHECK(ConfigGenerator::geminiEnvValue("${A}:${B}") == "$A:$B");
    CHECK(ConfigGenerator::geminiEnvValue("${}") == "${}");
    CHECK(ConfigGenerator::geminiEnvValue("plain $X") == "plain $X");
    CHECK(ConfigGenerator::geminiEnvValue("${open") == "${open");
}

TEST_CASE("codexConfig emits one TOML table per server", "[generator]")
{
    auto servers = ServerRegistry::ServerMap {};
    servers.emplace("local", userStdio("node", { "a.js", "--flag" }, { { "TOKEN", "t" } }));
    servers.emplace("remote", ServerDescriptor { .id = "remote", .transport = HttpTransport { .url = "https://x" } });

    auto const output = ConfigGenerator::codexConfig(servers, "/home/me");
    CHECK(output.path == "/home/me/.codex/config.toml");
    CHECK(output.format == ConfigFormat::Toml);
    CHECK(output.content
          == "[mcp_servers.\"local\"]\n"
             "command = \"node\"\n"
             "args = [\"a.js\", \"--flag\"]\n"
             "\n"
             "[mcp_servers.\"local\".env]\n"
             "TOKEN = \"t\"\n"
             "\n"
             "[mcp_servers.\"remote\"]\n"
             "url = \"https://x\"\n"
             "\n");
}

TEST_CASE("codexConfig escapes quotes, backslashes and odd keys", "[generator]")
{
    auto servers = ServerRegistry::ServerMap {};
    servers.emplace("win", userStdio(R"(C:\tools\"srv".exe)", {}, { { "MY KEY", "line1\nline2" } }));

    auto const output = ConfigGenerator::codexConfig(servers, "/h");
    CHECK(output.content.contains(R"(command = "C:\\tools\\\"srv\".exe")"));
    CHECK(output.content.contains(R"("MY KEY" = "line1\nline2")"));
    CHECK(!output.content.contains("args ="));

    CHECK(ConfigGenerator::tomlString("tab\there") == R"("tab\there")");
    CHECK(ConfigGenerator::tomlString(std::string_view("\x01", 1)) == R"("\u0001")");
}

TEST_CASE("generateConfig fetches the home directory only where needed", "[generator]")
{
    auto host = FakeHost {};
    host.reply(host::HomeDir, nlohmann::json("/home/me/"));
    auto registry = ServerRegistry {};
    auto generator = ConfigGenerator(registry, host);

    auto claude = generator.generateConfig(AgentKind::Claude, "/vault", "/bundle");
    REQUIRE(claude.has_value());
    CHECK(claude->path == "/vault/.mcp.json");
    CHECK(host.countCalls(host::HomeDir) == 0);

    auto codex = generator.generateConfig(AgentKind::Codex, "/vault", "/bundle");
    REQUIRE(codex.has_value());
    CHECK(codex->path == "/home/me/.codex/config.toml");
    CHECK(host.countCalls(host::HomeDir) == 1);

    auto unknown = generator.generateConfig(AgentKind::Unknown, "/vault", "/bundle");
    REQUIRE(!unknown);
    CHECK(unknown.error().code == ErrorCode::UnknownAgent);

    SECTION("home directory failures abort generation")
    {
        host.fail(host::HomeDir, "no HOME");
        auto gemini = generator.generateConfig(AgentKind::Gemini, "/vault", "/bundle");
        REQUIRE(!gemini);
        CHECK(gemini.error().code == ErrorCode::HostCallFailure);
        CHECK(host.countCalls(host::WriteFile) == 0);
    }
}

TEST_CASE("writeConfig hands the content to the host", "[generator]")
{
    auto host = FakeHost {};
    auto registry = ServerRegistry {};
    auto generator = ConfigGenerator(registry, host);
    auto const output = ConfigOutput { .path = "/h/.codex/config.toml", .content = "x", .format = ConfigFormat::Toml };

    REQUIRE(generator.writeConfig(output).has_value());
    auto const writes = host.callsTo(host::WriteFile);
    REQUIRE(writes.size() == 1);
    CHECK(writes[0]["path"] == "/h/.codex/config.toml");
    CHECK(writes[0]["content"] == "x");
    CHECK(writes[0]["format"] == "toml");

    host.fail(host::WriteFile, "read-only file system");
    auto failed = generator.writeConfig(output);
    REQUIRE(!failed);
    CHECK(failed.error().code == ErrorCode::HostCallFailure);
}
