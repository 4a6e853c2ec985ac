// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <vaultlink/App.hpp>
#include <vaultlink/Config.hpp>

#include <CLI/CLI.hpp>

#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "vaultlink - connect coding agents and tools to vault MCP servers" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto rootPath = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-r,--root", rootPath, "Vault root the servers are bound to");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto agentCommand = std::string {};
    auto* detectCmd = app.add_subcommand("detect", "Detect the coding agent a command line launches");
    detectCmd->add_option("command", agentCommand, "Agent command line")->required();

    auto agentName = std::string {};
    auto writeConfig = false;
    auto* generateCmd = app.add_subcommand("generate", "Generate the MCP config for a coding agent");
    generateCmd->add_option("agent", agentName, "claude, gemini or codex")->required();
    generateCmd->add_flag("-w,--write", writeConfig, "Write the config file instead of printing it");

    auto* serversCmd = app.add_subcommand("servers", "List built-in and user servers");

    auto addOptions = vaultlink::AddServerOptions {};
    auto* addCmd = app.add_subcommand("add", "Add a user server");
    addCmd->add_option("id", addOptions.id, "Server id")->required();
    addCmd->add_option("--name", addOptions.name, "Display name");
    addCmd->add_option("--description", addOptions.description, "Description");
    addCmd->add_option("--command", addOptions.command, "Executable of a stdio server");
    addCmd->add_option("--arg", addOptions.args, "Argument of a stdio server (repeatable)")->allow_extra_args(false);
    addCmd->add_option("--env", addOptions.env, "KEY=VALUE environment entry (repeatable)")->allow_extra_args(false);
    addCmd->add_option("--url", addOptions.url, "Endpoint of an http server");
    addCmd->add_option("--header", addOptions.headers, "'Name: value' header (repeatable)")->allow_extra_args(false);
    addCmd->add_option("--api-key", addOptions.apiKey, "Bearer token of an http server");

    auto serverId = std::string {};
    auto* removeCmd = app.add_subcommand("remove", "Remove a user server");
    removeCmd->add_option("id", serverId, "Server id")->required();

    auto* enableCmd = app.add_subcommand("enable", "Enable a server");
    enableCmd->add_option("id", serverId, "Server id")->required();

    auto* disableCmd = app.add_subcommand("disable", "Disable a server");
    disableCmd->add_option("id", serverId, "Server id")->required();

    auto* toolsCmd = app.add_subcommand("tools", "Start a server and list its tools");
    toolsCmd->add_option("id", serverId, "Server id")->required();

    auto toolName = std::string {};
    auto toolArgs = std::string {};
    auto* callCmd = app.add_subcommand("call", "Start a server and call one of its tools");
    callCmd->add_option("id", serverId, "Server id")->required();
    callCmd->add_option("tool", toolName, "Tool name")->required();
    callCmd->add_option("args", toolArgs, "Tool arguments as a JSON object");

    auto* startCmd = app.add_subcommand("start", "Start every enabled server and list the available tools");
    auto* fixRootCmd = app.add_subcommand("fix-root", "Restart the built-in servers bound to the current root");
    auto* verifyRootCmd = app.add_subcommand("verify-root", "Check which root each enabled server is bound to");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        vaultlink::log::setLevel(vaultlink::log::Level::Debug);

    // Load config
    auto configResult = configPath.empty() ? vaultlink::loadConfig() : vaultlink::loadConfigFromFile(configPath);

    if (!configResult)
    {
        vaultlink::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!rootPath.empty())
        config.rootPath = rootPath;
    if (verbose)
        config.logLevel = "debug";

    auto application = vaultlink::App(std::move(config));

    if (detectCmd->parsed())
        return application.detect(agentCommand);

    auto initResult = application.initialize();
    if (!initResult)
    {
        vaultlink::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (generateCmd->parsed())
        return application.generate(agentName, writeConfig);
    if (serversCmd->parsed())
        return application.listServers();
    if (addCmd->parsed())
        return application.addServer(addOptions);
    if (removeCmd->parsed())
        return application.removeServer(serverId);
    if (enableCmd->parsed())
        return application.enableServer(serverId, true);
    if (disableCmd->parsed())
        return application.enableServer(serverId, false);
    if (toolsCmd->parsed())
        return application.listTools(serverId);
    if (callCmd->parsed())
        return application.callTool(serverId, toolName, toolArgs);
    if (startCmd->parsed())
        return application.start();
    if (fixRootCmd->parsed())
        return application.fixRoot();
    if (verifyRootCmd->parsed())
        return application.verifyRoot();

    return 0;
}
