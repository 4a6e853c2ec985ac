// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/BuiltinCatalogue.hpp>
#include <mcp/ConfigGenerator.hpp>
#include <mcp/LocalHost.hpp>
#include <vaultlink/McpContext.hpp>

#include <algorithm>
#include <format>
#include <optional>
#include <print>
#include <set>
#include <utility>

namespace vaultlink
{

namespace
{

    /// Splits "KEY=VALUE" (or "Name: value" with @p separator ':') into its two halves.
    auto splitPair(std::string_view entry, char separator) -> std::optional<std::pair<std::string, std::string>>
    {
        auto const pos = entry.find(separator);
        if (pos == std::string_view::npos || pos == 0)
            return std::nullopt;

        auto value = entry.substr(pos + 1);
        while (!value.empty() && value.front() == ' ')
            value.remove_prefix(1);
        return std::pair { std::string(entry.substr(0, pos)), std::string(value) };
    }

    void printOutcomes(std::string_view verb, const std::vector<ServerOutcome>& outcomes)
    {
        for (auto const& outcome: outcomes)
        {
            if (outcome.succeeded())
                std::println("  {} {}", verb, outcome.serverId);
            else
                std::println("  {} failed: {}", outcome.serverId, outcome.result.error().message);
        }
    }

    auto failedCount(const std::vector<ServerOutcome>& outcomes) -> std::size_t
    {
        return static_cast<std::size_t>(
            std::ranges::count_if(outcomes, [](const ServerOutcome& o) { return !o.succeeded(); }));
    }

} // namespace

auto descriptorFromOptions(const AddServerOptions& options) -> Result<ServerDescriptor>
{
    if (options.id.empty())
        return makeError(ErrorCode::InvalidArgument, "Server id must not be empty");
    if (options.command.empty() == options.url.empty())
        return makeError(ErrorCode::InvalidArgument, "Exactly one of --command and --url is required");

    auto descriptor = ServerDescriptor {
        .id = options.id,
        .name = options.name.empty() ? options.id : options.name,
        .description = options.description,
        .enabled = true,
    };

    if (!options.command.empty())
    {
        auto stdio = StdioTransport { .command = options.command, .args = options.args };
        for (auto const& entry: options.env)
        {
            auto pair = splitPair(entry, '=');
            if (!pair)
                return makeError(ErrorCode::InvalidArgument, std::format("Expected KEY=VALUE, got '{}'", entry));
            stdio.env.insert_or_assign(std::move(pair->first), std::move(pair->second));
        }
        descriptor.transport = std::move(stdio);
        return descriptor;
    }

    auto http = HttpTransport { .url = options.url };
    for (auto const& entry: options.headers)
    {
        auto pair = splitPair(entry, ':');
        if (!pair)
            return makeError(ErrorCode::InvalidArgument, std::format("Expected 'Name: value', got '{}'", entry));
        http.headers.insert_or_assign(std::move(pair->first), std::move(pair->second));
    }
    if (!options.apiKey.empty())
        http.apiKey = options.apiKey;
    descriptor.transport = std::move(http);
    return descriptor;
}

struct App::Impl
{
    AppConfig config;
    std::unique_ptr<LocalHost> host;
    std::unique_ptr<McpContext> context;
    StatusChannel::Token statusToken = 0;

    ~Impl()
    {
        if (context && statusToken != 0)
            context->statusChannel().unsubscribe(statusToken);
    }

    /// Persists the settings; returns the exit code of a mutating command.
    auto persist() -> int
    {
        if (auto saved = context->saveSettings(); !saved)
        {
            log::error("Failed to save settings: {}", saved.error().message);
            return 1;
        }
        return 0;
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto const& config = _impl->config;

    if (auto level = log::levelFromString(config.logLevel))
        log::setLevel(*level);

    auto const timings = toSupervisorTimings(config.timeouts);

    _impl->host = std::make_unique<LocalHost>(LocalHostConfig {
        .rootPath = config.rootPath,
        .bundlePath = config.bundlePath,
        .settingsPath = config.settingsPath.empty() ? defaultSettingsPath() : config.settingsPath,
        .responseTimeout = timings.requestTimeout,
    });

    _impl->context = std::make_unique<McpContext>(*_impl->host,
                                                  McpContextOptions {
                                                      .rootPath = config.rootPath,
                                                      .bundlePath = config.bundlePath,
                                                      .timings = timings,
                                                      .reconciler = toReconcilerOptions(config.reconciler),
                                                  });

    _impl->statusToken = _impl->context->statusChannel().subscribe([](const StatusEvent& event) {
        if (event.error.empty())
            log::info("{}: {}", event.serverId, statusToString(event.status));
        else
            log::info("{}: {} ({})", event.serverId, statusToString(event.status), event.error);
    });

    auto loaded = _impl->context->loadSettings();
    if (!loaded)
        return loaded;

    log::debug("Application initialized");
    return {};
}

auto App::detect(std::string_view command) -> int
{
    auto const agent = detectAgent(command);
    std::println("{}", agentName(agent));
    return agent == AgentKind::Unknown ? 1 : 0;
}

auto App::generate(std::string_view agentArg, bool write) -> int
{
    auto& context = *_impl->context;
    auto const agent = detectAgent(agentArg);

    auto root = context.resolveRoot();
    if (!root)
    {
        log::error("{}", root.error().message);
        return 1;
    }

    auto output = context.generator().generateConfig(agent, *root, context.bundlePath());
    if (!output)
    {
        log::error("Config generation failed: {}", output.error().message);
        return 1;
    }

    if (!write)
    {
        log::info("{} config for {} ({})", agentName(agent), output->path, formatName(output->format));
        std::print("{}", output->content);
        if (!output->content.ends_with('\n'))
            std::println("");
        return 0;
    }

    if (auto written = context.generator().writeConfig(*output); !written)
    {
        log::error("Failed to write {}: {}", output->path, written.error().message);
        return 1;
    }

    std::println("Wrote {} config to {}", agentName(agent), output->path);
    return 0;
}

auto App::listServers() -> int
{
    auto& context = *_impl->context;
    auto const& registry = context.registry();

    auto ids = std::set<std::string> {};
    for (auto const& id: builtinServerIds())
        ids.insert(id);
    for (auto const& [id, descriptor]: registry.userServers())
        ids.insert(id);
    for (auto const& [id, descriptor]: context.settings().servers)
        ids.insert(id);

    if (ids.empty())
    {
        std::println("No servers configured");
        return 0;
    }

    for (auto const& id: ids)
    {
        auto const kind = isBuiltinServer(id) ? "builtin" : "user";
        auto const state = registry.isEnabled(id) ? "enabled" : "disabled";

        auto transport = std::string {};
        if (auto descriptor = context.boundDescriptor(id))
        {
            if (auto const* stdio = descriptor->stdio())
                transport = stdio->command;
            else if (auto const* http = descriptor->http())
                transport = http->url;
        }

        std::println("  {:<24} {:<8} {:<9} {}", id, kind, state, transport);
    }
    return 0;
}

auto App::addServer(const AddServerOptions& options) -> int
{
    auto added = descriptorFromOptions(options).and_then(
        [this](ServerDescriptor descriptor) { return _impl->context->addServer(std::move(descriptor)); });
    if (!added)
    {
        log::error("Failed to add server: {}", added.error().message);
        return 1;
    }

    std::println("Added {}", options.id);
    return _impl->persist();
}

auto App::removeServer(std::string_view id) -> int
{
    if (auto removed = _impl->context->removeServer(id); !removed)
    {
        log::error("{}", removed.error().message);
        return 1;
    }

    std::println("Removed {}", id);
    return _impl->persist();
}

auto App::enableServer(std::string_view id, bool enabled) -> int
{
    if (auto changed = _impl->context->setServerEnabled(id, enabled); !changed)
    {
        log::error("{}", changed.error().message);
        return 1;
    }

    std::println("{} {}", enabled ? "Enabled" : "Disabled", id);
    return _impl->persist();
}

auto App::listTools(std::string_view id) -> int
{
    auto& context = *_impl->context;
    auto tools = context.connectServer(id).and_then([&] { return context.supervisor().listTools(id); });
    if (!tools)
    {
        log::error("{}", tools.error().message);
        return 1;
    }

    if (tools->empty())
    {
        std::println("No tools available");
        return 0;
    }

    std::println("{} tool(s) available:", tools->size());
    for (auto const& tool: *tools)
        std::println("  {} - {}",
                     json::getStringOr(tool, "name", "<unnamed>"),
                     json::getStringOr(tool, "description", ""));
    return 0;
}

auto App::callTool(std::string_view id, std::string_view tool, std::string_view argsJson) -> int
{
    auto& context = *_impl->context;

    auto args = argsJson.empty() ? Result<nlohmann::json> { nlohmann::json::object() } : json::parse(argsJson);
    if (!args)
    {
        log::error("Invalid tool arguments: {}", args.error().message);
        return 1;
    }

    if (auto connected = context.connectServer(id); !connected)
    {
        log::error("{}", connected.error().message);
        return 1;
    }

    (void) context.router().availableTools();
    auto const execution = context.router().execute(ToolRouter::functionNameFor(id, tool), *args);
    if (!execution.success)
    {
        log::error("{}", execution.error);
        return 1;
    }

    std::println("{}", execution.result);
    return 0;
}

auto App::start() -> int
{
    auto& context = *_impl->context;
    auto outcomes = context.startServers();
    if (!outcomes)
    {
        log::error("{}", outcomes.error().message);
        return 1;
    }

    std::println("Root: {}", context.rootPath());
    printOutcomes("started", *outcomes);

    auto const tools = context.router().availableTools();
    std::println("{} tool(s) available", tools.size());
    for (auto const& tool: tools)
        std::println("  {}", tool.functionName);

    return failedCount(*outcomes) == 0 ? 0 : 1;
}

auto App::fixRoot() -> int
{
    auto& context = *_impl->context;
    auto report = context.reconciler().forceRestartWithCurrentRoot();
    if (!report)
    {
        log::error("{}", report.error().message);
        return 1;
    }

    context.setRootPath(report->rootPath);
    std::println("Restarted servers with root {}", report->rootPath);
    printOutcomes("stopped", report->stopped);
    printOutcomes("started", report->started);
    return failedCount(report->started) == 0 ? 0 : 1;
}

auto App::verifyRoot() -> int
{
    auto& context = *_impl->context;
    if (auto outcomes = context.startServers(); !outcomes)
    {
        log::error("{}", outcomes.error().message);
        return 1;
    }

    auto checks = context.reconciler().verifyRootPaths();
    if (!checks)
    {
        log::error("{}", checks.error().message);
        return 1;
    }

    std::println("Root: {}", context.rootPath());
    auto allCorrect = true;
    for (auto const& check: *checks)
    {
        std::println("  {:<24} {:<12} {} {}",
                     check.serverId,
                     statusToString(check.status),
                     check.correct ? "ok   " : "WRONG",
                     check.boundRoot);
        allCorrect = allCorrect && check.correct;
    }
    return allCorrect ? 0 : 1;
}

} // namespace vaultlink
