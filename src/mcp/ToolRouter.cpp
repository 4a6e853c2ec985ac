// SPDX-License-Identifier: Apache-2.0
#include "ToolRouter.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <map>

namespace vaultlink
{

namespace
{

    auto underscored(std::string_view text) -> std::string
    {
        auto out = std::string(text);
        std::ranges::replace(out, '-', '_');
        return out;
    }

    auto formatContentItem(const nlohmann::json& item) -> std::string
    {
        auto const type = json::getStringOr(item, "type", "");
        if (type == "text")
            return json::getStringOr(item, "text", "");
        if (type == "image")
        {
            auto source = json::getStringOr(item, "data", "");
            if (source.empty())
                source = json::getStringOr(item, "url", "");
            return std::format("[Image: {}]", source);
        }
        if (type == "resource")
        {
            auto uri = json::getStringOr(item, "uri", "");
            if (uri.empty() && item.contains("resource"))
                uri = json::getStringOr(item["resource"], "uri", "");
            return std::format("[Resource: {}]", uri);
        }
        return item.dump();
    }

} // namespace

ToolRouter::ToolRouter(ConnectionSupervisor& supervisor): _supervisor(supervisor)
{
}

auto ToolRouter::availableTools() -> std::vector<RoutedTool>
{
    if (auto refreshed = _supervisor.refreshStatuses(); !refreshed)
        log::warning("Using cached statuses: {}", refreshed.error().message);

    auto tools = std::vector<RoutedTool> {};
    for (auto const& serverId: _supervisor.connectedServers())
    {
        auto listed = _supervisor.listTools(serverId);
        if (!listed)
        {
            log::error("Failed to get tools from {}: {}", serverId, listed.error().message);
            continue;
        }

        for (const auto& toolJson: *listed)
        {
            auto const toolName = json::getStringOr(toolJson, "name", "");
            if (toolName.empty())
                continue;

            tools.push_back(RoutedTool {
                .serverId = serverId,
                .toolName = toolName,
                .functionName = functionNameFor(serverId, toolName),
                .description = json::getStringOr(toolJson, "description", ""),
                .inputSchema = toolJson.value("inputSchema",
                                              nlohmann::json {
                                                  { "type", "object" },
                                                  { "properties", nlohmann::json::object() },
                                                  { "required", nlohmann::json::array() },
                                              }),
            });
        }
    }

    // Tools of servers that are gone no longer route.
    auto routes = std::map<std::string, RoutedTool, std::less<>> {};
    for (const auto& tool: tools)
        routes.insert_or_assign(tool.functionName, tool);
    {
        auto lock = std::lock_guard(_mutex);
        _tools.swap(routes);
    }

    log::info("Found {} available tools", tools.size());
    return tools;
}

auto ToolRouter::find(std::string_view functionName) const -> std::optional<RoutedTool>
{
    auto lock = std::lock_guard(_mutex);

    if (auto it = _tools.find(functionName); it != _tools.end())
        return it->second;

    auto const wanted = underscored(functionName);
    for (const auto& [name, tool]: _tools)
    {
        if (std::format("{}_{}", underscored(tool.serverId), tool.toolName) == wanted)
        {
            log::debug("Resolved {} as {}", functionName, name);
            return tool;
        }
    }
    return std::nullopt;
}

auto ToolRouter::execute(std::string_view functionName, const nlohmann::json& args) -> ToolExecution
{
    log::info("Executing tool {}", functionName);

    auto tool = find(functionName);
    if (!tool)
    {
        log::error("Tool not found: {}", functionName);
        return ToolExecution { .success = false, .error = std::format("Tool not found: {}", functionName) };
    }

    auto result = _supervisor.invokeTool(tool->serverId, tool->toolName, args);

    auto entry = ToolHistoryEntry {
        .timestamp = std::chrono::system_clock::now(),
        .serverId = tool->serverId,
        .toolName = tool->toolName,
        .args = args,
        .success = result.has_value(),
        .error = result ? std::string {} : result.error().message,
    };
    {
        auto lock = std::lock_guard(_mutex);
        _history.push_back(std::move(entry));
    }

    if (!result)
    {
        log::error("Tool execution failed: {}", result.error().message);
        return ToolExecution {
            .success = false,
            .serverId = tool->serverId,
            .toolName = tool->toolName,
            .error = result.error().message,
        };
    }

    return ToolExecution {
        .success = true,
        .serverId = tool->serverId,
        .toolName = tool->toolName,
        .result = formatToolResult(*result),
    };
}

auto ToolRouter::history(std::size_t limit) const -> std::vector<ToolHistoryEntry>
{
    auto lock = std::lock_guard(_mutex);
    auto const skip = _history.size() > limit ? _history.size() - limit : 0;
    return { _history.begin() + static_cast<std::ptrdiff_t>(skip), _history.end() };
}

void ToolRouter::clearHistory()
{
    auto lock = std::lock_guard(_mutex);
    _history.clear();
}

auto ToolRouter::functionNameFor(std::string_view serverId, std::string_view toolName) -> std::string
{
    return std::format("{}_{}", serverId, toolName);
}

auto ToolRouter::formatToolResult(const nlohmann::json& result) -> std::string
{
    if (!result.is_object() || !result.contains("content") || result["content"].is_null())
        return "No result returned";

    auto const& content = result["content"];
    if (content.is_array() && content.empty())
        return "No result returned";
    if (!content.is_array())
        return formatContentItem(content);

    auto text = std::string {};
    for (auto it = content.begin(); it != content.end(); ++it)
    {
        if (it != content.begin())
            text += '\n';
        text += formatContentItem(*it);
    }
    return text;
}

} // namespace vaultlink
