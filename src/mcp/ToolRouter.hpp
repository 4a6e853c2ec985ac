// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/ConnectionSupervisor.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultlink
{

/// @brief A tool of a connected server, published under a name unique across servers.
struct RoutedTool
{
    std::string serverId;
    std::string toolName;
    std::string functionName; ///< "<serverId>_<toolName>"
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief Outcome of one tool execution, shaped for handing back to a model.
struct ToolExecution
{
    bool success = false;
    std::string serverId;
    std::string toolName;
    std::string result; ///< Formatted text, set on success.
    std::string error;  ///< Set on failure.
};

struct ToolHistoryEntry
{
    std::chrono::system_clock::time_point timestamp;
    std::string serverId;
    std::string toolName;
    nlohmann::json args;
    bool success = false;
    std::string error;
};

/// @brief Aggregates the tools of all connected servers and routes calls to them by function name.
class ToolRouter
{
  public:
    explicit ToolRouter(ConnectionSupervisor& supervisor);

    /// @brief Refreshes statuses and collects the tools of every connected server.
    ///
    /// A server whose tool list cannot be fetched is skipped.
    [[nodiscard]] auto availableTools() -> std::vector<RoutedTool>;

    /// @brief Looks up a function name collected by availableTools().
    ///
    /// Callers sometimes turn the hyphens of a server id into underscores; such names
    /// are matched as well.
    [[nodiscard]] auto find(std::string_view functionName) const -> std::optional<RoutedTool>;

    /// @brief Executes the tool behind @p functionName and records it in the history.
    [[nodiscard]] auto execute(std::string_view functionName, const nlohmann::json& args) -> ToolExecution;

    /// @brief Returns the most recent @p limit executions, oldest first.
    [[nodiscard]] auto history(std::size_t limit = 50) const -> std::vector<ToolHistoryEntry>;
    void clearHistory();

    [[nodiscard]] static auto functionNameFor(std::string_view serverId, std::string_view toolName) -> std::string;

    /// @brief Renders a tools/call result as plain text.
    [[nodiscard]] static auto formatToolResult(const nlohmann::json& result) -> std::string;

  private:
    ConnectionSupervisor& _supervisor;

    mutable std::mutex _mutex;
    std::map<std::string, RoutedTool, std::less<>> _tools;
    std::vector<ToolHistoryEntry> _history;
};

} // namespace vaultlink
