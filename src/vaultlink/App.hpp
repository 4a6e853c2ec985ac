// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <vaultlink/Config.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vaultlink
{

/// @brief Arguments of the `add` command.
struct AddServerOptions
{
    std::string id;
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::vector<std::string> env; ///< KEY=VALUE
    std::string url;
    std::vector<std::string> headers; ///< "Name: value"
    std::string apiKey;
};

/// @brief Builds the descriptor for a user server from command-line arguments.
/// @return The descriptor, or InvalidArgument if neither or both of command and url are set,
///         or an env/header entry is malformed.
[[nodiscard]] auto descriptorFromOptions(const AddServerOptions& options) -> Result<ServerDescriptor>;

/// @brief Command-line front end. Every command returns the process exit code.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Creates the local host and loads the saved settings.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    [[nodiscard]] auto detect(std::string_view command) -> int;
    [[nodiscard]] auto generate(std::string_view agent, bool write) -> int;
    [[nodiscard]] auto listServers() -> int;
    [[nodiscard]] auto addServer(const AddServerOptions& options) -> int;
    [[nodiscard]] auto removeServer(std::string_view id) -> int;
    [[nodiscard]] auto enableServer(std::string_view id, bool enabled) -> int;
    [[nodiscard]] auto listTools(std::string_view id) -> int;
    [[nodiscard]] auto callTool(std::string_view id, std::string_view tool, std::string_view argsJson) -> int;
    [[nodiscard]] auto start() -> int;
    [[nodiscard]] auto fixRoot() -> int;
    [[nodiscard]] auto verifyRoot() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace vaultlink
