// SPDX-License-Identifier: Apache-2.0
#include "LocalHost.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/BuiltinCatalogue.hpp>
#include <mcp/JsonRpc.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <future>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <pwd.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace vaultlink
{

namespace
{

    /// Id of the initialize request; sessions count upwards from 1.
    constexpr auto HandshakeId = int64_t { -1 };

    constexpr auto ReaderPollInterval = std::chrono::milliseconds { 100 };
    constexpr auto TerminateGracePeriod = std::chrono::milliseconds { 2'000 };

    namespace state
    {
        constexpr auto Starting = std::string_view { "Starting" };
        constexpr auto Connected = std::string_view { "Connected" };
        constexpr auto Stopped = std::string_view { "Stopped" };
    } // namespace state

    auto hostError(std::string message) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::HostCallFailure, std::move(message));
    }

    /// Returns the id of a response message, including negative ids.
    auto responseId(const nlohmann::json& message) -> std::optional<int64_t>
    {
        if (!jsonrpc::isResponse(message) || !message["id"].is_number_integer())
            return std::nullopt;
        return message["id"].get<int64_t>();
    }

    auto writeAll(int fd, std::string_view data) -> bool
    {
        while (!data.empty())
        {
            auto const written = ::write(fd, data.data(), data.size());
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            data.remove_prefix(static_cast<size_t>(written));
        }
        return true;
    }

    /// Inherited environment with @p overrides applied.
    auto mergedEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto merged = std::map<std::string, std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view { *e };
                auto const eq = entry.find('=');
                if (eq != std::string_view::npos)
                    merged.insert_or_assign(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
            }
        }
        for (const auto& [key, value]: overrides)
            merged.insert_or_assign(key, value);

        auto envStrings = std::vector<std::string> {};
        envStrings.reserve(merged.size());
        for (const auto& [key, value]: merged)
            envStrings.push_back(std::format("{}={}", key, value));
        return envStrings;
    }

    auto homeDirectory() -> std::string
    {
        if (auto const* home = std::getenv("HOME"); home && *home)
            return home;
        if (auto const* pw = getpwuid(getuid()); pw && pw->pw_dir)
            return pw->pw_dir;
        return {};
    }

} // namespace

struct LocalHost::Impl
{
    struct Subscription
    {
        std::mutex mutex; ///< Held while the handler runs.
        std::atomic<bool> active = true;
        HostEventHandler handler;
    };

    struct ServerProcess
    {
        std::string id;
        std::string command;
        pid_t pid = -1;
        int stdinWrite = -1;
        int stdoutRead = -1;

        std::mutex writeMutex;
        std::mutex mutex;
        std::string status = std::string(state::Starting);
        nlohmann::json capabilities = nlohmann::json::object();
        nlohmann::json serverInfo = nlohmann::json::object();
        std::map<int64_t, std::promise<Result<nlohmann::json>>> waiting;

        std::jthread reader;
    };

    LocalHostConfig config;

    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<ServerProcess>, std::less<>> servers;

    std::mutex subscriptionMutex;
    std::map<std::string, std::vector<std::shared_ptr<Subscription>>, std::less<>> subscriptions;

    explicit Impl(LocalHostConfig cfg): config(std::move(cfg))
    {
        // A server that exits between poll and write must not take the whole process down.
        std::signal(SIGPIPE, SIG_IGN);
    }

    void emit(std::string_view eventName, const nlohmann::json& payload)
    {
        auto targets = std::vector<std::shared_ptr<Subscription>> {};
        {
            auto lock = std::lock_guard(subscriptionMutex);
            auto it = subscriptions.find(eventName);
            if (it == subscriptions.end())
                return;
            std::erase_if(it->second, [](const auto& sub) { return !sub->active; });
            targets = it->second;
        }

        for (const auto& sub: targets)
        {
            auto lock = std::lock_guard(sub->mutex);
            if (!sub->active)
                continue;
            try
            {
                sub->handler(payload);
            }
            catch (const std::exception& e)
            {
                log::error("Handler for {} failed: {}", eventName, e.what());
            }
        }
    }

    auto find(std::string_view id) const -> std::shared_ptr<ServerProcess>
    {
        auto lock = std::lock_guard(mutex);
        auto it = servers.find(id);
        return it != servers.end() ? it->second : nullptr;
    }

    // {{{ process lifecycle

    auto spawn(ServerProcess& proc, const StdioTransport& transport) -> VoidResult
    {
        int stdinPipe[2];
        int stdoutPipe[2];

        if (pipe(stdinPipe) != 0)
            return hostError("Failed to create stdin pipe");
        if (pipe(stdoutPipe) != 0)
        {
            ::close(stdinPipe[0]);
            ::close(stdinPipe[1]);
            return hostError("Failed to create stdout pipe");
        }

        // The parent's ends must not leak into other servers spawned later.
        fcntl(stdinPipe[1], F_SETFD, FD_CLOEXEC);
        fcntl(stdoutPipe[0], F_SETFD, FD_CLOEXEC);

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
        posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_addclose(&actions, stdinPipe[0]);
        posix_spawn_file_actions_addclose(&actions, stdoutPipe[1]);
        if (transport.workingDir && !transport.workingDir->empty())
            posix_spawn_file_actions_addchdir_np(&actions, transport.workingDir->c_str());

        auto argStrings = std::vector<std::string> { transport.command };
        argStrings.insert(argStrings.end(), transport.args.begin(), transport.args.end());
        auto argv = std::vector<char*> {};
        for (auto& arg: argStrings)
            argv.push_back(arg.data());
        argv.push_back(nullptr);

        auto envStrings = mergedEnvironment(transport.env);
        auto envp = std::vector<char*> {};
        for (auto& s: envStrings)
            envp.push_back(s.data());
        envp.push_back(nullptr);

        pid_t pid;
        auto const rc = posix_spawnp(&pid, transport.command.c_str(), &actions, nullptr, argv.data(), envp.data());
        posix_spawn_file_actions_destroy(&actions);

        ::close(stdinPipe[0]);
        ::close(stdoutPipe[1]);

        if (rc != 0)
        {
            ::close(stdinPipe[1]);
            ::close(stdoutPipe[0]);
            return hostError(std::format("Failed to spawn process '{}': {}", transport.command, strerror(rc)));
        }

        proc.pid = pid;
        proc.stdinWrite = stdinPipe[1];
        proc.stdoutRead = stdoutPipe[0];
        proc.command = transport.command;
        log::info("Server {} started: {} (pid {})", proc.id, transport.command, pid);
        return {};
    }

    void readLoop(ServerProcess& proc, const std::stop_token& token)
    {
        auto buffer = std::string {};
        auto chunk = std::array<char, 4096> {};

        while (!token.stop_requested())
        {
            auto pfd = pollfd { .fd = proc.stdoutRead, .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&pfd, 1, static_cast<int>(ReaderPollInterval.count()));
            if (ready < 0 && errno == EINTR)
                continue;
            if (ready == 0)
                continue;

            auto const bytesRead = ready > 0 ? ::read(proc.stdoutRead, chunk.data(), chunk.size()) : -1;
            if (bytesRead <= 0)
                break;
            buffer.append(chunk.data(), static_cast<size_t>(bytesRead));

            for (auto pos = buffer.find('\n'); pos != std::string::npos; pos = buffer.find('\n'))
            {
                auto line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                if (!line.empty())
                    dispatchLine(proc, line);
            }
        }

        auto waiting = std::map<int64_t, std::promise<Result<nlohmann::json>>> {};
        {
            auto lock = std::lock_guard(proc.mutex);
            proc.status = std::string(state::Stopped);
            waiting.swap(proc.waiting);
        }
        for (auto& [id, promise]: waiting)
            promise.set_value(hostError(std::format("Server {} stopped", proc.id)));

        log::debug("Server {} output closed", proc.id);
        emit(host::stoppedEvent(proc.id), nlohmann::json { { "serverId", proc.id } });
    }

    void dispatchLine(ServerProcess& proc, const std::string& line)
    {
        auto message = json::parse(line);
        if (!message)
        {
            log::warning("Server {} wrote non-JSON output: {}", proc.id, line);
            return;
        }

        if (auto const id = responseId(*message))
        {
            auto promise = std::optional<std::promise<Result<nlohmann::json>>> {};
            {
                auto lock = std::lock_guard(proc.mutex);
                if (auto it = proc.waiting.find(*id); it != proc.waiting.end())
                {
                    promise = std::move(it->second);
                    proc.waiting.erase(it);
                }
            }
            if (promise)
            {
                promise->set_value(std::move(*message));
                return;
            }
        }

        emit(host::messageEvent(proc.id), *message);
    }

    auto write(ServerProcess& proc, const nlohmann::json& message) -> VoidResult
    {
        auto const line = message.dump() + "\n";
        auto lock = std::lock_guard(proc.writeMutex);
        if (proc.stdinWrite < 0 || !writeAll(proc.stdinWrite, line))
            return hostError(std::format("Failed to write to server {}", proc.id));
        return {};
    }

    auto request(ServerProcess& proc, const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>
    {
        auto const id = message["id"].get<int64_t>();
        auto future = std::future<Result<nlohmann::json>> {};
        {
            auto lock = std::lock_guard(proc.mutex);
            if (proc.status == state::Stopped)
                return hostError(std::format("Server {} is not running", proc.id));
            auto [it, inserted] = proc.waiting.try_emplace(id);
            if (!inserted)
                return hostError(std::format("Request id {} is already in flight", id));
            future = it->second.get_future();
        }

        if (auto written = write(proc, message); !written)
        {
            auto lock = std::lock_guard(proc.mutex);
            proc.waiting.erase(id);
            return std::unexpected(written.error());
        }

        if (future.wait_for(timeout) == std::future_status::timeout)
        {
            auto lock = std::lock_guard(proc.mutex);
            if (proc.waiting.erase(id) > 0)
                return hostError(std::format("Timed out waiting for response {} from {}", id, proc.id));
        }
        return future.get();
    }

    auto handshake(ServerProcess& proc) -> VoidResult
    {
        auto params = nlohmann::json {
            { "protocolVersion", jsonrpc::ProtocolVersion },
            { "capabilities", nlohmann::json::object() },
            { "clientInfo",
              nlohmann::json {
                  { "name", "vault" },
                  { "version", "0.1.0" },
              } },
        };

        auto response = request(proc, jsonrpc::makeRequest(HandshakeId, "initialize", std::move(params)),
                                config.handshakeTimeout);
        if (!response)
            return std::unexpected(response.error());
        auto parsed = jsonrpc::parseResponse(*response);
        if (!parsed)
            return hostError(std::format("Initialize failed: {}", parsed.error().message));
        if (parsed->error)
            return hostError(std::format("Initialize failed: {}", parsed->error->message));

        auto const result =
            parsed->result && parsed->result->is_object() ? *parsed->result : nlohmann::json::object();
        if (auto sent = write(proc, jsonrpc::makeNotification("notifications/initialized")); !sent)
            return sent;

        auto lock = std::lock_guard(proc.mutex);
        proc.capabilities = result.value("capabilities", nlohmann::json::object());
        proc.serverInfo = result.value("serverInfo", nlohmann::json::object());
        proc.status = std::string(state::Connected);
        return {};
    }

    void terminate(ServerProcess& proc)
    {
        proc.reader.request_stop();

        {
            auto lock = std::lock_guard(proc.writeMutex);
            if (proc.stdinWrite >= 0)
            {
                ::close(proc.stdinWrite);
                proc.stdinWrite = -1;
            }
        }

        if (proc.pid > 0)
        {
            kill(proc.pid, SIGTERM);
            auto const deadline = std::chrono::steady_clock::now() + TerminateGracePeriod;
            auto exited = false;
            while (!exited && std::chrono::steady_clock::now() < deadline)
            {
                int wstatus;
                exited = waitpid(proc.pid, &wstatus, WNOHANG) != 0;
                if (!exited)
                    std::this_thread::sleep_for(std::chrono::milliseconds { 20 });
            }
            if (!exited)
            {
                log::warning("Server {} ignored SIGTERM, killing it", proc.id);
                kill(proc.pid, SIGKILL);
                int wstatus;
                waitpid(proc.pid, &wstatus, 0);
            }
            proc.pid = -1;
        }

        if (proc.reader.joinable() && proc.reader.get_id() != std::this_thread::get_id())
            proc.reader.join();

        if (proc.stdoutRead >= 0)
        {
            ::close(proc.stdoutRead);
            proc.stdoutRead = -1;
        }

        log::debug("Server {} terminated", proc.id);
    }

    // }}}

    // {{{ commands

    auto startServer(const nlohmann::json& args) -> Result<nlohmann::json>
    {
        auto serverId = json::getString(args, "serverId");
        if (!serverId)
            return hostError(serverId.error().message);

        auto descriptor = descriptorFromJson(*serverId, args.value("config", nlohmann::json::object()));
        if (!descriptor)
            return hostError(std::format("Invalid config for {}: {}", *serverId, descriptor.error().message));

        auto const* stdio = descriptor->stdio();
        if (!stdio)
            return hostError(std::format("Server {}: HTTP transport is not supported by the local host", *serverId));

        auto proc = std::make_shared<ServerProcess>();
        proc->id = *serverId;

        auto previous = std::shared_ptr<ServerProcess> {};
        {
            auto lock = std::lock_guard(mutex);
            if (auto it = servers.find(*serverId); it != servers.end())
            {
                auto procLock = std::lock_guard(it->second->mutex);
                if (it->second->status != state::Stopped)
                    return hostError(std::format("Server {} is already running", *serverId));
                previous = it->second;
            }
            servers.insert_or_assign(*serverId, proc);
        }
        if (previous)
            terminate(*previous);

        if (auto spawned = spawn(*proc, *stdio); !spawned)
        {
            auto lock = std::lock_guard(mutex);
            servers.erase(*serverId);
            return std::unexpected(spawned.error());
        }

        proc->reader = std::jthread([this, raw = proc.get()](const std::stop_token& token) { readLoop(*raw, token); });

        if (auto initialized = handshake(*proc); !initialized)
        {
            log::error("Server {} failed to initialize: {}", *serverId, initialized.error().message);
            terminate(*proc);
            return std::unexpected(initialized.error());
        }

        auto capabilities = nlohmann::json {};
        auto serverInfo = nlohmann::json {};
        {
            auto lock = std::lock_guard(proc->mutex);
            capabilities = proc->capabilities;
            serverInfo = proc->serverInfo;
        }

        log::info("Server {} connected ({})", *serverId, json::getStringOr(serverInfo, "name", "unknown"));
        emit(host::connectedEvent(*serverId),
             nlohmann::json {
                 { "serverId", *serverId },
                 { "capabilities", capabilities },
                 { "serverInfo", serverInfo },
             });

        return nlohmann::json { { "serverId", *serverId }, { "status", state::Connected } };
    }

    auto stopServer(const nlohmann::json& args) -> Result<nlohmann::json>
    {
        auto serverId = json::getString(args, "serverId");
        if (!serverId)
            return hostError(serverId.error().message);

        auto proc = std::shared_ptr<ServerProcess> {};
        {
            auto lock = std::lock_guard(mutex);
            auto it = servers.find(*serverId);
            if (it == servers.end())
                return hostError(std::format("Server {} is not running", *serverId));
            proc = std::move(it->second);
            servers.erase(it);
        }

        terminate(*proc);
        log::info("Server {} stopped", *serverId);
        return nlohmann::json { { "serverId", *serverId }, { "status", state::Stopped } };
    }

    auto sendMessage(const nlohmann::json& args) -> Result<nlohmann::json>
    {
        auto serverId = json::getString(args, "serverId");
        if (!serverId)
            return hostError(serverId.error().message);

        auto proc = find(*serverId);
        if (!proc)
            return hostError(std::format("Server {} is not running", *serverId));

        auto message = args.value("message", nlohmann::json {});
        if (message.is_string())
        {
            auto parsed = json::parse(message.get<std::string>());
            if (!parsed)
                return hostError(std::format("Invalid message for {}: {}", *serverId, parsed.error().message));
            message = std::move(*parsed);
        }
        if (!message.is_object())
            return hostError(std::format("Invalid message for {}", *serverId));

        if (!message.contains("id") || !message["id"].is_number_integer())
        {
            if (auto sent = write(*proc, message); !sent)
                return std::unexpected(sent.error());
            return nlohmann::json {};
        }

        return request(*proc, message, config.responseTimeout);
    }

    auto serverInfo(const nlohmann::json& args) -> Result<nlohmann::json>
    {
        auto serverId = json::getString(args, "serverId");
        if (!serverId)
            return hostError(serverId.error().message);

        auto proc = find(*serverId);
        if (!proc)
            return hostError(std::format("Server {} not found", *serverId));

        auto lock = std::lock_guard(proc->mutex);
        return nlohmann::json {
            { "serverId", proc->id },
            { "command", proc->command },
            { "pid", proc->pid },
            { "status", nlohmann::json { { "status", proc->status } } },
            { "capabilities", proc->capabilities },
            { "serverInfo", proc->serverInfo },
        };
    }

    auto serverStatuses() const -> nlohmann::json
    {
        auto snapshot = std::vector<std::shared_ptr<ServerProcess>> {};
        {
            auto lock = std::lock_guard(mutex);
            for (const auto& [id, proc]: servers)
                snapshot.push_back(proc);
        }

        auto out = nlohmann::json::object();
        for (const auto& proc: snapshot)
        {
            auto lock = std::lock_guard(proc->mutex);
            out[proc->id] = proc->status;
        }
        return out;
    }

    auto killAll() -> nlohmann::json
    {
        auto all = std::map<std::string, std::shared_ptr<ServerProcess>, std::less<>> {};
        {
            auto lock = std::lock_guard(mutex);
            all.swap(servers);
        }

        for (const auto& [id, proc]: all)
            terminate(*proc);

        if (!all.empty())
            log::info("Killed {} server process(es)", all.size());
        return nlohmann::json { { "killed", all.size() } };
    }

    auto loadSettings() const -> Result<nlohmann::json>
    {
        if (config.settingsPath.empty() || !std::filesystem::exists(config.settingsPath))
            return nlohmann::json {};

        auto file = std::ifstream(config.settingsPath);
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Cannot open settings file: {}", config.settingsPath));

        auto content = std::stringstream {};
        content << file.rdbuf();
        return json::parse(content.str()).transform(
            [](const nlohmann::json& stored) { return stored.value("settings", nlohmann::json {}); });
    }

    auto saveSettings(const nlohmann::json& args) -> Result<nlohmann::json>
    {
        if (config.settingsPath.empty())
            return hostError("No settings file configured");

        return writeFile(config.settingsPath,
                         nlohmann::json { { "settings", args.value("settings", nlohmann::json::object()) } }.dump(2));
    }

    static auto writeFile(const std::string& path, const std::string& content) -> Result<nlohmann::json>
    {
        auto ec = std::error_code {};
        auto const parent = std::filesystem::path(path).parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent, ec);
        if (ec)
            return makeError(ErrorCode::IoError, std::format("Cannot create {}: {}", parent.string(), ec.message()));

        auto file = std::ofstream(path, std::ios::trunc);
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Cannot open {} for writing", path));
        file << content;
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Failed to write {}", path));

        return nlohmann::json { { "path", path }, { "bytes", content.size() } };
    }

    auto bundlePath() const -> std::string
    {
        if (!config.bundlePath.empty())
            return config.bundlePath;

        auto ec = std::error_code {};
        auto const self = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (ec)
            return {};
        return bundlePathFromResourceDir(self.parent_path().string());
    }

    // }}}
};

LocalHost::LocalHost(LocalHostConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

LocalHost::~LocalHost()
{
    (void) _impl->killAll();
}

auto LocalHost::invoke(std::string_view command, const nlohmann::json& args) -> Result<nlohmann::json>
{
    log::trace("Host call {} {}", command, args.dump());

    if (command == host::StartServer)
        return _impl->startServer(args);
    if (command == host::StopServer)
        return _impl->stopServer(args);
    if (command == host::SendMessage)
        return _impl->sendMessage(args);
    if (command == host::ServerInfo)
        return _impl->serverInfo(args);
    if (command == host::ServerStatuses)
        return _impl->serverStatuses();
    if (command == host::KillAllProcesses)
        return _impl->killAll();
    if (command == host::VaultInfo)
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->config.rootPath.empty())
            return hostError("No vault is open");
        return nlohmann::json { { "path", _impl->config.rootPath } };
    }
    if (command == host::CurrentDirectory)
    {
        auto ec = std::error_code {};
        auto cwd = std::filesystem::current_path(ec);
        if (ec)
            return hostError(std::format("Cannot determine working directory: {}", ec.message()));
        return cwd.string();
    }
    if (command == host::HomeDir)
    {
        auto home = homeDirectory();
        if (home.empty())
            return hostError("Cannot determine home directory");
        return home;
    }
    if (command == host::BundlePath)
        return _impl->bundlePath();
    if (command == host::LoadSettings)
        return _impl->loadSettings();
    if (command == host::SaveSettings)
        return _impl->saveSettings(args);
    if (command == host::WriteFile)
    {
        auto path = json::getString(args, "path");
        if (!path)
            return hostError(path.error().message);
        return Impl::writeFile(*path, json::getStringOr(args, "content", ""));
    }

    return hostError(std::format("Unknown host command: {}", command));
}

auto LocalHost::subscribe(std::string_view eventName, HostEventHandler handler) -> Unsubscribe
{
    auto subscription = std::make_shared<Impl::Subscription>();
    subscription->handler = std::move(handler);
    {
        auto lock = std::lock_guard(_impl->subscriptionMutex);
        _impl->subscriptions[std::string(eventName)].push_back(subscription);
    }

    // Blocks while the handler runs, so no call reaches the subscriber after this returns.
    return [subscription] {
        auto lock = std::lock_guard(subscription->mutex);
        subscription->active = false;
    };
}

void LocalHost::setRootPath(std::string rootPath)
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->config.rootPath = std::move(rootPath);
}

auto LocalHost::runningServers() const -> std::vector<std::string>
{
    auto snapshot = std::vector<std::shared_ptr<Impl::ServerProcess>> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        for (const auto& [id, proc]: _impl->servers)
            snapshot.push_back(proc);
    }

    auto ids = std::vector<std::string> {};
    for (const auto& proc: snapshot)
    {
        auto lock = std::lock_guard(proc->mutex);
        if (proc->status != state::Stopped)
            ids.push_back(proc->id);
    }
    return ids;
}

} // namespace vaultlink
