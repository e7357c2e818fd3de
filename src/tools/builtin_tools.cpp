#include <toolhub/config/config_helpers.h>
#include <toolhub/daemon/daemon_registry.h>
#include <toolhub/tools/builtin_tools.h>
#include <toolhub/version.hpp>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolhub::tools {

using boost::asio::awaitable;

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds{50};

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void signal_group(pid_t pid, int sig) {
    if (::kill(-pid, sig) != 0) {
        ::kill(pid, sig);
    }
}

json session_to_json(const BackgroundProcessManager::Session& s) {
    json j{{"sessionId", s.id},
           {"pid", s.pid},
           {"command", s.command},
           {"startedAt", s.startedAt},
           {"running", s.running}};
    if (s.exitCode) {
        j["exitCode"] = *s.exitCode;
    }
    return j;
}

} // namespace

BackgroundProcessManager::BackgroundProcessManager(daemon::ActivityRegistry& activity)
    : activity_(activity) {
    reaper_ = std::jthread([this](std::stop_token stop) { reapLoop(stop); });
}

BackgroundProcessManager::~BackgroundProcessManager() {
    stopAll();
    reaper_.request_stop();
    if (reaper_.joinable()) {
        reaper_.join();
    }
}

void BackgroundProcessManager::reapLoop(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop.stop_requested()) {
        reapLocked();
        exitCv_.wait_for(lock, stop, kReapPollInterval, [] { return false; });
    }
}

Result<BackgroundProcessManager::Session>
BackgroundProcessManager::start(const std::vector<std::string>& command,
                                const std::filesystem::path& cwd) {
    if (command.empty() || command.front().empty()) {
        return Error{ErrorCode::InvalidArgument, "command must not be empty"};
    }

    std::vector<std::string> args = command;
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    const std::string workdir = cwd.string();

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) != 0) {
        return Error{ErrorCode::InternalError,
                     std::format("Failed to create pipe: {}", std::strerror(errno))};
    }

    // Held across fork so the reaper cannot collect the child before its session exists
    std::lock_guard<std::mutex> lock(mutex_);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return Error{ErrorCode::InternalError, std::format("Failed to fork: {}", std::strerror(err))};
    }
    if (pid == 0) {
        ::close(pipefd[0]);
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) {
                ::close(devnull);
            }
        }
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            int err = errno;
            (void)!::write(pipefd[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());
        int err = errno;
        (void)!::write(pipefd[1], &err, sizeof(err));
        ::_exit(127);
    }

    ::close(pipefd[1]);
    // Both sides set the group so stop() can signal it before the child has run
    ::setpgid(pid, pid);
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(pipefd[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(pipefd[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        return Error{ErrorCode::InvalidArgument, std::format("Failed to launch '{}': {}",
                                                             command.front(),
                                                             std::strerror(childErr))};
    }

    Entry entry;
    entry.session.id = std::format("bg-{}", nextId_++);
    entry.session.pid = pid;
    entry.session.command = command;
    entry.session.startedAt = daemon::currentIsoTimestamp();
    entry.lease = activity_.acquire(kBackgroundProcessActivity);
    auto session = entry.session;
    sessions_.emplace(session.id, std::move(entry));
    spdlog::info("Background process {} started (PID: {}): {}", session.id, session.pid,
                 command.front());
    return session;
}

bool BackgroundProcessManager::reapLocked() {
    bool changed = false;
    for (auto& [id, entry] : sessions_) {
        if (!entry.session.running) {
            continue;
        }
        int status = 0;
        pid_t r = ::waitpid(static_cast<pid_t>(entry.session.pid), &status, WNOHANG);
        if (r == static_cast<pid_t>(entry.session.pid) || (r < 0 && errno == ECHILD)) {
            entry.session.running = false;
            if (r > 0) {
                entry.session.exitCode = decode_wait_status(status);
            }
            entry.lease.release();
            changed = true;
            spdlog::info("Background process {} exited", id);
        }
    }
    if (changed) {
        exitCv_.notify_all();
    }
    return changed;
}

Result<bool> BackgroundProcessManager::runningLocked(const std::string& id) const {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Error{ErrorCode::NotFound, std::format("No background process with id '{}'", id)};
    }
    return it->second.session.running;
}

Result<BackgroundProcessManager::Session>
BackgroundProcessManager::signalLocked(const std::string& id, int sig) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Error{ErrorCode::NotFound, std::format("No background process with id '{}'", id)};
    }
    if (it->second.session.running) {
        signal_group(static_cast<pid_t>(it->second.session.pid), sig);
    }
    return it->second.session;
}

Result<BackgroundProcessManager::Session>
BackgroundProcessManager::finishStopLocked(const std::string& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Error{ErrorCode::NotFound, std::format("No background process with id '{}'", id)};
    }
    if (it->second.session.running) {
        // Still unreaped after SIGKILL; the reaper releases the lease once it exits
        return Error{ErrorCode::Timeout,
                     std::format("Background process {} did not exit after SIGKILL", id)};
    }
    it->second.lease.release();
    auto session = it->second.session;
    sessions_.erase(it);
    spdlog::info("Background process {} stopped", id);
    return session;
}

Result<BackgroundProcessManager::Session>
BackgroundProcessManager::stop(const std::string& id, std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lock(mutex_);
    reapLocked();
    auto signalled = signalLocked(id, SIGTERM);
    if (!signalled) {
        return signalled.error();
    }

    auto exited = [&] {
        reapLocked();
        auto running = runningLocked(id);
        return !running || !running.value();
    };
    if (!exitCv_.wait_for(lock, grace, exited)) {
        spdlog::warn("Background process {} ignored SIGTERM; killing", id);
        if (auto killed = signalLocked(id, SIGKILL); !killed) {
            return killed.error();
        }
        exitCv_.wait_for(lock, kKillWait, exited);
    }
    return finishStopLocked(id);
}

awaitable<Result<BackgroundProcessManager::Session>>
BackgroundProcessManager::stopAsync(std::string id, std::chrono::milliseconds grace) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reapLocked();
        auto signalled = signalLocked(id, SIGTERM);
        if (!signalled) {
            co_return signalled.error();
        }
    }

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    auto deadline = std::chrono::steady_clock::now() + grace;
    bool killed = false;
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reapLocked();
            auto running = runningLocked(id);
            if (!running) {
                co_return running.error();
            }
            if (!running.value()) {
                co_return finishStopLocked(id);
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                if (killed) {
                    co_return finishStopLocked(id);
                }
                spdlog::warn("Background process {} ignored SIGTERM; killing", id);
                if (auto sent = signalLocked(id, SIGKILL); !sent) {
                    co_return sent.error();
                }
                killed = true;
                deadline = std::chrono::steady_clock::now() + kKillWait;
            }
        }
        timer.expires_after(kReapPollInterval);
        co_await timer.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
    }
}

std::vector<BackgroundProcessManager::Session> BackgroundProcessManager::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    reapLocked();
    std::vector<Session> out;
    out.reserve(sessions_.size());
    for (const auto& [id, entry] : sessions_) {
        out.push_back(entry.session);
    }
    return out;
}

std::vector<std::string> BackgroundProcessManager::sessionIds() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, entry] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

void BackgroundProcessManager::stopAll() noexcept {
    for (const auto& id : sessionIds()) {
        auto stopped = stop(id, kShutdownStopGrace);
        if (!stopped && stopped.error().code != ErrorCode::NotFound) {
            spdlog::warn("Failed to stop background process {}: {}", id, stopped.error().message);
        }
    }
}

awaitable<void> BackgroundProcessManager::stopAllAsync() {
    for (const auto& id : sessionIds()) {
        auto stopped = co_await stopAsync(id, kShutdownStopGrace);
        if (!stopped && stopped.error().code != ErrorCode::NotFound) {
            spdlog::warn("Failed to stop background process {}: {}", id, stopped.error().message);
        }
    }
}

namespace {

awaitable<ToolResponse> doctor(BuiltinContext ctx, json) {
    std::string text = "toolhub doctor\n";
    text += std::format("Version: {}\n", kVersion);
    text += std::format("PID: {}\n", static_cast<long>(::getpid()));
    text += std::format("Runtime: {}\n", ctx.runtime);
    text += std::format("Runtime dir: {}\n", config::get_runtime_dir().string());
    text += std::format("Config: {}\n", config::get_config_path().string());
    text += std::format("Workspace: {}\n", ctx.workspaceRoot.string());
    if (!ctx.workspaceKey.empty()) {
        text += std::format("Workspace key: {}\n", ctx.workspaceKey);
    }
    text += std::format("Socket: {}", ctx.socketPath.string());
    co_return ToolResponse::fromText(std::move(text));
}

ToolResponse daemon_only(const std::string& tool) {
    return ToolResponse::error("Background processes unavailable",
                               std::format("'{}' must run inside the workspace daemon.", tool));
}

awaitable<ToolResponse> start_background(BackgroundProcessManager* processes, json args) {
    if (!processes) {
        co_return daemon_only("start-background-process");
    }
    std::vector<std::string> command;
    if (auto it = args.find("command"); it != args.end() && it->is_string()) {
        command.push_back(it->get<std::string>());
    } else {
        co_return ToolResponse::error("Invalid arguments", "'command' must be a string");
    }
    if (auto it = args.find("args"); it != args.end()) {
        if (!it->is_array()) {
            co_return ToolResponse::error("Invalid arguments", "'args' must be an array");
        }
        for (const auto& a : *it) {
            command.push_back(a.is_string() ? a.get<std::string>() : a.dump());
        }
    }
    std::filesystem::path cwd;
    if (auto it = args.find("cwd"); it != args.end() && it->is_string()) {
        cwd = it->get<std::string>();
    }

    auto started = processes->start(command, cwd);
    if (!started) {
        co_return ToolResponse::error("Failed to start background process",
                                      started.error().message);
    }
    const auto& s = started.value();
    auto res = ToolResponse::fromText(
        std::format("Started background process {} (PID: {})", s.id, s.pid));
    res.content.push_back({"text", session_to_json(s).dump()});
    co_return res;
}

awaitable<ToolResponse> stop_background(BackgroundProcessManager* processes, json args) {
    if (!processes) {
        co_return daemon_only("stop-background-process");
    }
    auto it = args.find("sessionId");
    if (it == args.end() || !it->is_string()) {
        co_return ToolResponse::error("Invalid arguments", "'sessionId' must be a string");
    }
    auto stopped = co_await processes->stopAsync(it->get<std::string>());
    if (!stopped) {
        co_return ToolResponse::error("Failed to stop background process",
                                      stopped.error().message);
    }
    const auto& s = stopped.value();
    std::string text = std::format("Stopped background process {}", s.id);
    if (s.exitCode) {
        text += std::format(" (exit code {})", *s.exitCode);
    }
    co_return ToolResponse::fromText(std::move(text));
}

awaitable<ToolResponse> list_background(BackgroundProcessManager* processes, json) {
    if (!processes) {
        co_return daemon_only("list-background-processes");
    }
    auto sessions = processes->list();
    if (sessions.empty()) {
        co_return ToolResponse::fromText("No background processes");
    }
    json items = json::array();
    for (const auto& s : sessions) {
        items.push_back(session_to_json(s));
    }
    co_return ToolResponse::fromText(items.dump(2));
}

} // namespace

std::vector<ToolDefinition> builtinToolDefinitions(const BuiltinContext& ctx) {
    std::vector<ToolDefinition> defs;

    defs.push_back(ToolDefinition{
        .cliName = "doctor",
        .mcpName = "doctor",
        .workflowId = "diagnostics",
        .description = "Report version, process and path information",
        .stateful = false,
        .bridgeRemoteName = std::nullopt,
        .handler = [ctx](json args) { return doctor(ctx, std::move(args)); }});

    auto* processes = ctx.processes;
    defs.push_back(ToolDefinition{
        .cliName = "start-background-process",
        .mcpName = "start_background_process",
        .workflowId = "background",
        .description = "Launch a command that keeps running after the call returns",
        .stateful = true,
        .bridgeRemoteName = std::nullopt,
        .handler = [processes](json args) { return start_background(processes, std::move(args)); }});
    defs.push_back(ToolDefinition{
        .cliName = "stop-background-process",
        .mcpName = "stop_background_process",
        .workflowId = "background",
        .description = "Terminate a background process by session id",
        .stateful = true,
        .bridgeRemoteName = std::nullopt,
        .handler = [processes](json args) { return stop_background(processes, std::move(args)); }});
    defs.push_back(ToolDefinition{
        .cliName = "list-background-processes",
        .mcpName = "list_background_processes",
        .workflowId = "background",
        .description = "List background processes started in this workspace",
        .stateful = true,
        .bridgeRemoteName = std::nullopt,
        .handler = [processes](json args) { return list_background(processes, std::move(args)); }});

    return defs;
}

} // namespace toolhub::tools
