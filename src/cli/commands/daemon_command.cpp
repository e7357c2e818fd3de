#include <toolhub/cli/cli_sync.h>
#include <toolhub/cli/command.h>
#include <toolhub/cli/toolhub_cli.h>
#include <toolhub/config/config_helpers.h>
#include <toolhub/daemon/client/daemon_client.h>
#include <toolhub/daemon/client/daemon_launcher.h>
#include <toolhub/daemon/daemon_registry.h>
#include <toolhub/daemon/ipc/socket_utils.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <deque>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace toolhub::cli {

namespace {

constexpr std::chrono::milliseconds kStopWait{5000};
constexpr std::chrono::milliseconds kRestartPause{500};
constexpr std::chrono::milliseconds kListProbeTimeout{1000};
constexpr int kDefaultTailLines = 200;
// 'daemon status' when nothing answers, as with LSB init scripts
constexpr int kNotRunningExitCode = 3;

std::string joinWorkflows(const std::vector<std::string>& workflows) {
    std::string out;
    for (const auto& w : workflows) {
        if (!out.empty()) {
            out += ", ";
        }
        out += w;
    }
    return out.empty() ? "(none)" : out;
}

Result<daemon::DaemonStatus> fetchStatus(const std::filesystem::path& socketPath,
                                         std::chrono::milliseconds timeout) {
    daemon::ClientConfig cfg;
    cfg.socketPath = socketPath;
    cfg.connectTimeout = timeout;
    cfg.requestTimeout = timeout;
    return run_daemon_client(
        cfg, [](daemon::DaemonClient& client) { return client.status(); },
        timeout + std::chrono::milliseconds{500});
}

// Last n lines of a text file
Result<std::vector<std::string>> tailFile(const std::filesystem::path& path, size_t n) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open log file: " + path.string()};
    }
    std::deque<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
        if (lines.size() > n) {
            lines.pop_front();
        }
    }
    return std::vector<std::string>(lines.begin(), lines.end());
}

} // namespace

class DaemonCommand : public ICommand {
public:
    std::string getName() const override { return "daemon"; }

    std::string getDescription() const override { return "Manage the workspace daemon"; }

    void registerCommand(CLI::App& app, ToolhubCLI* cli) override {
        cli_ = cli;
        auto* daemon = app.add_subcommand(getName(), getDescription());
        daemon->require_subcommand(1);
        daemon->fallthrough();
        daemon->add_option("--socket", socketPath_, "Socket path for daemon communication");

        auto* start = daemon->add_subcommand("start", "Start the workspace daemon");
        start->add_flag("--foreground", foreground_, "Run attached to this terminal");
        start->add_option("--log-path", logPath_, "Daemon log file");
        start->add_option("--log-level", logLevel_,
                          "Daemon log level (trace, debug, info, warn, error)");
        start->add_option("--daemon-binary", daemonBinary_, "Path to toolhub-daemon (override)");
        start->callback([this]() { schedule(Action::Start); });

        auto* stop = daemon->add_subcommand("stop", "Stop the workspace daemon");
        stop->callback([this]() { schedule(Action::Stop); });

        auto* status = daemon->add_subcommand("status", "Show daemon status");
        status->callback([this]() { schedule(Action::Status); });

        auto* restart = daemon->add_subcommand("restart", "Restart the workspace daemon");
        restart->add_option("--log-path", logPath_, "Daemon log file");
        restart->add_option("--log-level", logLevel_, "Daemon log level");
        restart->callback([this]() { schedule(Action::Restart); });

        auto* list = daemon->add_subcommand("list", "List known daemons for all workspaces");
        list->add_flag("--json", listJson_, "Output in JSON format");
        list->add_flag("--all,!--running", listAll_, "Include stale entries (default)");
        list->callback([this]() { schedule(Action::List); });

        auto* logs = daemon->add_subcommand("logs", "Show the daemon log for this workspace");
        logs->add_option("-n,--tail", tailLines_, "Number of lines to show")
            ->default_val(kDefaultTailLines);
        logs->callback([this]() { schedule(Action::Logs); });
    }

    Result<void> execute() override {
        switch (action_) {
            case Action::Start:
                return startDaemon();
            case Action::Stop:
                return stopDaemon();
            case Action::Status:
                return showStatus();
            case Action::Restart:
                return restartDaemon();
            case Action::List:
                return listDaemons();
            case Action::Logs:
                return showLogs();
            case Action::None:
                break;
        }
        return Result<void>();
    }

private:
    enum class Action { None, Start, Stop, Status, Restart, List, Logs };

    void schedule(Action action) {
        action_ = action;
        cli_->setPendingCommand(this);
    }

    daemon::LaunchOptions launchOptions(const WorkspaceContext& ws) const {
        daemon::LaunchOptions opts;
        opts.socketPath = ws.socketPath;
        opts.workspaceRoot = ws.root;
        opts.startupTimeout = config::resolve_startup_timeout();
        opts.binary = daemonBinary_;
        if (!logPath_.empty()) {
            opts.env[config::kEnvLogPath] = config::expand_tilde(logPath_).string();
        }
        if (!logLevel_.empty()) {
            opts.env[config::kEnvLogLevel] = logLevel_;
        }
        return opts;
    }

    Result<void> startDaemon() {
        auto ws = cli_->workspace(socketPath_);
        if (!ws) {
            return ws.error();
        }
        if (daemon::isDaemonListening(ws.value().socketPath)) {
            std::cout << "Daemon is already running\n";
            return Result<void>();
        }

        auto opts = launchOptions(ws.value());
        if (foreground_) {
            auto code = daemon::runDaemonForeground(opts);
            if (!code) {
                return code.error();
            }
            cli_->setExitCode(code.value());
            return Result<void>();
        }

        auto launcher = std::make_shared<daemon::DaemonLauncher>();
        auto started = run_sync(ensureRunning(launcher, opts),
                                opts.startupTimeout + std::chrono::seconds(2));
        if (!started) {
            return started.error();
        }
        std::cout << "Daemon started\n"
                  << "  Workspace: " << ws.value().root.string() << "\n"
                  << "  Socket: " << ws.value().socketPath.string() << "\n";
        return Result<void>();
    }

    static boost::asio::awaitable<Result<void>>
    ensureRunning(std::shared_ptr<daemon::DaemonLauncher> launcher, daemon::LaunchOptions opts) {
        co_return co_await launcher->ensureRunning(opts);
    }

    // Sends daemon.stop and waits for the socket to go away. Sets wasRunning accordingly.
    Result<void> stopRunning(const WorkspaceContext& ws, bool& wasRunning) {
        wasRunning = daemon::isDaemonListening(ws.socketPath);
        if (!wasRunning) {
            return Result<void>();
        }
        daemon::ClientConfig cfg;
        cfg.socketPath = ws.socketPath;
        auto stopped = run_daemon_client(
            cfg, [](daemon::DaemonClient& client) { return client.stop(); },
            std::chrono::seconds(10));
        if (!stopped) {
            return Error{stopped.error().code,
                         "Failed to stop daemon: " + stopped.error().message};
        }

        const auto deadline = std::chrono::steady_clock::now() + kStopWait;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!daemon::isDaemonListening(ws.socketPath, std::chrono::milliseconds{200})) {
                return Result<void>();
            }
            std::this_thread::sleep_for(daemon::DaemonLauncher::kPollInterval);
        }
        return Error{ErrorCode::Timeout, "Daemon did not stop within " +
                                             std::to_string(kStopWait.count()) + "ms"};
    }

    Result<void> stopDaemon() {
        auto ws = cli_->workspace(socketPath_);
        if (!ws) {
            return ws.error();
        }
        bool wasRunning = false;
        if (auto r = stopRunning(ws.value(), wasRunning); !r) {
            return r;
        }
        std::cout << (wasRunning ? "Daemon stopped\n" : "Daemon is not running\n");
        return Result<void>();
    }

    Result<void> restartDaemon() {
        auto ws = cli_->workspace(socketPath_);
        if (!ws) {
            return ws.error();
        }
        bool wasRunning = false;
        if (auto r = stopRunning(ws.value(), wasRunning); !r) {
            return r;
        }
        if (wasRunning) {
            std::cout << "Daemon stopped\n";
            std::this_thread::sleep_for(kRestartPause);
        }
        return startDaemon();
    }

    Result<void> showStatus() {
        auto ws = cli_->workspace(socketPath_);
        if (!ws) {
            return ws.error();
        }
        const auto& ctx = ws.value();

        auto status = fetchStatus(ctx.socketPath, std::chrono::milliseconds{2000});
        if (!status) {
            spdlog::debug("Status probe failed: {}", status.error().message);
            cli_->setExitCode(kNotRunningExitCode);
            if (cli_->jsonOutput()) {
                nlohmann::json j{{"running", false}, {"workspaceRoot", ctx.root.string()}};
                std::cout << j.dump(2) << "\n";
                return Result<void>();
            }
            std::cout << "Daemon Status: Not running\n"
                      << "  Workspace: " << ctx.root.string() << "\n";
            daemon::DaemonRegistry registry;
            if (auto entry = registry.read(ctx.key); entry && entry->logPath) {
                std::cout << "  Last log: " << *entry->logPath << "\n";
            }
            return Result<void>();
        }

        const auto& s = status.value();
        if (cli_->jsonOutput()) {
            nlohmann::json j = s;
            j["running"] = true;
            std::cout << j.dump(2) << "\n";
            return Result<void>();
        }
        std::cout << "Daemon Status: Running\n"
                  << "  PID: " << s.pid << "\n"
                  << "  Workspace: " << s.workspaceRoot << "\n"
                  << "  Socket: " << s.socketPath << "\n"
                  << "  Logs: " << s.logPath.value_or("(none)") << "\n"
                  << "  Started: " << s.startedAt << "\n"
                  << "  Tools: " << s.toolCount << "\n"
                  << "  Workflows: " << joinWorkflows(s.enabledWorkflows) << "\n";
        return Result<void>();
    }

    Result<void> listDaemons() {
        daemon::DaemonRegistry registry;
        auto entries = registry.list();

        size_t running = 0;
        size_t stale = 0;
        std::vector<std::pair<daemon::DaemonRegistryEntry, bool>> rows;
        for (auto& entry : entries) {
            const bool alive = fetchStatus(entry.socketPath, kListProbeTimeout).has_value();
            if (alive) {
                ++running;
            } else {
                ++stale;
            }
            if (!alive && !listAll_) {
                continue;
            }
            rows.emplace_back(std::move(entry), alive);
        }

        if (listJson_ || cli_->jsonOutput()) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& [entry, alive] : rows) {
                nlohmann::json j = entry;
                j["status"] = alive ? "running" : "stale";
                out.push_back(std::move(j));
            }
            std::cout << out.dump(2) << "\n";
            return Result<void>();
        }

        if (rows.empty()) {
            std::cout << "No daemons registered\n";
        }
        for (const auto& [entry, alive] : rows) {
            std::cout << (alive ? "running" : "stale  ") << "  " << entry.workspaceKey
                      << "  pid " << entry.pid << "  " << entry.workspaceRoot << "\n";
        }
        std::cout << "Total: " << entries.size() << " (" << running << " running, " << stale
                  << " stale)\n";
        return Result<void>();
    }

    Result<void> showLogs() {
        auto ws = cli_->workspace(socketPath_);
        if (!ws) {
            return ws.error();
        }
        daemon::DaemonRegistry registry;
        auto entry = registry.read(ws.value().key);
        if (!entry || !entry->logPath || entry->logPath->empty()) {
            std::cout << "No daemon log path available for this workspace.\n";
            return Result<void>();
        }

        const auto n = static_cast<size_t>(std::max(1, tailLines_));
        auto lines = tailFile(*entry->logPath, n);
        if (!lines) {
            return lines.error();
        }
        for (const auto& line : lines.value()) {
            std::cout << line << "\n";
        }
        return Result<void>();
    }

    ToolhubCLI* cli_ = nullptr;
    Action action_ = Action::None;

    std::string socketPath_;
    bool foreground_ = false;
    std::string logPath_;
    std::string logLevel_;
    std::string daemonBinary_;
    bool listJson_ = false;
    bool listAll_ = true;
    int tailLines_ = kDefaultTailLines;
};

// Factory function
std::unique_ptr<ICommand> createDaemonCommand() {
    return std::make_unique<DaemonCommand>();
}

} // namespace toolhub::cli
