#include <toolhub/config/config_helpers.h>
#include <toolhub/daemon/daemon.h>
#include <toolhub/daemon/ipc/socket_utils.h>
#include <toolhub/version.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <execinfo.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

namespace fs = std::filesystem;
using namespace toolhub;

void log_fatal(const char* what) {
    if (auto logger = spdlog::default_logger()) {
        logger->critical("FATAL: {}", what);
        logger->flush();
    } else {
        std::fprintf(stderr, "FATAL: %s\n", what);
    }
}

void signal_handler(int signo) {
    const char* sigstr = (signo == SIGSEGV)   ? "SIGSEGV"
                         : (signo == SIGABRT) ? "SIGABRT"
                                              : "UNKNOWN";
    log_fatal(sigstr);
    void* bt[64];
    int n = backtrace(bt, 64);
    char** syms = backtrace_symbols(bt, n);
    if (syms) {
        for (int i = 0; i < n; ++i) {
            spdlog::critical("Backtrace[{}]: {}", i, syms[i]);
        }
        free(syms);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::_Exit(128 + signo);
}

void setup_fatal_handlers() {
    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGABRT, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
    std::set_terminate([]() noexcept {
        log_fatal("std::terminate called");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::_Exit(1);
    });
}

// spdlog names plus the syslog-style spellings accepted by TOOLHUB_DAEMON_LOG_LEVEL
std::optional<spdlog::level::level_enum> parse_log_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "trace")
        return spdlog::level::trace;
    if (value == "debug")
        return spdlog::level::debug;
    if (value == "info" || value == "notice")
        return spdlog::level::info;
    if (value == "warn" || value == "warning")
        return spdlog::level::warn;
    if (value == "error")
        return spdlog::level::err;
    if (value == "critical" || value == "alert" || value == "emergency")
        return spdlog::level::critical;
    if (value == "off" || value == "none")
        return spdlog::level::off;
    return std::nullopt;
}

void configure_logging(const fs::path& logPath, bool foreground) {
    std::vector<spdlog::sink_ptr> sinks;
    std::error_code ec;
    fs::create_directories(logPath.parent_path(), ec);
    if (!ec) {
        ::chmod(logPath.parent_path().c_str(), 0700);
    }
    try {
        const size_t max_size = 10 * 1024 * 1024;
        const size_t max_files = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), max_size, max_files));
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Warning: cannot open log file " << logPath << ": " << e.what() << std::endl;
    }
    if (foreground || sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    auto logger = std::make_shared<spdlog::logger>("toolhub-daemon", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::info);
}

std::chrono::milliseconds resolve_shutdown_grace() {
    auto raw = config::env_value(config::kEnvShutdownForceExitMs);
    if (!raw) {
        return config::kDefaultShutdownGrace;
    }
    try {
        auto ms = std::stoll(*raw);
        if (ms >= 0) {
            return std::chrono::milliseconds{ms};
        }
    } catch (const std::exception&) {
    }
    spdlog::warn("Invalid {}={}; using default {}ms", config::kEnvShutdownForceExitMs, *raw,
                 config::kDefaultShutdownGrace.count());
    return config::kDefaultShutdownGrace;
}

} // namespace

int main(int argc, char* argv[]) {
    setup_fatal_handlers();

    CLI::App app{"toolhub daemon - per-workspace tool host"};
    app.set_version_flag("--version", std::string(TOOLHUB_VERSION_STRING));

    std::string socketPath;
    std::string workspace;
    std::string logPath;
    std::string logLevel;
    std::string configPath;
    bool foreground = false;

    app.add_option("--socket", socketPath, "Unix domain socket path");
    app.add_option("--workspace", workspace, "Workspace root (default: resolved from cwd)");
    app.add_option("--log-path", logPath, "Log file path");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error/off)");
    app.add_option("--config", configPath, "Configuration file path");
    app.add_flag("-f,--foreground", foreground, "Also log to stderr");

    CLI11_PARSE(app, argc, argv);

    if (!configPath.empty()) {
        ::setenv(config::kEnvConfig, configPath.c_str(), 1);
    }

    // Workspace identity
    daemon::socket_utils::WorkspaceIdentity identity;
    std::error_code ec;
    if (workspace.empty()) {
        auto resolved = daemon::socket_utils::resolve_workspace(fs::current_path(ec));
        if (!resolved) {
            std::cerr << "Failed to resolve workspace: " << resolved.error().message << std::endl;
            return 1;
        }
        identity = resolved.value();
    } else {
        identity.root = fs::weakly_canonical(fs::absolute(config::expand_tilde(workspace)), ec);
        auto key = daemon::socket_utils::workspace_key(identity.root);
        if (!key) {
            std::cerr << "Failed to derive workspace key: " << key.error().message << std::endl;
            return 1;
        }
        identity.key = key.value();
    }

    daemon::DaemonConfig cfg;
    cfg.workspaceRoot = identity.root;
    cfg.workspaceKey = identity.key;
    cfg.socketPath = socketPath.empty() ? daemon::socket_utils::resolve_socket_path(identity.key)
                                        : config::expand_tilde(socketPath);

    if (logPath.empty()) {
        logPath = config::resolve_setting(config::kEnvLogPath, "daemon", "log_path").value_or("");
    }
    cfg.logPath = logPath.empty() ? daemon::socket_utils::log_path_for_key(identity.key)
                                  : config::expand_tilde(logPath);
    configure_logging(*cfg.logPath, foreground);

    if (logLevel.empty()) {
        logLevel = config::resolve_setting(config::kEnvLogLevel, "daemon", "log_level")
                       .value_or("info");
    }
    if (auto level = parse_log_level(logLevel)) {
        spdlog::set_level(*level);
    } else {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}'; using info", logLevel);
    }

    auto idle = config::resolve_idle_timeout();
    if (idle.rejectedValue) {
        spdlog::warn("Invalid {}={}; using default {}ms", config::kEnvIdleTimeoutMs,
                     *idle.rejectedValue, idle.timeout.count());
    }
    cfg.idleTimeout = idle.timeout;
    cfg.shutdownGrace = resolve_shutdown_grace();

    spdlog::info("toolhub-daemon {} starting (workspace {}, key {})", TOOLHUB_VERSION_STRING,
                 cfg.workspaceRoot.string(), cfg.workspaceKey);

    try {
        daemon::ToolDaemon daemon(cfg);
        auto started = daemon.start();
        if (!started) {
            spdlog::error("Failed to start daemon: {}", started.error().message);
            std::cerr << "Failed to start daemon: " << started.error().message << std::endl;
            return 1;
        }

        std::cout << "Daemon started (PID: " << ::getpid() << ")\n"
                  << "  Workspace: " << cfg.workspaceRoot.string() << "\n"
                  << "  Socket: " << cfg.socketPath.string() << "\n"
                  << "  Tools: " << daemon.catalog().size() << std::endl;

        return daemon.run();
    } catch (const std::exception& e) {
        spdlog::error("Daemon error: {}", e.what());
        return 1;
    }
}
