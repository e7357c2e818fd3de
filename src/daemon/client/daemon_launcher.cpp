#include <toolhub/config/config_helpers.h>
#include <toolhub/daemon/client/daemon_client.h>
#include <toolhub/daemon/client/daemon_launcher.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <optional>
#include <string_view>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace toolhub::daemon {

namespace fs = std::filesystem;
using boost::asio::awaitable;

namespace {

constexpr const char* kDaemonBinaryName = "toolhub-daemon";

bool is_executable(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

fs::path self_executable() {
    char buf[4096];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) {
        return {};
    }
    buf[n] = '\0';
    return fs::path(buf);
}

std::optional<fs::path> search_path(const std::string& name) {
    auto pathEnv = config::env_value("PATH");
    if (!pathEnv) {
        return std::nullopt;
    }
    std::string_view rest = *pathEnv;
    while (!rest.empty()) {
        auto sep = rest.find(':');
        auto dir = rest.substr(0, sep);
        if (!dir.empty()) {
            auto candidate = fs::path(dir) / name;
            if (is_executable(candidate)) {
                return candidate;
            }
        }
        if (sep == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

// argv/envp storage built before fork so the child only calls async-signal-safe functions.
// finalize() must run once the image has reached its final address.
struct ExecImage {
    std::string binary;
    std::vector<std::string> args;
    std::vector<std::string> env;
    std::vector<char*> argv;
    std::vector<char*> envp;

    void finalize() {
        for (auto& a : args) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);
        for (auto& e : env) {
            envp.push_back(e.data());
        }
        envp.push_back(nullptr);
    }
};

Result<ExecImage> build_exec_image(const LaunchOptions& opts) {
    auto binary = resolveDaemonBinary(opts.binary);
    if (!binary) {
        return binary.error();
    }

    ExecImage image;
    image.binary = binary.value();
    image.args = {image.binary};
    auto args = daemonArguments(opts);
    image.args.insert(image.args.end(), args.begin(), args.end());

    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto eq = entry.find('=');
        auto key = entry.substr(0, eq);
        if (opts.env.find(std::string(key)) != opts.env.end()) {
            continue;
        }
        image.env.emplace_back(entry);
    }
    for (const auto& [key, value] : opts.env) {
        image.env.push_back(key + "=" + value);
    }
    return image;
}

void redirect_stdio_to_devnull() {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO) {
            ::close(devnull);
        }
    }
}

} // namespace

std::vector<std::string> daemonArguments(const LaunchOptions& opts) {
    std::vector<std::string> args;
    if (!opts.socketPath.empty()) {
        args.push_back("--socket");
        args.push_back(opts.socketPath.string());
    }
    if (!opts.workspaceRoot.empty()) {
        args.push_back("--workspace");
        args.push_back(opts.workspaceRoot.string());
    }
    if (opts.foreground) {
        args.push_back("--foreground");
    }
    return args;
}

Result<std::string> resolveDaemonBinary(const std::string& override) {
    if (!override.empty()) {
        return override;
    }
    if (auto env = config::env_value(config::kEnvDaemonBin)) {
        return *env;
    }
    if (auto self = self_executable(); !self.empty()) {
        auto dir = self.parent_path();
        for (const auto& candidate :
             {dir / kDaemonBinaryName, dir.parent_path() / kDaemonBinaryName,
              dir.parent_path() / "daemon" / kDaemonBinaryName}) {
            if (is_executable(candidate)) {
                return candidate.string();
            }
        }
    }
    if (auto found = search_path(kDaemonBinaryName)) {
        return found->string();
    }
    return Error{ErrorCode::NotFound,
                 std::format("Could not find {} next to this executable or in PATH. Set {} to "
                             "the daemon binary.",
                             kDaemonBinaryName, config::kEnvDaemonBin)};
}

Result<void> spawnDetached(const LaunchOptions& opts) {
    auto image = build_exec_image(opts);
    if (!image) {
        return image.error();
    }
    auto& img = image.value();
    img.finalize();
    const std::string workdir = opts.workspaceRoot.string();

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) != 0) {
        return Error{ErrorCode::InternalError,
                     std::format("Failed to create pipe: {}", std::strerror(errno))};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return Error{ErrorCode::InternalError, std::format("Failed to fork: {}", std::strerror(err))};
    }

    if (pid == 0) {
        ::close(pipefd[0]);
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild != 0) {
            ::_exit(grandchild < 0 ? 1 : 0);
        }
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            int err = errno;
            (void)!::write(pipefd[1], &err, sizeof(err));
            ::_exit(127);
        }
        redirect_stdio_to_devnull();
        ::execve(img.binary.c_str(), img.argv.data(), img.envp.data());
        int err = errno;
        (void)!::write(pipefd[1], &err, sizeof(err));
        ::_exit(127);
    }

    ::close(pipefd[1]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    // EOF means exec succeeded and the pipe was closed on exec
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(pipefd[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(pipefd[0]);

    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return Error{ErrorCode::InternalError, "Failed to detach daemon process"};
    }
    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        return Error{ErrorCode::InternalError, std::format("Failed to exec {}: {}", img.binary,
                                                           std::strerror(childErr))};
    }
    spdlog::debug("Spawned detached daemon {} (socket {})", img.binary, opts.socketPath.string());
    return Result<void>();
}

Result<int> runDaemonForeground(const LaunchOptions& opts) {
    LaunchOptions attached = opts;
    attached.foreground = true;
    auto image = build_exec_image(attached);
    if (!image) {
        return image.error();
    }
    auto& img = image.value();
    img.finalize();
    const std::string workdir = opts.workspaceRoot.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::InternalError,
                     std::format("Failed to fork: {}", std::strerror(errno))};
    }
    if (pid == 0) {
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            ::_exit(127);
        }
        ::execve(img.binary.c_str(), img.argv.data(), img.envp.data());
        ::_exit(127);
    }

    // The terminal delivers Ctrl+C to both processes; let the daemon decide the exit code
    struct sigaction ignore{};
    struct sigaction prevInt{};
    struct sigaction prevTerm{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ::sigaction(SIGINT, &ignore, &prevInt);
    ::sigaction(SIGTERM, &ignore, &prevTerm);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    int waitErr = errno;

    ::sigaction(SIGINT, &prevInt, nullptr);
    ::sigaction(SIGTERM, &prevTerm, nullptr);

    if (waited < 0) {
        return Error{ErrorCode::InternalError,
                     std::format("Failed to wait for daemon: {}", std::strerror(waitErr))};
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

bool isDaemonListening(const std::filesystem::path& socketPath,
                       std::chrono::milliseconds timeout) {
    boost::asio::io_context io;
    DaemonClient client(ClientConfig{.socketPath = socketPath,
                                     .connectTimeout = timeout,
                                     .requestTimeout = timeout});
    bool listening = false;
    boost::asio::co_spawn(
        io, [&]() -> awaitable<void> { listening = co_await client.isRunning(); },
        boost::asio::detached);
    io.run();
    return listening;
}

DaemonLauncher::DaemonLauncher() : spawn_(spawnDetached) {}

DaemonLauncher::DaemonLauncher(SpawnFn spawn) : spawn_(std::move(spawn)) {}

awaitable<Result<void>> DaemonLauncher::ensureRunning(const LaunchOptions& opts) {
    if (opts.socketPath.empty()) {
        co_return Error{ErrorCode::InvalidArgument,
                        "No socket path configured for daemon communication."};
    }

    ClientConfig cfg;
    cfg.socketPath = opts.socketPath;
    cfg.connectTimeout = std::min(DaemonClient::kProbeTimeout, opts.startupTimeout);
    cfg.requestTimeout = DaemonClient::kProbeTimeout;
    DaemonClient client(cfg);

    // A socket that accepts but never answers does not count as a running daemon
    if (auto status = co_await client.status(); status) {
        co_return Result<void>();
    }

    spdlog::info("Starting daemon for {} (socket {})", opts.workspaceRoot.string(),
                 opts.socketPath.string());
    spawnCount_.fetch_add(1);
    if (auto spawned = spawn_(opts); !spawned) {
        co_return Error{spawned.error().code,
                        std::format("Failed to start daemon: {}", spawned.error().message)};
    }

    auto executor = co_await boost::asio::this_coro::executor;
    const auto deadline = std::chrono::steady_clock::now() + opts.startupTimeout;
    std::string lastError = "no response";
    while (std::chrono::steady_clock::now() < deadline) {
        boost::asio::steady_timer timer(executor);
        timer.expires_after(kPollInterval);
        co_await timer.async_wait(boost::asio::use_awaitable);

        auto status = co_await client.status();
        if (status) {
            spdlog::info("Daemon ready (PID: {})", status.value().pid);
            co_return Result<void>();
        }
        lastError = status.error().message;
    }

    co_return Error{
        ErrorCode::Timeout,
        std::format("Daemon did not become ready within {}ms (socket: {}). Last error: {}\n"
                    "Possible causes: the daemon binary failed to start, another process holds "
                    "the socket, or the runtime directory is not writable. Check the daemon log "
                    "or run 'toolhub daemon start --foreground' to see startup output.",
                    opts.startupTimeout.count(), opts.socketPath.string(), lastError)};
}

} // namespace toolhub::daemon
