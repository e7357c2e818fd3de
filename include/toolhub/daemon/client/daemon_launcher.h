#pragma once

#include <toolhub/core/types.h>

#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace toolhub::daemon {

struct LaunchOptions {
    std::filesystem::path socketPath;
    std::filesystem::path workspaceRoot;
    std::chrono::milliseconds startupTimeout{5000};
    // Extra environment for the daemon process, e.g. TOOLHUB_DAEMON_LOG_LEVEL
    std::map<std::string, std::string> env;
    // Daemon binary; empty resolves TOOLHUB_DAEMON_BIN, siblings of this executable, then PATH
    std::string binary;
    // Daemon also logs to stderr
    bool foreground = false;
};

// Command-line arguments passed to the daemon binary, without argv[0]
std::vector<std::string> daemonArguments(const LaunchOptions& opts);

// Locate the toolhub-daemon executable
Result<std::string> resolveDaemonBinary(const std::string& override = {});

// Launch the daemon in a new session with stdio on /dev/null and return without waiting for
// it. Fails only when the process could not be created or the exec failed.
Result<void> spawnDetached(const LaunchOptions& opts);

// Run the daemon attached to this terminal with --foreground and return its exit code
Result<int> runDaemonForeground(const LaunchOptions& opts);

// Synchronous liveness probe on a private io_context; used before this process owns one
bool isDaemonListening(const std::filesystem::path& socketPath,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds{1000});

// Brings a workspace daemon up on demand. The spawn step is injectable so the start-and-wait
// handshake can be exercised in-process.
class DaemonLauncher {
public:
    using SpawnFn = std::function<Result<void>(const LaunchOptions&)>;

    static constexpr std::chrono::milliseconds kPollInterval{100};

    DaemonLauncher();
    explicit DaemonLauncher(SpawnFn spawn);

    // Returns once the daemon answers daemon.status, spawning it first if nothing is listening
    boost::asio::awaitable<Result<void>> ensureRunning(const LaunchOptions& opts);

    [[nodiscard]] size_t spawnCount() const noexcept { return spawnCount_.load(); }

private:
    SpawnFn spawn_;
    std::atomic<size_t> spawnCount_{0};
};

// Text appended to auto-start failures
inline constexpr std::string_view kManualStartHint =
    "You can try starting the daemon manually:\n  toolhub daemon start";

} // namespace toolhub::daemon
