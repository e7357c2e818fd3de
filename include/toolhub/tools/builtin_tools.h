#pragma once

#include <toolhub/core/types.h>
#include <toolhub/daemon/components/ActivityRegistry.h>
#include <toolhub/tools/tool_definition.h>

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace toolhub::tools {

inline constexpr const char* kBackgroundProcessActivity = "background-process";

// Child processes launched on behalf of tool calls. Each running session holds an activity
// lease so the daemon stays up while it runs. A reaper thread collects children that exit
// on their own and releases their leases.
class BackgroundProcessManager {
public:
    struct Session {
        std::string id;
        int64_t pid = 0;
        std::vector<std::string> command;
        std::string startedAt;
        bool running = true;
        std::optional<int> exitCode;
    };

    explicit BackgroundProcessManager(daemon::ActivityRegistry& activity);
    ~BackgroundProcessManager();

    BackgroundProcessManager(const BackgroundProcessManager&) = delete;
    BackgroundProcessManager& operator=(const BackgroundProcessManager&) = delete;

    Result<Session> start(const std::vector<std::string>& command,
                          const std::filesystem::path& cwd = {});
    // SIGTERM to the session's process group, SIGKILL after the grace period. Blocks the
    // calling thread; event-loop callers use stopAsync.
    Result<Session> stop(const std::string& id,
                         std::chrono::milliseconds grace = kDefaultStopGrace);
    // Same contract as stop(), waiting on a steady_timer instead of the thread
    boost::asio::awaitable<Result<Session>>
    stopAsync(std::string id, std::chrono::milliseconds grace = kDefaultStopGrace);
    // Sessions ordered by id
    std::vector<Session> list();

    void stopAll() noexcept;
    boost::asio::awaitable<void> stopAllAsync();

    static constexpr std::chrono::milliseconds kDefaultStopGrace{2000};
    static constexpr std::chrono::milliseconds kShutdownStopGrace{500};
    // Upper bound on waiting for the kernel to deliver SIGKILL
    static constexpr std::chrono::milliseconds kKillWait{2000};

private:
    struct Entry {
        Session session;
        daemon::ActivityRegistry::Lease lease;
    };

    // Returns true when at least one session changed state
    bool reapLocked();
    void reapLoop(std::stop_token stop);
    // Session still present and running; NotFound when it was removed
    Result<bool> runningLocked(const std::string& id) const;
    Result<Session> signalLocked(const std::string& id, int sig);
    Result<Session> finishStopLocked(const std::string& id);

    std::vector<std::string> sessionIds();

    daemon::ActivityRegistry& activity_;
    mutable std::mutex mutex_;
    std::condition_variable_any exitCv_;
    std::map<std::string, Entry> sessions_;
    uint64_t nextId_ = 1;
    std::jthread reaper_;
};

struct BuiltinContext {
    std::string runtime = "cli";
    std::filesystem::path socketPath;
    std::filesystem::path workspaceRoot;
    std::string workspaceKey;
    // Null outside the daemon; the stateful tools are routed there instead
    BackgroundProcessManager* processes = nullptr;
};

// Tools compiled into every toolhub binary
std::vector<ToolDefinition> builtinToolDefinitions(const BuiltinContext& ctx);

} // namespace toolhub::tools
