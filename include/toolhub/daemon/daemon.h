#pragma once

#include <toolhub/config/config_helpers.h>
#include <toolhub/core/types.h>
#include <toolhub/daemon/components/ActivityRegistry.h>
#include <toolhub/daemon/components/StateComponent.h>
#include <toolhub/daemon/daemon_registry.h>
#include <toolhub/tools/builtin_tools.h>
#include <toolhub/tools/tool_bridge.h>
#include <toolhub/tools/tool_catalog.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace toolhub::daemon {

class IdleShutdownMonitor;
class RequestDispatcher;
class SocketServer;

struct DaemonConfig {
    std::filesystem::path socketPath;
    std::filesystem::path workspaceRoot;
    std::string workspaceKey;
    std::optional<std::filesystem::path> logPath;
    // Empty uses <runtime dir>/daemons
    std::filesystem::path registryDir;
    std::chrono::milliseconds idleTimeout = config::kDefaultIdleTimeout;
    std::chrono::milliseconds idleCheckInterval = config::kDefaultIdleCheckInterval;
    // After a shutdown request, the process is forced down once this elapses
    std::chrono::milliseconds shutdownGrace = config::kDefaultShutdownGrace;
    size_t workerThreads = 2;
    bool handleSignals = true;
};

// One workspace daemon: socket server, dispatcher, idle monitor and registry entry.
class ToolDaemon {
public:
    // Delay between accepting daemon.stop and beginning shutdown, so the reply gets out
    static constexpr std::chrono::milliseconds kStopReplyDelay{100};

    explicit ToolDaemon(DaemonConfig config, std::shared_ptr<tools::IToolBridge> bridge = nullptr,
                        std::vector<tools::ToolDefinition> extraTools = {});
    ~ToolDaemon();

    ToolDaemon(const ToolDaemon&) = delete;
    ToolDaemon& operator=(const ToolDaemon&) = delete;

    // Fails when another daemon already answers on the socket or the socket cannot be bound
    Result<void> start();

    // Serves until shutdown completes; returns the process exit code
    int run();

    // Thread-safe and idempotent
    void requestShutdown(const std::string& reason);

    const DaemonConfig& config() const noexcept { return config_; }
    const tools::ToolCatalog& catalog() const noexcept { return catalog_; }
    ActivityRegistry& activity() noexcept { return activity_; }
    StateComponent& state() noexcept { return state_; }
    const DaemonRegistry& registry() const noexcept { return registry_; }
    boost::asio::io_context& ioContext() noexcept { return *io_; }

private:
    void beginShutdown();
    void startWatchdog();
    void finishWatchdog();

    DaemonConfig config_;
    ActivityRegistry activity_;
    StateComponent state_;
    tools::BackgroundProcessManager processes_;
    tools::ToolCatalog catalog_;
    DaemonRegistry registry_;

    // Reset in the destructor before the components its pending handlers reference
    std::unique_ptr<boost::asio::io_context> io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    std::unique_ptr<RequestDispatcher> dispatcher_;
    std::unique_ptr<SocketServer> server_;
    std::unique_ptr<IdleShutdownMonitor> idleMonitor_;
    std::unique_ptr<boost::asio::signal_set> signals_;

    bool started_ = false;
    std::string shutdownReason_;

    std::thread watchdog_;
    std::mutex watchdogMutex_;
    std::condition_variable watchdogCv_;
    bool finished_ = false;
};

} // namespace toolhub::daemon
