#include <toolhub/daemon/client/daemon_launcher.h>
#include <toolhub/daemon/components/IdleShutdownMonitor.h>
#include <toolhub/daemon/components/RequestDispatcher.h>
#include <toolhub/daemon/components/SocketServer.h>
#include <toolhub/daemon/daemon.h>
#include <toolhub/daemon/ipc/socket_utils.h>
#include <toolhub/version.hpp>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>

#include <unistd.h>

namespace toolhub::daemon {

using boost::asio::awaitable;

namespace {

std::vector<tools::ToolDefinition> daemonTools(const DaemonConfig& cfg,
                                               tools::BackgroundProcessManager& processes,
                                               std::vector<tools::ToolDefinition> extra) {
    tools::BuiltinContext ctx;
    ctx.runtime = "daemon";
    ctx.socketPath = cfg.socketPath;
    ctx.workspaceRoot = cfg.workspaceRoot;
    ctx.workspaceKey = cfg.workspaceKey;
    ctx.processes = &processes;

    auto defs = tools::builtinToolDefinitions(ctx);
    for (auto& def : extra) {
        defs.push_back(std::move(def));
    }
    return defs;
}

DaemonRegistry makeRegistry(const std::filesystem::path& dir) {
    return dir.empty() ? DaemonRegistry() : DaemonRegistry(dir);
}

const char* signalName(int signo) {
    switch (signo) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "signal";
    }
}

} // namespace

ToolDaemon::ToolDaemon(DaemonConfig config, std::shared_ptr<tools::IToolBridge> bridge,
                       std::vector<tools::ToolDefinition> extraTools)
    : config_(std::move(config)), processes_(activity_),
      catalog_(daemonTools(config_, processes_, std::move(extraTools))),
      registry_(makeRegistry(config_.registryDir)),
      io_(std::make_unique<boost::asio::io_context>()) {
    DaemonIdentity identity;
    identity.socketPath = config_.socketPath.string();
    if (config_.logPath) {
        identity.logPath = config_.logPath->string();
    }
    identity.workspaceRoot = config_.workspaceRoot.string();
    identity.workspaceKey = config_.workspaceKey;
    identity.enabledWorkflows = catalog_.workflows();
    identity.version = TOOLHUB_VERSION_STRING;

    dispatcher_ = std::make_unique<RequestDispatcher>(std::move(identity), catalog_, state_,
                                                      activity_, std::move(bridge));
    dispatcher_->setStopHandler([this] {
        auto timer = std::make_shared<boost::asio::steady_timer>(*io_, kStopReplyDelay);
        timer->async_wait([this, timer](const boost::system::error_code&) {
            requestShutdown("stop request");
        });
    });

    SocketServer::Config serverConfig;
    serverConfig.socketPath = config_.socketPath;
    server_ = std::make_unique<SocketServer>(serverConfig, *io_, *dispatcher_, state_);

    IdleShutdownMonitor::Config idleConfig;
    idleConfig.timeout = config_.idleTimeout;
    idleConfig.checkInterval = config_.idleCheckInterval;
    idleMonitor_ = std::make_unique<IdleShutdownMonitor>(idleConfig, state_, activity_);

    activity_.setActivityListener([this] { state_.markActivity(); });
}

ToolDaemon::~ToolDaemon() {
    io_->stop();
    finishWatchdog();

    // Closes the acceptor while its io_context still exists
    if (server_ && server_->isRunning()) {
        if (auto r = server_->stop(); !r) {
            spdlog::warn("Socket server stop failed: {}", r.error().message);
        }
    }
    signals_.reset();
    idleMonitor_.reset();
    workGuard_.reset();
    io_.reset();

    server_.reset();
    dispatcher_.reset();
    activity_.setActivityListener(nullptr);
}

Result<void> ToolDaemon::start() {
    if (started_) {
        return Error{ErrorCode::InvalidState, "Daemon already started"};
    }
    if (config_.socketPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "Socket path is required"};
    }

    if (isDaemonListening(config_.socketPath)) {
        return Error{ErrorCode::InvalidState,
                     "Daemon is already running for this workspace (socket: " +
                         config_.socketPath.string() + ")"};
    }
    socket_utils::remove_stale_socket(config_.socketPath);

    if (auto r = server_->start(); !r) {
        return r;
    }

    state_.startedAt = std::chrono::system_clock::now();
    state_.startedAtIso = currentIsoTimestamp();
    state_.markActivity();

    DaemonRegistryEntry entry;
    entry.workspaceKey = config_.workspaceKey;
    entry.workspaceRoot = config_.workspaceRoot.string();
    entry.socketPath = config_.socketPath.string();
    if (config_.logPath) {
        entry.logPath = config_.logPath->string();
    }
    entry.pid = static_cast<int64_t>(::getpid());
    entry.startedAt = state_.startedAtIso;
    entry.enabledOperations = catalog_.workflows();
    entry.version = TOOLHUB_VERSION_STRING;
    if (auto r = registry_.write(entry); !r) {
        spdlog::warn("Failed to write daemon registry entry: {}", r.error().message);
    }

    workGuard_.emplace(boost::asio::make_work_guard(*io_));

    idleMonitor_->start(io_->get_executor(), [this] { requestShutdown("idle timeout"); });

    if (config_.handleSignals) {
        signals_ = std::make_unique<boost::asio::signal_set>(*io_, SIGINT, SIGTERM);
        signals_->async_wait([this](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                requestShutdown(signalName(signo));
            }
        });
    }

    started_ = true;
    spdlog::info("Daemon started (PID: {}) for {} on {} with {} tools", ::getpid(),
                 config_.workspaceRoot.string(), config_.socketPath.string(), catalog_.size());
    return Result<void>();
}

int ToolDaemon::run() {
    if (!started_) {
        spdlog::error("Daemon run requested before a successful start");
        return 1;
    }

    std::vector<std::thread> workers;
    for (size_t i = 1; i < config_.workerThreads; ++i) {
        workers.emplace_back([this] { io_->run(); });
    }
    io_->run();
    for (auto& t : workers) {
        t.join();
    }
    finishWatchdog();

    std::string reason;
    {
        std::lock_guard<std::mutex> lk(watchdogMutex_);
        reason = shutdownReason_;
    }
    spdlog::info("Daemon stopped ({})", reason.empty() ? "io context exited" : reason);
    return 0;
}

void ToolDaemon::requestShutdown(const std::string& reason) {
    if (state_.shuttingDown.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(watchdogMutex_);
        shutdownReason_ = reason;
    }
    spdlog::info("Shutdown requested: {}", reason);
    if (!started_) {
        return;
    }
    startWatchdog();
    boost::asio::post(*io_, [this] { beginShutdown(); });
}

void ToolDaemon::beginShutdown() {
    idleMonitor_->stop();
    if (signals_) {
        boost::system::error_code ec;
        signals_->cancel(ec);
    }
    if (auto r = server_->stop(); !r) {
        spdlog::warn("Socket server stop failed: {}", r.error().message);
    }
    if (auto r = registry_.remove(config_.workspaceKey); !r) {
        spdlog::warn("Failed to remove daemon registry entry: {}", r.error().message);
    }
    socket_utils::remove_stale_socket(config_.socketPath);

    boost::asio::co_spawn(
        *io_,
        [this]() -> awaitable<void> {
            co_await processes_.stopAllAsync();
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
            while (state_.inFlight.load() > 0) {
                timer.expires_after(std::chrono::milliseconds{20});
                co_await timer.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
            }
            spdlog::debug("All in-flight requests drained");
            workGuard_.reset();
            io_->stop();
        },
        boost::asio::detached);
}

void ToolDaemon::startWatchdog() {
    if (config_.shutdownGrace.count() <= 0) {
        return;
    }
    watchdog_ = std::thread([this] {
        std::unique_lock<std::mutex> lk(watchdogMutex_);
        if (watchdogCv_.wait_for(lk, config_.shutdownGrace, [this] { return finished_; })) {
            return;
        }
        lk.unlock();
        spdlog::error("Shutdown did not complete within {}ms; forcing exit",
                      config_.shutdownGrace.count());
        registry_.cleanupWorkspaceFiles(config_.workspaceKey);
        socket_utils::remove_stale_socket(config_.socketPath);
        if (auto logger = spdlog::default_logger()) {
            logger->flush();
        }
        std::_Exit(1);
    });
}

void ToolDaemon::finishWatchdog() {
    {
        std::lock_guard<std::mutex> lk(watchdogMutex_);
        finished_ = true;
    }
    watchdogCv_.notify_all();
    if (watchdog_.joinable() && watchdog_.get_id() != std::this_thread::get_id()) {
        watchdog_.join();
    }
}

} // namespace toolhub::daemon
