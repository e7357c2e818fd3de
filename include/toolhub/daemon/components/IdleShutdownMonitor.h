#pragma once

#include <toolhub/daemon/components/ActivityRegistry.h>
#include <toolhub/daemon/components/StateComponent.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace toolhub::daemon {

// Periodically decides whether the daemon has been quiet long enough to exit. Shutdown needs
// all of: idle time at or past the timeout, no request in flight, no activity lease held.
class IdleShutdownMonitor {
public:
    struct Config {
        std::chrono::milliseconds timeout{10 * 60 * 1000};
        std::chrono::milliseconds checkInterval{30 * 1000};
    };

    IdleShutdownMonitor(Config config, const StateComponent& state,
                        const ActivityRegistry& activity);
    ~IdleShutdownMonitor();

    IdleShutdownMonitor(const IdleShutdownMonitor&) = delete;
    IdleShutdownMonitor& operator=(const IdleShutdownMonitor&) = delete;

    [[nodiscard]] bool enabled() const noexcept { return config_.timeout.count() > 0; }
    [[nodiscard]] bool shouldShutdown(StateComponent::Clock::time_point now) const;

    // onIdle runs at most once, on the executor. No-op when the timeout is 0.
    void start(boost::asio::any_io_executor executor, std::function<void()> onIdle);
    void stop();

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    boost::asio::awaitable<void> run(std::function<void()> onIdle);

    Config config_;
    const StateComponent& state_;
    const ActivityRegistry& activity_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
    std::atomic<bool> stopped_{false};
};

} // namespace toolhub::daemon
