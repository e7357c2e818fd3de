#include <toolhub/daemon/components/IdleShutdownMonitor.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace toolhub::daemon {

using boost::asio::awaitable;

IdleShutdownMonitor::IdleShutdownMonitor(Config config, const StateComponent& state,
                                         const ActivityRegistry& activity)
    : config_(config), state_(state), activity_(activity) {}

IdleShutdownMonitor::~IdleShutdownMonitor() {
    stop();
}

bool IdleShutdownMonitor::shouldShutdown(StateComponent::Clock::time_point now) const {
    if (!enabled() || state_.shuttingDown.load()) {
        return false;
    }
    if (now - state_.lastActivity() < config_.timeout) {
        return false;
    }
    if (state_.inFlight.load() > 0) {
        return false;
    }
    return activity_.total() == 0;
}

void IdleShutdownMonitor::start(boost::asio::any_io_executor executor,
                                std::function<void()> onIdle) {
    if (!enabled()) {
        spdlog::info("Idle shutdown disabled");
        return;
    }
    stopped_ = false;
    timer_ = std::make_unique<boost::asio::steady_timer>(executor);
    spdlog::info("Idle shutdown after {}ms without activity (checked every {}ms)",
                 config_.timeout.count(), config_.checkInterval.count());
    boost::asio::co_spawn(executor, run(std::move(onIdle)), boost::asio::detached);
}

void IdleShutdownMonitor::stop() {
    stopped_ = true;
    if (timer_) {
        timer_->cancel();
    }
}

awaitable<void> IdleShutdownMonitor::run(std::function<void()> onIdle) {
    while (!stopped_.load()) {
        timer_->expires_after(config_.checkInterval);
        auto [ec] = co_await timer_->async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec || stopped_.load()) {
            co_return;
        }
        auto now = StateComponent::Clock::now();
        if (shouldShutdown(now)) {
            auto idleFor = std::chrono::duration_cast<std::chrono::milliseconds>(
                now - state_.lastActivity());
            spdlog::info("Daemon idle for {}ms; shutting down", idleFor.count());
            stopped_ = true;
            onIdle();
            co_return;
        }
        if (activity_.total() > 0) {
            spdlog::debug("Idle check: {} activity lease(s) held", activity_.total());
        }
    }
}

} // namespace toolhub::daemon
