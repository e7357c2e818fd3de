#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace toolhub::daemon {

// Mutable counters shared by the socket server, dispatcher and idle monitor
struct StateComponent {
    using Clock = std::chrono::steady_clock;

    std::chrono::system_clock::time_point startedAt = std::chrono::system_clock::now();
    std::string startedAtIso;

    std::atomic<size_t> inFlight{0};
    std::atomic<bool> shuttingDown{false};
    std::atomic<Clock::rep> lastActivityTicks{Clock::now().time_since_epoch().count()};

    void markActivity() noexcept {
        lastActivityTicks.store(Clock::now().time_since_epoch().count(),
                                std::memory_order_relaxed);
    }

    Clock::time_point lastActivity() const noexcept {
        return Clock::time_point(Clock::duration(lastActivityTicks.load(std::memory_order_relaxed)));
    }

    // Counts one request from decode until its response has been written
    class InFlightGuard {
    public:
        explicit InFlightGuard(StateComponent& state) : state_(state) {
            state_.inFlight.fetch_add(1, std::memory_order_acq_rel);
            state_.markActivity();
        }
        ~InFlightGuard() {
            state_.markActivity();
            state_.inFlight.fetch_sub(1, std::memory_order_acq_rel);
        }

        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;

    private:
        StateComponent& state_;
    };
};

} // namespace toolhub::daemon
