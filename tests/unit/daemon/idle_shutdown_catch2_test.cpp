// Idle shutdown gating

#include <catch2/catch_test_macros.hpp>

#include <toolhub/daemon/components/IdleShutdownMonitor.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

using namespace toolhub::daemon;
using namespace std::chrono_literals;

namespace {

IdleShutdownMonitor::Config config(std::chrono::milliseconds timeout) {
    IdleShutdownMonitor::Config c;
    c.timeout = timeout;
    c.checkInterval = 10ms;
    return c;
}

} // namespace

TEST_CASE("Shutdown waits for the idle timeout", "[daemon][idle][catch2]") {
    StateComponent state;
    ActivityRegistry activity;
    IdleShutdownMonitor monitor(config(1000ms), state, activity);

    const auto last = state.lastActivity();
    CHECK_FALSE(monitor.shouldShutdown(last + 999ms));
    CHECK(monitor.shouldShutdown(last + 1000ms));
    CHECK(monitor.shouldShutdown(last + 5000ms));
}

TEST_CASE("In-flight requests block idle shutdown", "[daemon][idle][catch2]") {
    StateComponent state;
    ActivityRegistry activity;
    IdleShutdownMonitor monitor(config(100ms), state, activity);

    {
        StateComponent::InFlightGuard guard(state);
        CHECK(state.inFlight.load() == 1);
        CHECK_FALSE(monitor.shouldShutdown(state.lastActivity() + 1h));
    }
    CHECK(state.inFlight.load() == 0);
    CHECK(monitor.shouldShutdown(state.lastActivity() + 1h));
}

TEST_CASE("Activity leases block idle shutdown", "[daemon][idle][catch2]") {
    StateComponent state;
    ActivityRegistry activity;
    IdleShutdownMonitor monitor(config(100ms), state, activity);

    auto lease = activity.acquire("background-process");
    CHECK_FALSE(monitor.shouldShutdown(state.lastActivity() + 1h));
    lease.release();
    CHECK(monitor.shouldShutdown(state.lastActivity() + 1h));
}

TEST_CASE("A zero timeout disables idle shutdown", "[daemon][idle][catch2]") {
    StateComponent state;
    ActivityRegistry activity;
    IdleShutdownMonitor monitor(config(0ms), state, activity);
    CHECK_FALSE(monitor.enabled());
    CHECK_FALSE(monitor.shouldShutdown(state.lastActivity() + 24h));

    boost::asio::io_context io;
    bool fired = false;
    monitor.start(io.get_executor(), [&] { fired = true; });
    io.run_for(50ms);
    CHECK_FALSE(fired);
}

TEST_CASE("A shutting-down daemon is not reported idle again", "[daemon][idle][catch2]") {
    StateComponent state;
    ActivityRegistry activity;
    IdleShutdownMonitor monitor(config(10ms), state, activity);
    state.shuttingDown = true;
    CHECK_FALSE(monitor.shouldShutdown(state.lastActivity() + 1h));
}

TEST_CASE("The monitor fires once when the daemon goes quiet", "[daemon][idle][catch2]") {
    StateComponent state;
    ActivityRegistry activity;
    IdleShutdownMonitor monitor(config(30ms), state, activity);

    boost::asio::io_context io;
    int fired = 0;
    monitor.start(io.get_executor(), [&] {
        ++fired;
        io.stop();
    });
    io.run_for(2s);
    CHECK(fired == 1);
}

TEST_CASE("Stopping the monitor cancels pending checks", "[daemon][idle][catch2]") {
    StateComponent state;
    ActivityRegistry activity;
    IdleShutdownMonitor monitor(config(50ms), state, activity);

    boost::asio::io_context io;
    bool fired = false;
    monitor.start(io.get_executor(), [&] { fired = true; });
    boost::asio::steady_timer stopper(io, 5ms);
    stopper.async_wait([&](const boost::system::error_code&) { monitor.stop(); });
    io.run_for(300ms);
    CHECK_FALSE(fired);
}
