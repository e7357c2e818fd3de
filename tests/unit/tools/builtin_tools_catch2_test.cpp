// Built-in tools and background process sessions

#include <catch2/catch_test_macros.hpp>

#include "common/test_helpers_catch2.h"

#include <toolhub/daemon/components/ActivityRegistry.h>
#include <toolhub/tools/builtin_tools.h>
#include <toolhub/tools/tool_catalog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <optional>
#include <thread>

using namespace toolhub;
using namespace toolhub::tools;
using toolhub::test::run_awaitable;

namespace {

const ToolDefinition& findTool(const std::vector<ToolDefinition>& defs, const std::string& name) {
    auto it = std::find_if(defs.begin(), defs.end(),
                           [&](const ToolDefinition& d) { return d.cliName == name; });
    REQUIRE(it != defs.end());
    return *it;
}

} // namespace

TEST_CASE("Builtin catalog exposes diagnostics and background tools", "[tools][builtin][catch2]") {
    auto defs = builtinToolDefinitions(BuiltinContext{});
    ToolCatalog catalog(defs);
    CHECK(catalog.resolve("doctor").found());
    CHECK(catalog.resolve("start_background_process").found());
    CHECK(catalog.resolve("list-background-processes").found());

    CHECK_FALSE(findTool(defs, "doctor").stateful);
    CHECK(findTool(defs, "start-background-process").stateful);
    CHECK(findTool(defs, "stop-background-process").stateful);
    CHECK(findTool(defs, "list-background-processes").stateful);
}

TEST_CASE("Doctor reports the runtime and workspace", "[tools][builtin][catch2]") {
    BuiltinContext ctx;
    ctx.runtime = "daemon";
    ctx.workspaceRoot = "/work/app";
    ctx.workspaceKey = "app-0123456789ab";
    ctx.socketPath = "/tmp/th.sock";
    auto defs = builtinToolDefinitions(ctx);

    auto res = run_awaitable(findTool(defs, "doctor").handler(json::object()));
    CHECK_FALSE(res.isError);
    auto text = res.joinedText();
    CHECK(text.find("Version: " + std::string(kVersion)) != std::string::npos);
    CHECK(text.find("Runtime: daemon") != std::string::npos);
    CHECK(text.find("Workspace: /work/app") != std::string::npos);
    CHECK(text.find("Workspace key: app-0123456789ab") != std::string::npos);
    CHECK(text.find("Socket: /tmp/th.sock") != std::string::npos);
}

TEST_CASE("Background tools need a process manager", "[tools][builtin][catch2]") {
    auto defs = builtinToolDefinitions(BuiltinContext{});
    auto res = run_awaitable(findTool(defs, "list-background-processes").handler(json::object()));
    CHECK(res.isError);
    CHECK(res.joinedText().rfind("Error: Background processes unavailable", 0) == 0);
}

TEST_CASE("Background sessions hold an activity lease while running",
          "[tools][builtin][process][catch2]") {
    daemon::ActivityRegistry activity;
    BackgroundProcessManager processes(activity);

    auto started = processes.start({"sleep", "30"});
    REQUIRE(started);
    const auto session = started.value();
    CHECK(session.id == "bg-1");
    CHECK(session.pid > 0);
    CHECK(activity.count(kBackgroundProcessActivity) == 1);

    auto listed = processes.list();
    REQUIRE(listed.size() == 1);
    CHECK(listed[0].running);

    auto stopped = processes.stop(session.id);
    REQUIRE(stopped);
    CHECK_FALSE(stopped.value().running);
    CHECK(activity.total() == 0);
    CHECK(processes.list().empty());

    auto again = processes.stop(session.id);
    REQUIRE_FALSE(again);
    CHECK(again.error().code == ErrorCode::NotFound);
}

TEST_CASE("Exited background processes release their lease", "[tools][builtin][process][catch2]") {
    daemon::ActivityRegistry activity;
    BackgroundProcessManager processes(activity);

    auto started = processes.start({"true"});
    REQUIRE(started);

    // Nobody lists or stops the session; the lease must still go away
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (activity.total() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    CHECK(activity.total() == 0);

    auto listed = processes.list();
    REQUIRE(listed.size() == 1);
    CHECK_FALSE(listed[0].running);
    REQUIRE(listed[0].exitCode.has_value());
    CHECK(*listed[0].exitCode == 0);
}

TEST_CASE("Asynchronous stop waits without blocking the event loop",
          "[tools][builtin][process][catch2]") {
    daemon::ActivityRegistry activity;
    BackgroundProcessManager processes(activity);

    auto started = processes.start({"sh", "-c", "trap '' TERM; sleep 30"});
    REQUIRE(started);
    const auto id = started.value().id;
    // Give the shell time to install its trap so SIGKILL is needed
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    boost::asio::io_context io;
    bool tickedBeforeStop = false;
    bool stopDone = false;
    std::optional<Result<BackgroundProcessManager::Session>> outcome;

    boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> {
            outcome = co_await processes.stopAsync(id, std::chrono::milliseconds(300));
            stopDone = true;
        },
        boost::asio::detached);
    boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> {
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
            timer.expires_after(std::chrono::milliseconds(20));
            co_await timer.async_wait(boost::asio::use_awaitable);
            tickedBeforeStop = !stopDone;
        },
        boost::asio::detached);
    io.run();

    CHECK(tickedBeforeStop);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->has_value());
    CHECK_FALSE(outcome->value().running);
    REQUIRE(outcome->value().exitCode.has_value());
    CHECK(*outcome->value().exitCode == 128 + SIGKILL);
    CHECK(activity.total() == 0);
    CHECK(processes.list().empty());
}

TEST_CASE("Asynchronous stop of an unknown session is NotFound", "[tools][builtin][process][catch2]") {
    daemon::ActivityRegistry activity;
    BackgroundProcessManager processes(activity);

    auto res = run_awaitable(processes.stopAsync("bg-404"));
    REQUIRE_FALSE(res);
    CHECK(res.error().code == ErrorCode::NotFound);
}

TEST_CASE("Launch failures are reported without a session", "[tools][builtin][process][catch2]") {
    daemon::ActivityRegistry activity;
    BackgroundProcessManager processes(activity);

    auto missing = processes.start({"/nonexistent/toolhub-test-binary"});
    REQUIRE_FALSE(missing);
    CHECK(missing.error().message.find("Failed to launch") != std::string::npos);
    CHECK(activity.total() == 0);

    auto empty = processes.start({});
    REQUIRE_FALSE(empty);
    CHECK(empty.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Background tools drive the manager through JSON arguments",
          "[tools][builtin][process][catch2]") {
    daemon::ActivityRegistry activity;
    BackgroundProcessManager processes(activity);
    BuiltinContext ctx;
    ctx.runtime = "daemon";
    ctx.processes = &processes;
    auto defs = builtinToolDefinitions(ctx);

    auto started = run_awaitable(findTool(defs, "start-background-process")
                                     .handler(json{{"command", "sleep"}, {"args", json::array({"30"})}}));
    REQUIRE_FALSE(started.isError);
    REQUIRE(started.content.size() == 2);
    auto info = json::parse(started.content[1].text);
    CHECK(info["command"] == json::array({"sleep", "30"}));
    auto id = info["sessionId"].get<std::string>();

    auto listed = run_awaitable(findTool(defs, "list-background-processes").handler(json::object()));
    CHECK(listed.joinedText().find(id) != std::string::npos);

    auto badArgs = run_awaitable(
        findTool(defs, "start-background-process").handler(json{{"command", 5}}));
    CHECK(badArgs.isError);

    auto stopped = run_awaitable(
        findTool(defs, "stop-background-process").handler(json{{"sessionId", id}}));
    CHECK_FALSE(stopped.isError);
    CHECK(stopped.joinedText().rfind("Stopped background process " + id, 0) == 0);

    auto empty = run_awaitable(findTool(defs, "list-background-processes").handler(json::object()));
    CHECK(empty.joinedText() == "No background processes");
}
