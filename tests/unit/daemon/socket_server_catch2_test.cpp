// Socket server and client over a real Unix socket

#include <catch2/catch_test_macros.hpp>

#include "common/test_helpers_catch2.h"

#include <toolhub/daemon/client/daemon_client.h>
#include <toolhub/daemon/client/ipc_failure.h>
#include <toolhub/daemon/components/RequestDispatcher.h>
#include <toolhub/daemon/components/SocketServer.h>
#include <toolhub/daemon/ipc/message_framing.h>
#include <toolhub/tools/tool_bridge.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <filesystem>
#include <memory>
#include <span>
#include <thread>

using namespace toolhub;
using namespace toolhub::daemon;
using boost::asio::awaitable;
using toolhub::test::run_awaitable;

namespace {

awaitable<tools::ToolResponse> echo(json args) {
    co_return tools::ToolResponse::fromText(args.value("text", std::string()));
}

class StaticBridge final : public tools::IToolBridge {
public:
    awaitable<Result<std::vector<tools::BridgedTool>>> listTools() override {
        co_return std::vector<tools::BridgedTool>{
            {"openFile", "Open a file in the editor", json{{"type", "object"}}},
            {"getDiagnostics", "Current diagnostics", json::object()}};
    }

    awaitable<Result<tools::ToolResponse>> invokeTool(const std::string& name, json) override {
        co_return tools::ToolResponse::fromText("bridged " + name);
    }
};

// Server on its own io_context thread
struct ServerHarness {
    std::filesystem::path socketPath = toolhub::test::make_socket_path("srv");
    StateComponent state;
    ActivityRegistry activity;
    tools::ToolCatalog catalog{std::vector<tools::ToolDefinition>{
        {.cliName = "echo", .mcpName = "echo", .workflowId = "test", .handler = echo}}};
    boost::asio::io_context io;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work;
    std::unique_ptr<RequestDispatcher> dispatcher;
    std::unique_ptr<SocketServer> server;
    std::thread thread;

    explicit ServerHarness(std::shared_ptr<tools::IToolBridge> bridge = nullptr) {
        DaemonIdentity identity;
        identity.socketPath = socketPath.string();
        identity.version = "test";
        dispatcher = std::make_unique<RequestDispatcher>(identity, catalog, state, activity,
                                                         std::move(bridge));
        server = std::make_unique<SocketServer>(SocketServer::Config{.socketPath = socketPath}, io,
                                                *dispatcher, state);
    }

    Result<void> start() {
        auto started = server->start();
        if (started) {
            work.emplace(io.get_executor());
            thread = std::thread([this] { io.run(); });
        }
        return started;
    }

    ~ServerHarness() {
        work.reset();
        io.stop();
        if (thread.joinable()) {
            thread.join();
        }
        if (server->isRunning()) {
            auto stopped = server->stop();
            (void)stopped;
        }
        socket_utils::remove_stale_socket(socketPath);
    }

    DaemonClient client() const { return DaemonClient(ClientConfig{.socketPath = socketPath}); }
};

} // namespace

TEST_CASE("Client round trips status and tools through the server", "[daemon][socket][catch2]") {
    ServerHarness h;
    REQUIRE(h.start());
    CHECK(h.server->isRunning());
    CHECK(std::filesystem::exists(h.socketPath));

    auto client = h.client();
    CHECK(run_awaitable(client.isRunning()));

    auto status = run_awaitable(client.status());
    REQUIRE(status);
    CHECK(status.value().socketPath == h.socketPath.string());
    CHECK(status.value().toolCount == 1);

    auto listed = run_awaitable(client.listTools());
    REQUIRE(listed);
    REQUIRE(listed.value().size() == 1);
    CHECK(listed.value()[0].name == "echo");

    auto invoked = run_awaitable(client.invokeTool("echo", json{{"text", "over the wire"}}));
    REQUIRE(invoked);
    CHECK(invoked.value().joinedText() == "over the wire");
}

TEST_CASE("Daemon error responses carry the wire code", "[daemon][socket][catch2]") {
    ServerHarness h;
    REQUIRE(h.start());

    auto client = h.client();
    auto missing = run_awaitable(client.invokeTool("nope", json::object()));
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::NotFound);
    CHECK(missing.error().message.rfind("NOT_FOUND: ", 0) == 0);
}

TEST_CASE("One connection may carry several requests", "[daemon][socket][catch2]") {
    ServerHarness h;
    REQUIRE(h.start());

    boost::asio::io_context io;
    boost::asio::local::stream_protocol::socket sock(io);
    sock.connect(boost::asio::local::stream_protocol::endpoint(h.socketPath.string()));

    MessageFramer framer;
    std::vector<uint8_t> out;
    for (const auto* id : {"a", "b"}) {
        REQUIRE(framer.frame_message_into(json{{"version", PROTOCOL_VERSION},
                                               {"id", id},
                                               {"method", "daemon.status"},
                                               {"params", json::object()}},
                                          out));
    }
    boost::asio::write(sock, boost::asio::buffer(out));

    FrameReader reader;
    std::vector<json> responses;
    std::array<uint8_t, 4096> buf{};
    while (responses.size() < 2) {
        auto n = sock.read_some(boost::asio::buffer(buf));
        auto fed = reader.feed(std::span<const uint8_t>(buf.data(), n));
        for (auto& m : fed.messages) {
            responses.push_back(std::move(m));
        }
    }
    CHECK(responses[0]["id"] == "a");
    CHECK(responses[1]["id"] == "b");
}

TEST_CASE("Rejected frames are answered in arrival order", "[daemon][socket][catch2]") {
    ServerHarness h;
    REQUIRE(h.start());

    boost::asio::io_context io;
    boost::asio::local::stream_protocol::socket sock(io);
    sock.connect(boost::asio::local::stream_protocol::endpoint(h.socketPath.string()));

    const std::string garbage = "{not json";
    const uint32_t len = static_cast<uint32_t>(garbage.size());
    std::vector<uint8_t> out{static_cast<uint8_t>(len >> 24), static_cast<uint8_t>(len >> 16),
                             static_cast<uint8_t>(len >> 8), static_cast<uint8_t>(len)};
    out.insert(out.end(), garbage.begin(), garbage.end());
    MessageFramer framer;
    REQUIRE(framer.frame_message_into(json{{"version", PROTOCOL_VERSION},
                                           {"id", "after"},
                                           {"method", "daemon.status"},
                                           {"params", json::object()}},
                                      out));
    boost::asio::write(sock, boost::asio::buffer(out));

    FrameReader reader;
    std::vector<json> responses;
    std::array<uint8_t, 4096> buf{};
    while (responses.size() < 2) {
        auto n = sock.read_some(boost::asio::buffer(buf));
        auto fed = reader.feed(std::span<const uint8_t>(buf.data(), n));
        for (auto& m : fed.messages) {
            responses.push_back(std::move(m));
        }
    }
    CHECK(responses[0]["id"] == "");
    CHECK(responses[0]["error"]["code"] == "BAD_REQUEST");
    CHECK(responses[1]["id"] == "after");
    CHECK(responses[1].contains("result"));
}

TEST_CASE("Stopping the server removes the socket file", "[daemon][socket][catch2]") {
    ServerHarness h;
    REQUIRE(h.start());
    h.work.reset();
    h.io.stop();
    h.thread.join();

    REQUIRE(h.server->stop());
    CHECK_FALSE(h.server->isRunning());
    CHECK_FALSE(std::filesystem::exists(h.socketPath));

    auto client = h.client();
    CHECK_FALSE(run_awaitable(client.isRunning()));
    auto status = run_awaitable(client.status());
    REQUIRE_FALSE(status);
    CHECK(isDaemonNotRunning(status.error()));
}

TEST_CASE("Socket paths beyond sun_path are rejected", "[daemon][socket][catch2]") {
    StateComponent state;
    ActivityRegistry activity;
    tools::ToolCatalog catalog{std::vector<tools::ToolDefinition>{}};
    RequestDispatcher dispatcher(DaemonIdentity{}, catalog, state, activity);
    boost::asio::io_context io;
    SocketServer server(
        SocketServer::Config{.socketPath = std::filesystem::path("/tmp") / std::string(150, 's')},
        io, dispatcher, state);
    auto started = server.start();
    REQUIRE_FALSE(started);
    CHECK(started.error().code == ErrorCode::InvalidArgument);
    CHECK_FALSE(server.isRunning());
}

TEST_CASE("Client lists and invokes IDE bridge tools", "[daemon][socket][bridge][catch2]") {
    ServerHarness h(std::make_shared<StaticBridge>());
    REQUIRE(h.start());

    auto client = h.client();
    auto listed = run_awaitable(client.listBridgeTools());
    REQUIRE(listed);
    CHECK(listed.value().toolCount == 2);
    REQUIRE(listed.value().tools.size() == 2);
    CHECK(listed.value().tools[0].name == "openFile");
    CHECK(listed.value().tools[0].inputSchema == json{{"type", "object"}});

    auto invoked = run_awaitable(client.invokeBridgeTool("getDiagnostics", json::object()));
    REQUIRE(invoked);
    CHECK(invoked.value().joinedText() == "bridged getDiagnostics");
}

TEST_CASE("Bridge listing without a bridge is not supported", "[daemon][socket][bridge][catch2]") {
    ServerHarness h;
    REQUIRE(h.start());

    auto client = h.client();
    auto listed = run_awaitable(client.listBridgeTools());
    REQUIRE_FALSE(listed);
    CHECK(listed.error().code == ErrorCode::NotSupported);
    CHECK(listed.error().message.find("BRIDGE_UNAVAILABLE") != std::string::npos);
}
