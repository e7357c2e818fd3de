#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <toolhub/core/types.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>

namespace toolhub::daemon {

class RequestDispatcher;
struct StateComponent;

/**
 * Unix domain socket listener for the daemon protocol.
 *
 * Each accepted connection is served by its own coroutine: bytes are fed to a FrameReader,
 * each decoded request is dispatched and its response written back before the next one is
 * read. A connection may carry any number of requests.
 */
class SocketServer {
public:
    struct Config {
        std::filesystem::path socketPath;
        size_t maxConnections = 256;
        size_t maxFrameSize = 0; // 0 = protocol maximum
        std::chrono::milliseconds acceptBackoffMs{100};
    };

    SocketServer(const Config& config, boost::asio::io_context& io, RequestDispatcher& dispatcher,
                 StateComponent& state);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Binds and listens; the socket file must not exist
    Result<void> start();
    // Stops accepting and removes the socket file. Connections already open finish their
    // current request. Call from an io_context thread, or after the io_context has stopped.
    Result<void> stop();
    bool isRunning() const { return running_.load(); }

    size_t activeConnections() const { return activeConnections_.load(); }
    uint64_t totalConnections() const { return totalConnections_.load(); }

private:
    using Socket = boost::asio::local::stream_protocol::socket;

    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> handle_connection(std::shared_ptr<Socket> socket);

    Config config_;
    boost::asio::io_context& io_;
    RequestDispatcher& dispatcher_;
    StateComponent& state_;

    std::unique_ptr<boost::asio::local::stream_protocol::acceptor> acceptor_;
    std::filesystem::path actualSocketPath_;

    std::atomic<size_t> activeConnections_{0};
    std::atomic<uint64_t> totalConnections_{0};
    std::atomic<bool> running_{false};
};

} // namespace toolhub::daemon
