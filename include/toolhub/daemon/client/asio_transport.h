#pragma once

#include <toolhub/core/types.h>
#include <toolhub/daemon/ipc/ipc_protocol.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

namespace toolhub::daemon {

// Single-use transport: every request opens its own connection, writes one frame, waits for
// the response carrying the same id and closes. All operations run on the calling
// coroutine's executor.
class AsioTransportAdapter {
public:
    struct Options {
        std::filesystem::path socketPath;
        std::chrono::milliseconds connectTimeout{1000};
        std::chrono::milliseconds requestTimeout{30000};
        size_t maxFrameSize = MAX_MESSAGE_SIZE;
    };

    using Socket = boost::asio::local::stream_protocol::socket;

    explicit AsioTransportAdapter(Options opts) : opts_(std::move(opts)) {}

    boost::asio::awaitable<Result<Response>> send_request(const Request& req);

    // Connect and immediately close; success means something is listening
    boost::asio::awaitable<Result<void>> probe();

    const Options& options() const noexcept { return opts_; }

private:
    using Clock = std::chrono::steady_clock;

    boost::asio::awaitable<Result<std::unique_ptr<Socket>>>
    async_connect_with_timeout(std::chrono::milliseconds timeout);

    boost::asio::awaitable<Result<void>> async_write_all(Socket& socket,
                                                         const std::vector<uint8_t>& data,
                                                         Clock::time_point deadline);

    boost::asio::awaitable<Result<Response>>
    async_read_response(Socket& socket, const std::string& requestId, Clock::time_point deadline);

    Options opts_;
};

} // namespace toolhub::daemon
