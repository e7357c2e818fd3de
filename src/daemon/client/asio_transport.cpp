#include <toolhub/daemon/client/asio_transport.h>
#include <toolhub/daemon/client/ipc_failure.h>
#include <toolhub/daemon/ipc/message_framing.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <format>

#include <sys/stat.h>

namespace toolhub::daemon {

using boost::asio::as_tuple;
using boost::asio::awaitable;
using boost::asio::use_awaitable;
namespace this_coro = boost::asio::this_coro;
using namespace boost::asio::experimental::awaitable_operators;

namespace {

constexpr size_t kReadChunkSize = 64 * 1024;

bool is_reset_or_broken_pipe(const boost::system::error_code& ec) {
    return ec == boost::asio::error::connection_reset || ec == boost::asio::error::broken_pipe ||
           ec == boost::asio::error::connection_aborted;
}

} // namespace

awaitable<Result<std::unique_ptr<AsioTransportAdapter::Socket>>>
AsioTransportAdapter::async_connect_with_timeout(std::chrono::milliseconds timeout) {
    const auto& path = opts_.socketPath;
    if (path.empty()) {
        co_return makeIpcError(IpcFailureKind::Other, "No socket path configured");
    }

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        co_return makeIpcError(IpcFailureKind::SocketMissing,
                               std::format("Daemon not running (socket not found at '{}')",
                                           path.string()));
    }
    if (!S_ISSOCK(st.st_mode)) {
        co_return makeIpcError(IpcFailureKind::PathNotSocket,
                               std::format("Path exists but is not a socket: '{}'", path.string()));
    }

    auto executor = co_await this_coro::executor;
    auto socket = std::make_unique<Socket>(executor);
    boost::asio::local::stream_protocol::endpoint endpoint(path.string());

    boost::asio::steady_timer timer(executor);
    timer.expires_after(timeout);
    auto connect_result = co_await (socket->async_connect(endpoint, as_tuple(use_awaitable)) ||
                                    timer.async_wait(as_tuple(use_awaitable)));

    if (connect_result.index() == 1) {
        boost::system::error_code ignored;
        socket->close(ignored);
        co_return makeIpcError(IpcFailureKind::Timeout,
                               std::format("Connection timeout after {}ms (socket='{}')",
                                           timeout.count(), path.string()));
    }

    auto& [ec] = std::get<0>(connect_result);
    if (ec) {
        if (ec == boost::asio::error::connection_refused) {
            co_return makeIpcError(
                IpcFailureKind::Refused,
                std::format("Daemon not running (connection refused at '{}')", path.string()));
        }
        if (ec == boost::asio::error::not_found ||
            ec == boost::system::errc::no_such_file_or_directory) {
            co_return makeIpcError(
                IpcFailureKind::SocketMissing,
                std::format("Daemon not running (socket not found at '{}')", path.string()));
        }
        co_return makeIpcError(IpcFailureKind::Other,
                               std::format("Connection failed: {}", ec.message()));
    }

    co_return std::move(socket);
}

awaitable<Result<void>> AsioTransportAdapter::async_write_all(Socket& socket,
                                                              const std::vector<uint8_t>& data,
                                                              Clock::time_point deadline) {
    boost::asio::steady_timer timer(co_await this_coro::executor);
    timer.expires_at(deadline);
    auto write_result = co_await (
        boost::asio::async_write(socket, boost::asio::buffer(data), as_tuple(use_awaitable)) ||
        timer.async_wait(as_tuple(use_awaitable)));

    if (write_result.index() == 1) {
        co_return makeIpcError(IpcFailureKind::Timeout, "Write timeout");
    }

    auto& [ec, bytes_written] = std::get<0>(write_result);
    if (ec) {
        auto kind =
            is_reset_or_broken_pipe(ec) ? IpcFailureKind::ResetOrBrokenPipe : IpcFailureKind::Other;
        co_return makeIpcError(kind, std::format("Write failed: {}", ec.message()));
    }
    co_return Result<void>{};
}

awaitable<Result<Response>> AsioTransportAdapter::async_read_response(Socket& socket,
                                                                      const std::string& requestId,
                                                                      Clock::time_point deadline) {
    auto executor = co_await this_coro::executor;
    FrameReader reader(opts_.maxFrameSize);
    std::array<uint8_t, kReadChunkSize> chunk{};

    for (;;) {
        boost::asio::steady_timer timer(executor);
        timer.expires_at(deadline);
        auto read_result =
            co_await (socket.async_read_some(boost::asio::buffer(chunk), as_tuple(use_awaitable)) ||
                      timer.async_wait(as_tuple(use_awaitable)));

        if (read_result.index() == 1) {
            co_return makeIpcError(IpcFailureKind::Timeout,
                                   std::format("Timed out waiting for response to {}", requestId));
        }

        auto& [ec, n] = std::get<0>(read_result);
        if (ec) {
            if (ec == boost::asio::error::eof) {
                co_return makeIpcError(IpcFailureKind::Eof,
                                       "Connection closed by daemon before a response arrived");
            }
            auto kind = is_reset_or_broken_pipe(ec) ? IpcFailureKind::ResetOrBrokenPipe
                                                    : IpcFailureKind::Other;
            co_return makeIpcError(kind, std::format("Read failed: {}", ec.message()));
        }

        auto fed = reader.feed(chunk.data(), n);
        if (fed.overflowed()) {
            co_return makeIpcError(IpcFailureKind::Protocol,
                                   fed.errors.empty() ? std::string{"Frame too large"}
                                                      : fed.errors.front().message);
        }
        for (const auto& err : fed.errors) {
            spdlog::debug("Ignoring undecodable frame from daemon: {}", err.message);
        }
        for (const auto& message : fed.messages) {
            auto parsed = parseResponse(message);
            if (!parsed) {
                spdlog::debug("Ignoring malformed response: {}", parsed.error().message);
                continue;
            }
            if (parsed.value().id != requestId) {
                spdlog::debug("Discarding response with unexpected id {} (waiting for {})",
                              parsed.value().id, requestId);
                continue;
            }
            co_return std::move(parsed).value();
        }
    }
}

awaitable<Result<Response>> AsioTransportAdapter::send_request(const Request& req) {
    const auto deadline = Clock::now() + opts_.requestTimeout;

    MessageFramer framer(opts_.maxFrameSize);
    auto frame = framer.frame_message(toJson(req));
    if (!frame) {
        co_return makeIpcError(IpcFailureKind::Protocol, frame.error().message);
    }

    auto connectTimeout = std::min(opts_.connectTimeout, opts_.requestTimeout);
    auto socketRes = co_await async_connect_with_timeout(connectTimeout);
    if (!socketRes) {
        co_return socketRes.error();
    }
    auto socket = std::move(socketRes).value();

    auto written = co_await async_write_all(*socket, frame.value(), deadline);
    if (!written) {
        co_return written.error();
    }

    auto response = co_await async_read_response(*socket, req.id, deadline);
    boost::system::error_code ignored;
    socket->shutdown(Socket::shutdown_both, ignored);
    socket->close(ignored);
    co_return response;
}

awaitable<Result<void>> AsioTransportAdapter::probe() {
    auto socketRes = co_await async_connect_with_timeout(opts_.connectTimeout);
    if (!socketRes) {
        co_return socketRes.error();
    }
    boost::system::error_code ignored;
    socketRes.value()->close(ignored);
    co_return Result<void>{};
}

} // namespace toolhub::daemon
