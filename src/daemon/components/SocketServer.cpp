#include <toolhub/daemon/components/RequestDispatcher.h>
#include <toolhub/daemon/components/SocketServer.h>
#include <toolhub/daemon/components/StateComponent.h>
#include <toolhub/daemon/ipc/message_framing.h>
#include <toolhub/daemon/ipc/socket_utils.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <format>

namespace toolhub::daemon {

using boost::asio::as_tuple;
using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;
using local = boost::asio::local::stream_protocol;

namespace {
constexpr size_t kReadChunkSize = 64 * 1024;
}

SocketServer::SocketServer(const Config& config, boost::asio::io_context& io,
                           RequestDispatcher& dispatcher, StateComponent& state)
    : config_(config), io_(io), dispatcher_(dispatcher), state_(state) {
    if (config_.maxFrameSize == 0) {
        config_.maxFrameSize = MAX_MESSAGE_SIZE;
    }
}

SocketServer::~SocketServer() {
    if (running_.load()) {
        auto stopped = stop();
        if (!stopped) {
            spdlog::warn("SocketServer: stop during destruction failed: {}",
                         stopped.error().message);
        }
    }
}

Result<void> SocketServer::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Socket server already running"};
    }

    try {
        std::filesystem::path sockPath = config_.socketPath;
        if (!sockPath.is_absolute()) {
            sockPath = std::filesystem::absolute(sockPath);
        }
        if (!socket_utils::fits_sun_path(sockPath)) {
            running_ = false;
            return Error{ErrorCode::InvalidArgument,
                         std::format("Socket path too long for AF_UNIX: '{}'", sockPath.string())};
        }
        if (auto dir = socket_utils::ensure_socket_dir(sockPath); !dir) {
            running_ = false;
            return dir.error();
        }

        acceptor_ = std::make_unique<local::acceptor>(io_);
        local::endpoint endpoint(sockPath.string());
        acceptor_->open(endpoint.protocol());
        acceptor_->bind(endpoint);
        acceptor_->listen(boost::asio::socket_base::max_listen_connections);

        std::filesystem::permissions(sockPath, std::filesystem::perms::owner_read |
                                                   std::filesystem::perms::owner_write);
        actualSocketPath_ = sockPath;

        co_spawn(
            io_,
            [this]() -> awaitable<void> {
                co_await accept_loop();
                co_return;
            },
            detached);

        spdlog::info("Socket server listening on {}", sockPath.string());
        return {};
    } catch (const std::exception& e) {
        running_ = false;
        if (acceptor_) {
            boost::system::error_code ec;
            acceptor_->close(ec);
            acceptor_.reset();
        }
        spdlog::error("SocketServer::start exception: {}", e.what());
        return Error{ErrorCode::IOError, std::format("Failed to start socket server: {}", e.what())};
    }
}

Result<void> SocketServer::stop() {
    if (!running_.exchange(false)) {
        return Error{ErrorCode::InvalidState, "Socket server not running"};
    }

    spdlog::info("Stopping socket server");
    if (acceptor_ && acceptor_->is_open()) {
        boost::system::error_code ec;
        acceptor_->close(ec);
        if (ec) {
            spdlog::warn("SocketServer: closing acceptor failed: {}", ec.message());
        }
    }

    if (!actualSocketPath_.empty()) {
        socket_utils::remove_stale_socket(actualSocketPath_);
        actualSocketPath_.clear();
    }

    spdlog::info("Socket server stopped (total_conn={} active_conn={})", totalConnections_.load(),
                 activeConnections_.load());
    return {};
}

awaitable<void> SocketServer::accept_loop() {
    spdlog::debug("Accept loop started");

    while (running_.load()) {
        auto [ec, socket] = co_await acceptor_->async_accept(as_tuple(use_awaitable));

        if (ec) {
            if (!running_.load() || ec == boost::asio::error::operation_aborted) {
                break;
            }
            spdlog::warn("Accept error: {} ({})", ec.message(), ec.value());
            boost::asio::steady_timer timer(io_);
            timer.expires_after(config_.acceptBackoffMs);
            co_await timer.async_wait(as_tuple(use_awaitable));
            continue;
        }

        if (activeConnections_.load() >= config_.maxConnections) {
            spdlog::warn("Rejecting connection: {} connections already open",
                         activeConnections_.load());
            boost::system::error_code ignored;
            socket.close(ignored);
            continue;
        }

        auto current = activeConnections_.fetch_add(1) + 1;
        totalConnections_.fetch_add(1);
        spdlog::debug("SocketServer: accepted connection, active={} total={}", current,
                      totalConnections_.load());

        co_spawn(io_, handle_connection(std::make_shared<Socket>(std::move(socket))), detached);
    }

    spdlog::debug("Accept loop ended");
}

awaitable<void> SocketServer::handle_connection(std::shared_ptr<Socket> socket) {
    struct CleanupGuard {
        SocketServer* server;
        ~CleanupGuard() {
            auto current = server->activeConnections_.fetch_sub(1) - 1;
            spdlog::debug("Connection closed, active: {}", current);
        }
    } guard{this};

    try {
        FrameReader reader(config_.maxFrameSize);
        MessageFramer framer(config_.maxFrameSize);
        std::vector<uint8_t> buffer(kReadChunkSize);
        std::vector<uint8_t> frame;

        auto write_response = [&](const Response& response) -> awaitable<bool> {
            frame.clear();
            auto framed = framer.frame_message_into(toJson(response), frame);
            if (!framed) {
                spdlog::error("Response {} could not be framed: {}", response.id,
                              framed.error().message);
                auto fallback = Response::failure(response.id, ProtocolErrorCode::Internal,
                                                  framed.error().message);
                frame.clear();
                if (!framer.frame_message_into(toJson(fallback), frame)) {
                    co_return false;
                }
            }
            auto [ec, written] = co_await boost::asio::async_write(
                *socket, boost::asio::buffer(frame), as_tuple(use_awaitable));
            if (ec) {
                spdlog::debug("Write failed for response {}: {}", response.id, ec.message());
                co_return false;
            }
            co_return true;
        };

        for (;;) {
            auto [ec, n] =
                co_await socket->async_read_some(boost::asio::buffer(buffer), as_tuple(use_awaitable));
            if (ec) {
                if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                    spdlog::debug("Connection read error: {}", ec.message());
                }
                break;
            }

            auto fed = reader.feed(buffer.data(), n);
            // Replies go out in the order their frames arrived, rejected frames included
            bool open = true;
            size_t nextError = 0;
            auto reject_until = [&](size_t messagesBefore) -> awaitable<bool> {
                for (; nextError < fed.errors.size() &&
                       fed.errors[nextError].messagesBefore <= messagesBefore;
                     ++nextError) {
                    const auto& err = fed.errors[nextError];
                    if (err.status != FrameReader::FrameStatus::InvalidFrame) {
                        continue;
                    }
                    spdlog::debug("Malformed frame: {}", err.message);
                    StateComponent::InFlightGuard inFlight(state_);
                    if (!co_await write_response(
                            Response::failure("", ProtocolErrorCode::BadRequest, err.message))) {
                        co_return false;
                    }
                }
                co_return true;
            };

            for (size_t i = 0; open && i < fed.messages.size(); ++i) {
                if (!co_await reject_until(i)) {
                    open = false;
                    break;
                }
                StateComponent::InFlightGuard inFlight(state_);
                auto response = co_await dispatcher_.dispatch(fed.messages[i]);
                open = co_await write_response(response);
            }
            if (open) {
                open = co_await reject_until(fed.messages.size());
            }
            if (!open) {
                break;
            }
            if (fed.overflowed()) {
                spdlog::warn("Closing connection after oversized frame");
                break;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("SocketServer::handle_connection error: {}", e.what());
    }

    boost::system::error_code ignored;
    socket->shutdown(Socket::shutdown_both, ignored);
    socket->close(ignored);
}

} // namespace toolhub::daemon
