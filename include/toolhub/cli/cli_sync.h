#pragma once

#include <chrono>
#include <future>
#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <toolhub/daemon/client/daemon_client.h>
#include <toolhub/daemon/client/global_io_context.h>

#include <toolhub/core/types.h>

namespace toolhub::cli {

// Run an awaitable<Result<T>> on the shared client io_context and block until it finishes or
// the timeout elapses. Exceptions thrown by the awaitable become InternalError.
template <typename T, typename Rep, typename Period>
inline Result<T> run_sync(boost::asio::awaitable<Result<T>> aw,
                          const std::chrono::duration<Rep, Period>& timeout) {
    try {
        auto prom = std::make_shared<std::promise<Result<T>>>();
        auto fut = prom->get_future();
        boost::asio::co_spawn(
            daemon::GlobalIOContext::global_executor(),
            [aw = std::move(aw), prom]() mutable -> boost::asio::awaitable<void> {
                try {
                    auto r = co_await std::move(aw);
                    prom->set_value(std::move(r));
                } catch (const std::exception& e) {
                    prom->set_value(Error{ErrorCode::InternalError, e.what()});
                }
                co_return;
            },
            boost::asio::detached);
        if (fut.wait_for(timeout) != std::future_status::ready) {
            return Error{ErrorCode::Timeout, "Operation timed out"};
        }
        return fut.get();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }
}

namespace detail {

template <typename Fn>
auto with_client(std::shared_ptr<daemon::DaemonClient> client, Fn fn) -> decltype(fn(*client)) {
    co_return co_await fn(*client);
}

} // namespace detail

// Run fn(client) on a fresh DaemonClient owned by the coroutine frame; the client outlives a
// timed-out wait.
template <typename Fn, typename Rep, typename Period>
inline auto run_daemon_client(daemon::ClientConfig config, Fn fn,
                              const std::chrono::duration<Rep, Period>& timeout) {
    auto client = std::make_shared<daemon::DaemonClient>(std::move(config));
    return run_sync(detail::with_client(std::move(client), std::move(fn)), timeout);
}

} // namespace toolhub::cli
