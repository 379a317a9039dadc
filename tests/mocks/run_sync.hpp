#ifndef SEMROUTE_TESTS_MOCKS_RUN_SYNC_HPP
#define SEMROUTE_TESTS_MOCKS_RUN_SYNC_HPP

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <future>

namespace semroute::testing {

// Run a coroutine to completion on `io` and return its result.
// The io_context must have no other endless work (e.g. a started monitor).
template <typename T>
T run_sync(asio::io_context& io, asio::awaitable<T> coro) {
    std::promise<T> promise;
    auto future = promise.get_future();

    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        try {
            promise.set_value(co_await std::move(coro));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }, asio::detached);

    io.run();
    io.restart();

    return future.get();
}

}  // namespace semroute::testing

#endif  // SEMROUTE_TESTS_MOCKS_RUN_SYNC_HPP
