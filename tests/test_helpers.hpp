#ifndef NOEXPP_TESTS_TEST_HELPERS_HPP
#define NOEXPP_TESTS_TEST_HELPERS_HPP

// ─────────────────────────────────────────────────────────────────────────────
// Coroutine helpers for tests
// ─────────────────────────────────────────────────────────────────────────────
// The client keeps a read loop alive on the io_context, so io.run() would
// never return. These helpers step the context until the awaited coroutine
// is done instead.

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace noexpp::testing {

inline constexpr std::chrono::seconds kRunSyncLimit{10};

namespace detail {

template <typename Future>
void step_until_ready(asio::io_context& io, Future& future) {
    const auto give_up = std::chrono::steady_clock::now() + kRunSyncLimit;
    while (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        if (std::chrono::steady_clock::now() > give_up) {
            throw std::runtime_error("run_sync: coroutine did not complete");
        }
        if (io.stopped()) {
            io.restart();
        }
        io.run_one_for(std::chrono::milliseconds(20));
    }
    // Let handlers posted by the coroutine's last step run too
    io.restart();
    io.poll();
}

}  // namespace detail

template <typename T>
T run_sync(asio::io_context& io, asio::awaitable<T> coro) {
    std::promise<T> promise;
    auto future = promise.get_future();

    asio::co_spawn(io, [&promise, coro = std::move(coro)]() mutable -> asio::awaitable<void> {
        try {
            promise.set_value(co_await std::move(coro));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }, asio::detached);

    detail::step_until_ready(io, future);
    return future.get();
}

inline void run_sync(asio::io_context& io, asio::awaitable<void> coro) {
    std::promise<void> promise;
    auto future = promise.get_future();

    asio::co_spawn(io, [&promise, coro = std::move(coro)]() mutable -> asio::awaitable<void> {
        try {
            co_await std::move(coro);
            promise.set_value();
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }, asio::detached);

    detail::step_until_ready(io, future);
    future.get();
}

/// Start a coroutine without waiting for it
template <typename T>
std::future<T> start(asio::io_context& io, asio::awaitable<T> coro) {
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();

    asio::co_spawn(io, [promise, coro = std::move(coro)]() mutable -> asio::awaitable<void> {
        try {
            if constexpr (std::is_void_v<T>) {
                co_await std::move(coro);
                promise->set_value();
            } else {
                promise->set_value(co_await std::move(coro));
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }, asio::detached);

    return future;
}

/// Step the context until `future` is ready
template <typename T>
T await_future(asio::io_context& io, std::future<T>& future) {
    detail::step_until_ready(io, future);
    return future.get();
}

/// Run everything that is ready now, without waiting for timers
inline void drain(asio::io_context& io) {
    io.restart();
    while (io.poll() > 0) {
        io.restart();
    }
    io.restart();
}

/// Run the context for a fixed wall-clock duration
inline void run_for(asio::io_context& io, std::chrono::milliseconds duration) {
    const auto until = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < until) {
        io.restart();
        io.run_one_until(until);
    }
    drain(io);
}

/// Step the context until `predicate` holds or `limit` passes
template <typename Predicate>
bool run_until(asio::io_context& io, Predicate predicate,
               std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
    const auto until = std::chrono::steady_clock::now() + limit;
    drain(io);
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= until) {
            return false;
        }
        io.restart();
        io.run_one_for(std::chrono::milliseconds(5));
    }
    drain(io);
    return true;
}

}  // namespace noexpp::testing

#endif  // NOEXPP_TESTS_TEST_HELPERS_HPP
