#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <utility>

namespace taskfed::tests {

// Drive `io` on the calling thread until the awaitable completes. Pending
// timers that belong to other coroutines (health loops, abandoned backend
// calls) are left in place.
template <typename T> T run_sync(boost::asio::io_context& io, boost::asio::awaitable<T> aw) {
    std::optional<T> out;
    std::exception_ptr error;
    bool done = false;
    boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> {
            try {
                out.emplace(co_await std::move(aw));
            } catch (...) {
                error = std::current_exception();
            }
            done = true;
        },
        boost::asio::detached);
    while (!done) {
        if (io.stopped())
            io.restart();
        io.run_one();
    }
    if (error)
        std::rethrow_exception(error);
    return std::move(*out);
}

inline void run_sync(boost::asio::io_context& io, boost::asio::awaitable<void> aw) {
    std::exception_ptr error;
    bool done = false;
    boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> {
            try {
                co_await std::move(aw);
            } catch (...) {
                error = std::current_exception();
            }
            done = true;
        },
        boost::asio::detached);
    while (!done) {
        if (io.stopped())
            io.restart();
        io.run_one();
    }
    if (error)
        std::rethrow_exception(error);
}

inline boost::asio::awaitable<void> sleep_for(std::chrono::milliseconds delay) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(delay);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

/// Let background coroutines on `io` run for `delay` of wall time
inline void run_for(boost::asio::io_context& io, std::chrono::milliseconds delay) {
    run_sync(io, sleep_for(delay));
}

} // namespace taskfed::tests
