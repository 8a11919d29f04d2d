#pragma once

#include <taskfed/core/format.h>
#include <taskfed/core/types.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace taskfed::federation {

template <typename T>
using StoppableOp = std::function<boost::asio::awaitable<Result<T>>(std::stop_token)>;

namespace detail {

// Shared between the caller, the operation coroutine and the deadline
// coroutine. Whichever finishes first sets `done` and wakes the caller by
// cancelling `signal`; the loser sees `done` and drops its outcome.
template <typename T> struct RaceState {
    explicit RaceState(const boost::asio::any_io_executor& ex) : signal(ex), deadline(ex) {
        signal.expires_at(boost::asio::steady_timer::time_point::max());
    }

    boost::asio::steady_timer signal;
    boost::asio::steady_timer deadline;
    std::stop_source stop;
    std::optional<Result<T>> result;
    bool done = false;
    bool timedOut = false;
};

} // namespace detail

/**
 * @brief Race a backend operation against a deadline.
 *
 * The operation receives a stop token. If the deadline fires first the caller
 * gets ErrorCode::Timeout and a stop is requested on the token so the backend
 * can abandon its work; whatever the operation returns later is discarded.
 * Exceptions thrown by the operation become ErrorCode::SourceOperationFailed.
 *
 * All three coroutines run on the caller's executor, which must not run
 * handlers concurrently (single-threaded io_context or a strand).
 *
 * @param timeout Deadline for the operation
 * @param op Operation to run
 * @param what Short description used in error messages
 */
template <typename T>
boost::asio::awaitable<Result<T>> runWithTimeout(Duration timeout, StoppableOp<T> op,
                                                 std::string what) {
    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<detail::RaceState<T>>(executor);
    state->deadline.expires_after(timeout);

    boost::asio::co_spawn(
        executor,
        [state, op = std::move(op), what]() -> boost::asio::awaitable<void> {
            std::optional<Result<T>> outcome;
            try {
                outcome.emplace(co_await op(state->stop.get_token()));
            } catch (const std::exception& e) {
                outcome.emplace(
                    Error{ErrorCode::SourceOperationFailed, format("{} threw: {}", what, e.what())});
            }
            if (state->done) {
                co_return;
            }
            state->done = true;
            state->result = std::move(outcome);
            state->deadline.cancel();
            state->signal.cancel();
        },
        boost::asio::detached);

    boost::asio::co_spawn(
        executor,
        [state]() -> boost::asio::awaitable<void> {
            if (state->done) {
                co_return;
            }
            boost::system::error_code ec;
            co_await state->deadline.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec || state->done) {
                co_return;
            }
            state->done = true;
            state->timedOut = true;
            state->stop.request_stop();
            state->signal.cancel();
        },
        boost::asio::detached);

    if (!state->done) {
        boost::system::error_code ec;
        co_await state->signal.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (state->timedOut) {
        co_return Error{ErrorCode::Timeout,
                        format("{} timed out after {} ms", what, timeout.count())};
    }
    co_return std::move(*state->result);
}

} // namespace taskfed::federation
