#pragma once
#include "bulbs/net/NetConfig.hpp"
#include "bulbs/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Start an async operation and an `asio::steady_timer` on the same executor.
 * - If the operation completes first, the timer is cancelled and the
 *   operation's `std::error_code` is returned.
 * - If the timer fires first, `cancel()` is invoked and the call returns
 *   `asio::error::timed_out`.
 *
 * In both cases this call only returns after the operation's own completion
 * handler has run. Callers routinely hand the operation references to stack
 * buffers, so returning on the timer alone would let a late handler write
 * into a dead frame.
 *
 * Requirements:
 * - The associated `asio::io_context` must already be running while we block.
 * - The `cancel()` functor must cancel the object that launched the operation
 *   (e.g. `socket.cancel()`), so the operation completes promptly with
 *   `operation_aborted`.
 */
namespace bulbs::net {

template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool opDone = false;
        bool timedOut = false;
        std::error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    // Completion of the user async op
    auto op_handler = [st, timer](const std::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            st->ec = op_ec;
            st->opDone = true;
        }
        st->cv.notify_one();
        timer->cancel();
    };

    // Kick off the async operation (it must call our op_handler)
    start_async(op_handler);

    // Arm the deadline
    timer->expires_after(timeout);
    timer->async_wait([st, cancel, timeout](const std::error_code& tec) {
        if (tec == asio::error::operation_aborted) {
            // Cancelled because the operation finished first.
            return;
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->opDone) {
                return;
            }
            st->timedOut = true;
        }
        logDebug("[with_deadline] timeout fired after ", timeout.count(), "ms\n");
        cancel(); // op handler still runs, with operation_aborted
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->opDone; });
    if (st->timedOut) {
        return asio::error::timed_out;
    }
    return st->ec;
}

} // namespace bulbs::net
