#pragma once
#include "minerscan/net/NetConfig.hpp"
#include "minerscan/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

/**
 * @brief Block the calling thread on an async operation, bounded by a timer.
 *
 * The operation and an `asio::steady_timer` are started on the same executor.
 * The first to complete records its result; if the timer wins, `cancel()` is
 * invoked so the operation completes with `operation_aborted`, and the caller
 * sees `asio::error::timed_out`.
 *
 * Handlers own the shared state, so late completions after this function has
 * returned never touch a dead stack frame.
 *
 * The executor's io_context must be running on another thread (NetService);
 * calling this from the I/O thread itself would deadlock.
 */
namespace minerscan::net {

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
        bool done = false;
        std::error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    auto op_handler = [st, timer](const std::error_code& op_ec, auto&&... /*results*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
        timer->cancel();
    };

    start_async(op_handler);

    timer->expires_after(timeout);
    timer->async_wait([st, cancel, timer, timeout](const std::error_code& tec) {
        if (tec == asio::error::operation_aborted) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) {
                return;
            }
            st->ec = asio::error::timed_out;
            st->done = true;
        }
        logDebug("[with_deadline] timed out after ", timeout.count(), "ms\n");
        cancel();
        st->cv.notify_one();
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&] { return st->done; });
    return st->ec;
}

} // namespace minerscan::net
