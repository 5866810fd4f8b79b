#pragma once
// ============================================================================
// PACER - Wake-up Signal
// ============================================================================
// Lets a coroutine wait for "notified OR deadline", whichever comes first.
// A steady_timer armed at the deadline is cancelled by notify().
// ============================================================================

#include "pacer/core/types.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <atomic>
#include <memory>

namespace pacer::core {

namespace net = boost::asio;

// The timer is only touched from its executor. Callers must run their waits on
// that executor (a strand or a single-threaded io_context).
class Signal : public std::enable_shared_from_this<Signal> {
public:
    explicit Signal(const net::any_io_executor& executor) : executor_(executor), timer_(executor) {}

    // Non-copyable
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Suspend until notify() is called or the deadline passes.
    /// May return spuriously; callers re-check their condition.
    net::awaitable<void> wait_until(TimePoint deadline) {
        if (pending_.exchange(false)) {
            co_return;
        }

        timer_.expires_at(deadline);
        boost::system::error_code ec;  // operation_aborted on notify
        co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        pending_.store(false);
    }

    /// Wake the current or next waiter. Safe to call from any thread.
    void notify() {
        pending_.store(true);
        net::post(executor_, [self = shared_from_this()] { self->timer_.cancel(); });
    }

    [[nodiscard]] const net::any_io_executor& executor() const noexcept { return executor_; }

private:
    net::any_io_executor executor_;
    net::steady_timer timer_;
    std::atomic<bool> pending_{false};
};

}  // namespace pacer::core
