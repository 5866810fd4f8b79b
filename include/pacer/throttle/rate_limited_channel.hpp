#pragma once
// ============================================================================
// PACER - Rate Limited Channel
// ============================================================================
// Forwards the latest input value at most once per `delay`.
//
//   producer --> [input] --> worker --> [output, bounded] --> consumer
//
// The worker is a coroutine on a strand of the given executor:
//   Idle:    wait for input; input closed -> exit (output closes)
//   Holding: once `delay` has passed since the last forward, send the
//            pending value; until then a newer input value replaces it.
//            Input closed -> exit without sending; output closed -> exit.
// The first value is forwarded immediately.
// ============================================================================

#include "pacer/core/channel.hpp"
#include "pacer/core/types.hpp"
#include "pacer/runtime/runtime.hpp"
#include "pacer/throttle/rate_limit_options.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace pacer::throttle {

namespace net = boost::asio;

namespace detail {

/// Loop turns a busy worker runs before it yields its thread
inline constexpr unsigned kYieldBudget = 128;

void log_worker_start(const std::string& name, Duration delay);

void log_worker_exit(const std::string& name, std::string_view reason, const WorkerStats& stats);

void log_worker_failure(const std::string& name, std::exception_ptr error);

template <core::ChannelValue T>
net::awaitable<void> rate_limit_worker(core::Receiver<T> input,
                                       core::Sender<T> output,
                                       Duration delay,
                                       std::string name) {
    WorkerStats stats;
    TimePoint last_send = Clock::now() - delay;  // first value goes out at once
    unsigned budget = kYieldBudget;
    log_worker_start(name, delay);

    for (;;) {
        auto first = co_await input.async_recv();
        if (!first) {
            log_worker_exit(name, "input closed", stats);
            co_return;
        }
        ++stats.received;
        T pending = std::move(*first.value);

        for (;;) {
            // Neither receive nor send suspends while input has data and the
            // output has room, so a busy worker hands its thread back here
            if (--budget == 0) {
                budget = kYieldBudget;
                auto executor = co_await net::this_coro::executor;
                co_await net::post(executor, net::use_awaitable);
            }

            if (Clock::now() - last_send >= delay) {
                const SendStatus status = co_await output.async_send(std::move(pending));
                if (status != SendStatus::Sent) {
                    log_worker_exit(name, "output closed", stats);
                    co_return;
                }
                last_send = Clock::now();
                ++stats.forwarded;
                break;
            }

            auto next = co_await input.async_recv_until(last_send + delay);
            if (next.is_received()) {
                pending = std::move(*next.value);
                ++stats.received;
                ++stats.coalesced;
            } else if (next.is_closed()) {
                ++stats.abandoned;
                log_worker_exit(name, "input closed", stats);
                co_return;
            }
            // TimedOut: the window has elapsed, loop back and send
        }
    }
}

}  // namespace detail

// ============================================================================
// Construction
// ============================================================================

/// Spawn a worker on a strand of `executor` and return the throttled output.
/// Throws std::invalid_argument for invalid options or a disconnected input.
template <core::ChannelValue T>
[[nodiscard]] core::Receiver<T> to_rate_limited_channel(const net::any_io_executor& executor,
                                                        core::Receiver<T> input,
                                                        const RateLimitOptions& options) {
    validate(options);
    if (!input.valid()) {
        throw std::invalid_argument("rate limiter '" + options.name + "': input is not connected");
    }

    auto [output_tx, output_rx] = core::make_channel<T>(options.output_capacity);

    net::co_spawn(
        net::make_strand(executor),
        detail::rate_limit_worker<T>(std::move(input), std::move(output_tx), options.delay,
                                     options.name),
        [name = options.name](std::exception_ptr error) {
            detail::log_worker_failure(name, error);
        });

    return std::move(output_rx);
}

template <core::ChannelValue T>
[[nodiscard]] core::Receiver<T> to_rate_limited_channel(runtime::Runtime& runtime,
                                                        core::Receiver<T> input,
                                                        const RateLimitOptions& options) {
    return to_rate_limited_channel(runtime.executor(), std::move(input), options);
}

template <core::ChannelValue T>
[[nodiscard]] core::Receiver<T> to_rate_limited_channel(runtime::Runtime& runtime,
                                                        core::Receiver<T> input,
                                                        Duration delay) {
    RateLimitOptions options;
    options.delay = delay;
    return to_rate_limited_channel(runtime.executor(), std::move(input), options);
}

/// Runs the worker on Runtime::global()
template <core::ChannelValue T>
[[nodiscard]] core::Receiver<T> to_rate_limited_channel(core::Receiver<T> input, Duration delay) {
    return to_rate_limited_channel(runtime::Runtime::global(), std::move(input), delay);
}

}  // namespace pacer::throttle
