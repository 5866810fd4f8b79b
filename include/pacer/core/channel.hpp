#pragma once
// ============================================================================
// PACER - MPSC Channel
// ============================================================================
// Multi-producer, single-consumer queue with handle-based lifetime:
// - Sender<T> is copyable, the channel closes when the last copy goes away
// - Receiver<T> is move-only, sends fail once it is closed or destroyed
// - Every operation has a blocking form and an awaitable (Boost.Asio) form
// ============================================================================

#include "pacer/core/signal.hpp"
#include "pacer/core/types.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <concepts>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace pacer::core {

// ============================================================================
// Concept for Channel Elements
// ============================================================================

template <typename T>
concept ChannelValue = std::movable<T> && std::destructible<T>;

namespace detail {

// ============================================================================
// Shared Channel State
// ============================================================================
// Methods with the _locked suffix expect `mutex` to be held.

template <ChannelValue T>
struct ChannelState {
    explicit ChannelState(size_t cap) : capacity(cap) {}

    std::mutex mutex;
    std::condition_variable readable;  // blocking receiver
    std::condition_variable writable;  // blocking senders
    std::deque<T> buffer;

    const size_t capacity;
    size_t senders = 1;
    bool receiver_open = true;

    // Async waiters, registered only while suspended
    std::shared_ptr<Signal> reader_waiter;
    std::vector<std::shared_ptr<Signal>> writer_waiters;

    [[nodiscard]] bool full_locked() const noexcept {
        return capacity != kUnbounded && buffer.size() >= capacity;
    }

    /// Received or Closed, nullopt when the caller has to wait
    [[nodiscard]] std::optional<RecvResult<T>> poll_recv_locked() {
        if (!buffer.empty()) {
            T value = std::move(buffer.front());
            buffer.pop_front();
            wake_writers_locked();
            return RecvResult<T>::received(std::move(value));
        }
        if (senders == 0) {
            return RecvResult<T>::closed();
        }
        return std::nullopt;
    }

    /// Sent or Closed, nullopt (value untouched) when the buffer is full
    [[nodiscard]] std::optional<SendStatus> poll_send_locked(T& value) {
        if (!receiver_open) {
            return SendStatus::Closed;
        }
        if (full_locked()) {
            return std::nullopt;
        }
        buffer.push_back(std::move(value));
        wake_reader_locked();
        return SendStatus::Sent;
    }

    void wake_reader_locked() {
        readable.notify_one();
        if (reader_waiter) {
            reader_waiter->notify();
            reader_waiter.reset();
        }
    }

    void wake_writers_locked() {
        if (capacity == kUnbounded) {
            return;  // writers never wait for room
        }
        writable.notify_all();
        for (auto& waiter : writer_waiters) {
            waiter->notify();
        }
        writer_waiters.clear();
    }

    void add_sender() {
        std::lock_guard lock(mutex);
        ++senders;
    }

    void release_sender(const std::shared_ptr<Signal>& signal) {
        std::lock_guard lock(mutex);
        if (signal) {
            std::erase(writer_waiters, signal);
        }
        if (--senders == 0) {
            readable.notify_all();
            if (reader_waiter) {
                reader_waiter->notify();
                reader_waiter.reset();
            }
        }
    }

    void close_receiver() {
        std::deque<T> dropped;  // destroyed outside the lock
        std::lock_guard lock(mutex);
        if (!receiver_open) {
            return;
        }
        receiver_open = false;
        dropped.swap(buffer);
        reader_waiter.reset();

        writable.notify_all();
        for (auto& waiter : writer_waiters) {
            waiter->notify();
        }
        writer_waiters.clear();
    }
};

}  // namespace detail

// ============================================================================
// Sender (producer handle)
// ============================================================================

template <ChannelValue T>
class Sender {
public:
    using State = detail::ChannelState<T>;

    Sender() = default;

    /// Adopts one producer reference already counted in `state`.
    explicit Sender(std::shared_ptr<State> state) noexcept : state_(std::move(state)) {}

    ~Sender() { close(); }

    Sender(const Sender& other) : state_(other.state_) {
        if (state_) {
            state_->add_sender();
        }
    }

    Sender& operator=(const Sender& other) {
        if (this != &other) {
            Sender copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Sender(Sender&& other) noexcept
        : state_(std::move(other.state_)), signal_(std::move(other.signal_)) {}

    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
            signal_ = std::move(other.signal_);
        }
        return *this;
    }

    /// Block while the channel is full. Closed if the receiver is gone.
    SendStatus send(T value) {
        if (!state_) {
            return SendStatus::Closed;
        }
        std::unique_lock lock(state_->mutex);
        for (;;) {
            if (auto status = state_->poll_send_locked(value)) {
                return *status;
            }
            state_->writable.wait(lock);
        }
    }

    /// Never blocks. The value is dropped unless Sent is returned.
    SendStatus try_send(T value) {
        if (!state_) {
            return SendStatus::Closed;
        }
        std::lock_guard lock(state_->mutex);
        if (auto status = state_->poll_send_locked(value)) {
            return *status;
        }
        return SendStatus::Full;
    }

    /// Suspend while the channel is full. Closed if the receiver is gone.
    boost::asio::awaitable<SendStatus> async_send(T value) {
        if (!state_) {
            co_return SendStatus::Closed;
        }
        if (!signal_) {
            auto executor = co_await boost::asio::this_coro::executor;
            signal_ = std::make_shared<Signal>(executor);
        }

        for (;;) {
            std::optional<SendStatus> status;
            {
                std::lock_guard lock(state_->mutex);
                status = state_->poll_send_locked(value);
                if (!status &&
                    std::find(state_->writer_waiters.begin(), state_->writer_waiters.end(), signal_) ==
                        state_->writer_waiters.end()) {
                    state_->writer_waiters.push_back(signal_);
                }
            }
            if (status) {
                co_return *status;
            }
            co_await signal_->wait_until(TimePoint::max());
        }
    }

    /// Release this producer handle. The channel closes with the last one.
    void close() {
        if (state_) {
            state_->release_sender(signal_);
            state_.reset();
        }
    }

    /// True when nothing can be delivered any more
    [[nodiscard]] bool is_closed() const {
        if (!state_) {
            return true;
        }
        std::lock_guard lock(state_->mutex);
        return !state_->receiver_open;
    }

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

private:
    std::shared_ptr<State> state_;
    std::shared_ptr<Signal> signal_;
};

// ============================================================================
// Receiver (consumer handle)
// ============================================================================

template <ChannelValue T>
class Receiver {
public:
    using State = detail::ChannelState<T>;

    Receiver() = default;

    explicit Receiver(std::shared_ptr<State> state) noexcept : state_(std::move(state)) {}

    ~Receiver() { close(); }

    // Non-copyable, single consumer
    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    Receiver(Receiver&& other) noexcept
        : state_(std::move(other.state_)), signal_(std::move(other.signal_)) {}

    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
            signal_ = std::move(other.signal_);
        }
        return *this;
    }

    /// Block until a value arrives or every sender is gone
    [[nodiscard]] RecvResult<T> recv() { return recv_until(TimePoint::max()); }

    [[nodiscard]] RecvResult<T> recv_for(Duration timeout) {
        return recv_until(Clock::now() + timeout);
    }

    [[nodiscard]] RecvResult<T> recv_until(TimePoint deadline) {
        if (!state_) {
            return RecvResult<T>::closed();
        }
        std::unique_lock lock(state_->mutex);
        for (;;) {
            if (auto result = state_->poll_recv_locked()) {
                return std::move(*result);
            }
            if (deadline == TimePoint::max()) {
                state_->readable.wait(lock);
            } else if (state_->readable.wait_until(lock, deadline) == std::cv_status::timeout) {
                if (auto result = state_->poll_recv_locked()) {
                    return std::move(*result);
                }
                return RecvResult<T>::timed_out();
            }
        }
    }

    /// Never blocks. Empty when nothing is buffered yet.
    [[nodiscard]] RecvResult<T> try_recv() {
        if (!state_) {
            return RecvResult<T>::closed();
        }
        std::lock_guard lock(state_->mutex);
        if (auto result = state_->poll_recv_locked()) {
            return std::move(*result);
        }
        return RecvResult<T>::empty();
    }

    boost::asio::awaitable<RecvResult<T>> async_recv() {
        return async_recv_until(TimePoint::max());
    }

    /// Suspend until a value arrives, every sender is gone or the deadline
    /// passes. All async receives of one Receiver must run on one executor.
    boost::asio::awaitable<RecvResult<T>> async_recv_until(TimePoint deadline) {
        if (!state_) {
            co_return RecvResult<T>::closed();
        }
        if (!signal_) {
            auto executor = co_await boost::asio::this_coro::executor;
            signal_ = std::make_shared<Signal>(executor);
        }

        for (;;) {
            std::optional<RecvResult<T>> result;
            {
                std::lock_guard lock(state_->mutex);
                result = state_->poll_recv_locked();
                if (!result && Clock::now() >= deadline) {
                    result = RecvResult<T>::timed_out();
                }
                if (result) {
                    state_->reader_waiter.reset();
                } else {
                    state_->reader_waiter = signal_;
                }
            }
            if (result) {
                co_return std::move(*result);
            }
            co_await signal_->wait_until(deadline);
        }
    }

    /// Stop consuming. Buffered values are dropped, senders see Closed.
    void close() {
        if (state_) {
            state_->close_receiver();
            state_.reset();
        }
    }

    /// True once no further value can ever be received
    [[nodiscard]] bool is_closed() const {
        if (!state_) {
            return true;
        }
        std::lock_guard lock(state_->mutex);
        return state_->senders == 0 && state_->buffer.empty();
    }

    /// Values currently buffered
    [[nodiscard]] size_t size() const {
        if (!state_) {
            return 0;
        }
        std::lock_guard lock(state_->mutex);
        return state_->buffer.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return state_ ? state_->capacity : 0; }

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

private:
    std::shared_ptr<State> state_;
    std::shared_ptr<Signal> signal_;
};

// ============================================================================
// Factory
// ============================================================================

/// Create a channel. capacity == kUnbounded means no limit.
template <ChannelValue T>
[[nodiscard]] std::pair<Sender<T>, Receiver<T>> make_channel(size_t capacity = kUnbounded) {
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    return {Sender<T>{state}, Receiver<T>{state}};
}

}  // namespace pacer::core
