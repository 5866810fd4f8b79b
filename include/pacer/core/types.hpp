#pragma once
// ============================================================================
// PACER - Core Types
// ============================================================================
// Clock, duration and channel outcome types shared by every module
// ============================================================================

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace pacer {

// ============================================================================
// Time Types
// ============================================================================

/// Monotonic clock used for every throttle window
using Clock = std::chrono::steady_clock;

using TimePoint = Clock::time_point;

using Duration = Clock::duration;

/// Whole milliseconds of a duration, for logging
[[nodiscard]] inline long long to_ms(Duration d) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

// ============================================================================
// Constants
// ============================================================================

/// Channel capacity meaning "no limit"
inline constexpr size_t kUnbounded = 0;

/// Default capacity of the output channel of a rate limiter
inline constexpr size_t kRateLimitedCapacity = 100;

// ============================================================================
// Channel Outcomes
// ============================================================================

enum class RecvStatus {
    Received,
    Closed,    // every sender is gone and the buffer is drained
    TimedOut,  // deadline reached before a value arrived
    Empty      // non-blocking receive found nothing
};

enum class SendStatus {
    Sent,
    Closed,  // receiver is gone, value dropped
    Full     // non-blocking send found no room, value dropped
};

[[nodiscard]] constexpr std::string_view to_string(RecvStatus status) noexcept {
    switch (status) {
        case RecvStatus::Received: return "received";
        case RecvStatus::Closed: return "closed";
        case RecvStatus::TimedOut: return "timed_out";
        case RecvStatus::Empty: return "empty";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(SendStatus status) noexcept {
    switch (status) {
        case SendStatus::Sent: return "sent";
        case SendStatus::Closed: return "closed";
        case SendStatus::Full: return "full";
    }
    return "unknown";
}

/// Tagged result of a receive. Holds a value only when status is Received.
template <typename T>
struct RecvResult {
    RecvStatus status = RecvStatus::Closed;
    std::optional<T> value;

    [[nodiscard]] static RecvResult received(T v) {
        return RecvResult{RecvStatus::Received, std::optional<T>{std::move(v)}};
    }
    [[nodiscard]] static RecvResult closed() { return RecvResult{RecvStatus::Closed, std::nullopt}; }
    [[nodiscard]] static RecvResult timed_out() { return RecvResult{RecvStatus::TimedOut, std::nullopt}; }
    [[nodiscard]] static RecvResult empty() { return RecvResult{RecvStatus::Empty, std::nullopt}; }

    [[nodiscard]] bool is_received() const noexcept { return status == RecvStatus::Received; }
    [[nodiscard]] bool is_closed() const noexcept { return status == RecvStatus::Closed; }

    explicit operator bool() const noexcept { return is_received(); }
};

}  // namespace pacer
