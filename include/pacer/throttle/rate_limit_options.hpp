#pragma once
// ============================================================================
// PACER - Rate Limiter Options
// ============================================================================

#include "pacer/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pacer::throttle {

struct RateLimitOptions {
    /// Minimum spacing between two forwarded values
    Duration delay = std::chrono::seconds{1};

    /// Values the consumer may fall behind before the worker waits
    size_t output_capacity = kRateLimitedCapacity;

    /// Shown in log lines only
    std::string name = "rate_limiter";
};

/// Throws std::invalid_argument on a negative delay or zero output capacity
void validate(const RateLimitOptions& options);

/// Counters reported by a worker when it exits
struct WorkerStats {
    uint64_t received = 0;
    uint64_t forwarded = 0;
    uint64_t coalesced = 0;  // replaced by a newer value before being sent
    uint64_t abandoned = 0;  // pending when the input closed
};

}  // namespace pacer::throttle
