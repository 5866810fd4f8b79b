// ============================================================================
// PACER - Rate Limited Channel (non-template parts)
// ============================================================================

#include "pacer/throttle/rate_limited_channel.hpp"

#include "pacer/utils/logger.hpp"

#include <stdexcept>

namespace pacer::throttle {

void validate(const RateLimitOptions& options) {
    if (options.delay < Duration::zero()) {
        throw std::invalid_argument("rate limiter '" + options.name + "': delay must not be negative");
    }
    if (options.output_capacity == 0) {
        throw std::invalid_argument("rate limiter '" + options.name +
                                    "': output capacity must be at least 1");
    }
}

namespace detail {

void log_worker_start(const std::string& name, Duration delay) {
    PACER_LOG_DEBUG("[{}] worker started, delay {} ms", name, to_ms(delay));
}

void log_worker_exit(const std::string& name, std::string_view reason, const WorkerStats& stats) {
    PACER_LOG_DEBUG("[{}] worker exiting ({}): received={} forwarded={} coalesced={} abandoned={}",
                    name, reason, stats.received, stats.forwarded, stats.coalesced,
                    stats.abandoned);
}

void log_worker_failure(const std::string& name, std::exception_ptr error) {
    if (!error) {
        return;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        PACER_LOG_ERROR("[{}] worker failed: {}", name, e.what());
    }
}

}  // namespace detail

}  // namespace pacer::throttle
