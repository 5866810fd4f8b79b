#pragma once
// ============================================================================
// PACER - Configuration
// ============================================================================
// YAML configuration for the logger, runtime and rate limiter
//
//   logging:
//     level: info            # trace|debug|info|warn|error|critical|off
//     pattern: "[%H:%M:%S.%e] [%l] %v"
//     file: ""               # empty: console only
//     async: false
//   runtime:
//     threads: 1
//   rate_limiter:
//     name: demo
//     delay_ms: 1000
//     output_capacity: 100
//   producer:
//     duration_ms: 5100
//     input_capacity: 1000   # 0: unbounded
//
// Every key is optional.
// ============================================================================

#include "pacer/core/types.hpp"
#include "pacer/runtime/runtime.hpp"
#include "pacer/throttle/rate_limit_options.hpp"
#include "pacer/utils/logger.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pacer::config {

/// Unreadable file, malformed YAML, wrong type or out-of-range value
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Synthetic producer driven by pacer_demo
struct ProducerConfig {
    Duration duration = std::chrono::milliseconds{5100};
    size_t input_capacity = 1000;
};

struct AppConfig {
    utils::LogConfig logging;
    runtime::RuntimeConfig runtime;
    throttle::RateLimitOptions rate_limiter;
    ProducerConfig producer;
};

/// Throws ConfigError
[[nodiscard]] AppConfig load_config(const std::string& path);

/// Throws ConfigError
[[nodiscard]] AppConfig parse_config(std::string_view yaml_text);

}  // namespace pacer::config
