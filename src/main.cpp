// ============================================================================
// PACER - Demo
// ============================================================================
// Drives one rate limited channel with a producer that never pauses.
//
//   [producer thread] --send--> [input] --> worker (runtime) --> [output]
//                                                                   │
//                                                          main thread prints
// ============================================================================

#include "pacer/config/config.hpp"
#include "pacer/core/channel.hpp"
#include "pacer/runtime/runtime.hpp"
#include "pacer/throttle/rate_limited_channel.hpp"
#include "pacer/utils/logger.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int) {
        g_running = false;
    }
}

using namespace pacer;

// ============================================================================
// Producer
// ============================================================================

struct ProducerReport {
    uint64_t written = 0;
    bool output_closed = false;
};

void run_producer(core::Sender<uint64_t> input, Duration duration, ProducerReport& report) {
    const TimePoint start = Clock::now();
    while (g_running && Clock::now() - start < duration) {
        if (input.send(report.written) != SendStatus::Sent) {
            report.output_closed = true;
            break;
        }
        ++report.written;
    }
    // `input` goes out of scope here, which closes the channel
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    std::string config_path = "config/pacer.yaml";
    if (argc > 1 && argv[1][0] != '-') {
        config_path = argv[1];
    }

    config::AppConfig config;
    try {
        config = config::load_config(config_path);
    } catch (const config::ConfigError& e) {
        PACER_LOG_ERROR("Config load failed: {}", e.what());
        PACER_LOG_WARN("Continuing with built-in defaults");
    }

    try {
        utils::Logger::initialize(config.logging);

        PACER_LOG_INFO("========================================");
        PACER_LOG_INFO("  PACER - rate limited channel demo");
        PACER_LOG_INFO("  Delay:    {} ms", to_ms(config.rate_limiter.delay));
        PACER_LOG_INFO("  Producer: {} ms", to_ms(config.producer.duration));
        PACER_LOG_INFO("  Threads:  {}", config.runtime.threads);
        PACER_LOG_INFO("========================================");

        std::signal(SIGINT, signal_handler);

        runtime::Runtime runtime(config.runtime);

        auto [input_tx, input_rx] = core::make_channel<uint64_t>(config.producer.input_capacity);
        auto output = throttle::to_rate_limited_channel(runtime.executor(), std::move(input_rx),
                                                        config.rate_limiter);

        ProducerReport report;
        std::thread producer(run_producer, std::move(input_tx), config.producer.duration,
                             std::ref(report));

        const TimePoint start = Clock::now();
        TimePoint previous = start;
        std::vector<uint64_t> values;

        for (auto result = output.recv(); result.is_received(); result = output.recv()) {
            const TimePoint now = Clock::now();
            PACER_LOG_INFO("[RECV] value={} at +{} ms (gap {} ms)",
                           *result.value, to_ms(now - start), to_ms(now - previous));
            values.push_back(*result.value);
            previous = now;
        }

        producer.join();

        PACER_LOG_INFO("Received {} values, wrote {}", values.size(), report.written);
        if (report.output_closed) {
            PACER_LOG_WARN("Producer stopped early: output closed");
        }

        runtime.stop();
        utils::Logger::shutdown();

    } catch (const std::exception& e) {
        PACER_LOG_CRITICAL("Unhandled exception: {}", e.what());
        return 1;
    }

    return 0;
}
