// ============================================================================
// PACER - Logger Implementation
// ============================================================================

#include "pacer/utils/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace pacer::utils {

namespace {

constexpr const char* kLoggerName = "pacer";

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel from_spdlog(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace: return LogLevel::Trace;
        case spdlog::level::debug: return LogLevel::Debug;
        case spdlog::level::info: return LogLevel::Info;
        case spdlog::level::warn: return LogLevel::Warn;
        case spdlog::level::err: return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        default: return LogLevel::Off;
    }
}

std::shared_ptr<spdlog::logger> make_console_logger() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    logger->set_level(spdlog::level::info);
    return logger;
}

}  // namespace

// ============================================================================
// Level Names
// ============================================================================

LogLevel parse_log_level(std::string_view name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    throw std::invalid_argument("unknown log level: " + std::string(name));
}

std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "off";
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() : logger_(make_console_logger()) {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::initialize(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files,
            config.rotate_on_open));
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            kLoggerName, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(to_spdlog(config.flush_level));

    instance().replace(std::move(logger));
}

void Logger::shutdown() {
    auto& self = instance();
    self.flush();
    self.replace(make_console_logger());
    spdlog::shutdown();
}

void Logger::set_level(LogLevel level) {
    get()->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    return from_spdlog(get()->level());
}

void Logger::flush() {
    get()->flush();
}

std::shared_ptr<spdlog::logger> Logger::get() const {
    std::lock_guard lock(mutex_);
    return logger_;
}

void Logger::replace(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard lock(mutex_);
    logger_ = std::move(logger);
}

}  // namespace pacer::utils
