#pragma once
// ============================================================================
// PACER - Logger
// ============================================================================
// Thin wrapper over spdlog: one named logger shared by every module
// Console sink always, rotating file sink and async mode on request
// ============================================================================

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace pacer::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
/// Throws std::invalid_argument for anything else.
[[nodiscard]] LogLevel parse_log_level(std::string_view name);

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
    LogLevel flush_level = LogLevel::Warn;

    // Async mode (spdlog thread pool)
    bool async = false;
    size_t queue_size = 8192;

    // File settings, empty path means console only
    std::string log_file;
    size_t max_file_size_mb = 100;
    size_t max_files = 10;
    bool rotate_on_open = false;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    /// Replace the global logger. Call before starting any worker.
    static void initialize(const LogConfig& config = LogConfig{});

    /// Flush, fall back to a console logger and release spdlog resources
    static void shutdown();

    /// Global instance. Logs to the console at Info until initialized.
    static Logger& instance();

    void set_level(LogLevel level);

    [[nodiscard]] LogLevel level() const;

    template <typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->trace(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->info(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->error(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }

    /// Flush all pending logs
    void flush();

    /// Underlying spdlog logger
    [[nodiscard]] std::shared_ptr<spdlog::logger> get() const;

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void replace(std::shared_ptr<spdlog::logger> logger);

    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define PACER_LOG_TRACE(...) ::pacer::utils::Logger::instance().trace(__VA_ARGS__)
#define PACER_LOG_DEBUG(...) ::pacer::utils::Logger::instance().debug(__VA_ARGS__)
#define PACER_LOG_INFO(...) ::pacer::utils::Logger::instance().info(__VA_ARGS__)
#define PACER_LOG_WARN(...) ::pacer::utils::Logger::instance().warn(__VA_ARGS__)
#define PACER_LOG_ERROR(...) ::pacer::utils::Logger::instance().error(__VA_ARGS__)
#define PACER_LOG_CRITICAL(...) ::pacer::utils::Logger::instance().critical(__VA_ARGS__)

}  // namespace pacer::utils
