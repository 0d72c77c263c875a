/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Logger - Component-tagged logging with spdlog
 *
 * Provides:
 * - Levelled logging (trace through critical) tagged with a component name
 * - Access log: client, request line, status, response size, latency
 * - Console and rotating file sinks
 * - Level configurable at runtime
 */

#ifndef PORTICO_UTIL_LOGGER_HPP
#define PORTICO_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace portico::util {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for stdout only
    std::size_t max_file_size_mb{100}; // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};         // Log to stdout
    bool enable_colors{true};          // Colored console output
    bool access_log{true};             // One line per completed request
};

/**
 * Access log entry for one request/response exchange
 */
struct AccessLogEntry {
    std::string client;       // PeerInfo::to_string()
    std::string method;
    std::string target;
    std::string protocol;     // "HTTP/1.1"
    int status_code{0};
    std::uint64_t response_size{0};
    std::chrono::microseconds latency{0};
};

/**
 * Logger class - centralized logging with component tagging
 *
 * Thread-safe singleton that manages application-wide logging.
 * init() may be called again to reconfigure the sinks.
 */
class Logger {
public:
    /**
     * Initialize (or reconfigure) the logger
     */
    static void init(const LogConfig& config);

    /**
     * Initialize with default configuration (stdout, INFO level)
     */
    static void init_default();

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * Parse log level from string (case-insensitive)
     * Valid values: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    static std::string_view level_to_string(LogLevel level);

    /**
     * Send every record, access entries included, to an extra sink as well
     */
    void attach_sink(spdlog::sink_ptr sink);

    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Log an access entry (no-op when the access log is disabled)
     */
    void access(const AccessLogEntry& entry);

    /**
     * Format an access entry as written to the log
     */
    static std::string format_access(const AccessLogEntry& entry);

    /**
     * Flush all logs
     */
    void shutdown();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    template<typename... Args>
    void log(LogLevel level, std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        std::shared_ptr<spdlog::logger> logger;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            logger = logger_;
        }
        if (!logger || !logger->should_log(to_spdlog_level(level))) return;

        auto msg = fmt::format(fmt, std::forward<Args>(args)...);
        logger->log(to_spdlog_level(level), "[{}] {}", component, msg);
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> access_logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    std::atomic<bool> access_enabled_{true};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

// Convenience macros for logging with automatic component tagging
#define PORTICO_LOG_TRACE(component, ...) \
    ::portico::util::Logger::instance().trace(component, __VA_ARGS__)
#define PORTICO_LOG_DEBUG(component, ...) \
    ::portico::util::Logger::instance().debug(component, __VA_ARGS__)
#define PORTICO_LOG_INFO(component, ...) \
    ::portico::util::Logger::instance().info(component, __VA_ARGS__)
#define PORTICO_LOG_WARN(component, ...) \
    ::portico::util::Logger::instance().warn(component, __VA_ARGS__)
#define PORTICO_LOG_ERROR(component, ...) \
    ::portico::util::Logger::instance().error(component, __VA_ARGS__)
#define PORTICO_LOG_CRITICAL(component, ...) \
    ::portico::util::Logger::instance().critical(component, __VA_ARGS__)

// Component constants
namespace log_component {
    constexpr std::string_view Server = "server";
    constexpr std::string_view Config = "config";
    constexpr std::string_view Listener = "listener";
    constexpr std::string_view Pool = "pool";
    constexpr std::string_view Connection = "connection";
    constexpr std::string_view TLS = "tls";
    constexpr std::string_view Gateway = "gateway";
}

} // namespace portico::util

#endif // PORTICO_UTIL_LOGGER_HPP
