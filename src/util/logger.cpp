/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace portico::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

namespace {

LogConfig default_config() {
    LogConfig config;
    config.level = LogLevel::Info;
    config.enable_console = true;
    config.enable_colors = true;
    return config;
}

} // anonymous namespace

void Logger::init(const LogConfig& config) {
    bool created = false;
    std::call_once(init_flag_, [&config, &created]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
        created = true;
    });
    if (!created) {
        instance_->configure(config);
    }
}

void Logger::init_default() {
    init(default_config());
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(default_config());
    });
    return *instance_;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.enable_colors) {
            console_sink->set_color_mode(spdlog::color_mode::never);
        }
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    // Replacing a registered logger requires dropping the old one first
    spdlog::drop("portico");
    spdlog::drop("access");

    logger_ = std::make_shared<spdlog::logger>("portico", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog_level(config.level));
    logger_->flush_on(spdlog::level::warn);

    access_logger_ = std::make_shared<spdlog::logger>("access", sinks.begin(), sinks.end());
    access_logger_->set_level(spdlog::level::info);
    access_logger_->flush_on(spdlog::level::info);

    current_level_.store(config.level, std::memory_order_relaxed);
    access_enabled_.store(config.access_log, std::memory_order_relaxed);

    spdlog::register_logger(logger_);
    spdlog::register_logger(access_logger_);
}

void Logger::attach_sink(spdlog::sink_ptr sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->sinks().push_back(sink);
    }
    if (access_logger_) {
        access_logger_->sinks().push_back(sink);
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
    current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return current_level_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(std::string_view level_str) {
    std::string lower;
    lower.reserve(level_str.size());
    for (char c : level_str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error" || lower == "err") return LogLevel::Error;
    if (lower == "critical" || lower == "crit" || lower == "fatal") return LogLevel::Critical;
    if (lower == "off" || lower == "none") return LogLevel::Off;

    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warn:     return "warn";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
        default:                 return "unknown";
    }
}

std::string Logger::format_access(const AccessLogEntry& entry) {
    // 127.0.0.1:51234 "GET /index?x=1 HTTP/1.1" 200 1234 0.412ms
    return fmt::format(
        R"({} "{} {} {}" {} {} {:.3f}ms)",
        entry.client.empty() ? "-" : entry.client,
        entry.method.empty() ? "-" : entry.method,
        entry.target.empty() ? "-" : entry.target,
        entry.protocol.empty() ? "-" : entry.protocol,
        entry.status_code,
        entry.response_size,
        static_cast<double>(entry.latency.count()) / 1000.0
    );
}

void Logger::access(const AccessLogEntry& entry) {
    if (!access_enabled_.load(std::memory_order_relaxed)) return;

    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logger = access_logger_;
    }
    if (!logger) return;

    logger->info(format_access(entry));
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
    if (access_logger_) {
        access_logger_->flush();
    }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

} // namespace portico::util
