#include "quarry/core/logger.hpp"
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace quarry {

// ============================================================================
// Global state
// ============================================================================

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    std::unique_ptr<Logger> default_logger;
    std::atomic<LogLevel> global_level{LogLevel::Warn};
    bool initialized{false};
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_buf);

    char result[64];
    std::snprintf(result, sizeof(result), "%s.%03d", buffer, static_cast<int>(ms.count()));
    return result;
}

void flush_locked(LoggingState& s) {
    for (auto& sink : s.sinks) {
        sink->flush();
    }
}

} // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    String lowered = String(name).to_lowercase();
    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal") return LogLevel::Fatal;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// ConsoleSink implementation
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    const char* color_start = "";
    const char* color_end = "";

    if (m_use_colors) {
        switch (record.level) {
            case LogLevel::Trace: color_start = "\033[90m"; break;  // Gray
            case LogLevel::Debug: color_start = "\033[36m"; break;  // Cyan
            case LogLevel::Info:  color_start = "\033[32m"; break;  // Green
            case LogLevel::Warn:  color_start = "\033[33m"; break;  // Yellow
            case LogLevel::Error: color_start = "\033[31m"; break;  // Red
            case LogLevel::Fatal: color_start = "\033[35m"; break;  // Magenta
            default: break;
        }
        color_end = "\033[0m";
    }

    // Format: [timestamp] [LEVEL] [logger] message (file:line)
    std::cerr << "[" << format_timestamp(record.timestamp) << "] "
              << color_start << "[" << log_level_name(record.level) << "]" << color_end << " ";

    if (!record.logger_name.empty()) {
        std::cerr << "[" << record.logger_name << "] ";
    }

    std::cerr << record.message;

    if (record.level <= LogLevel::Debug) {
        std::cerr << " (" << record.location.file_name()
                  << ":" << record.location.line_number() << ")";
    }

    std::cerr << "\n";
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// Logger implementation
// ============================================================================

Logger::Logger(std::string_view name) : m_name(name) {}

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= m_level && level >= logging::level();
}

void Logger::trace(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Trace, msg, loc);
}

void Logger::debug(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Debug, msg, loc);
}

void Logger::info(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Info, msg, loc);
}

void Logger::warn(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Warn, msg, loc);
}

void Logger::error(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Error, msg, loc);
}

void Logger::fatal(std::string_view msg, SourceLocation loc) {
    log_impl(LogLevel::Fatal, msg, loc);
}

void Logger::log_impl(LogLevel level, std::string_view message, SourceLocation loc) {
    if (!is_enabled(level)) return;

    auto& s = state();
    std::lock_guard lock(s.mutex);

    LogRecord record{
        .level = level,
        .message = message,
        .logger_name = m_name,
        .location = loc,
        .timestamp = std::chrono::system_clock::now()
    };

    for (auto& sink : s.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// Global logging functions
// ============================================================================

namespace logging {

void init() {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    if (s.initialized) return;

    s.sinks.push_back(std::make_unique<ConsoleSink>());
    if (!s.default_logger) {
        s.default_logger = std::make_unique<Logger>("quarry");
    }
    s.initialized = true;
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    if (s.initialized) return;

    s.sinks = std::move(sinks);
    if (!s.default_logger) {
        s.default_logger = std::make_unique<Logger>("quarry");
    }
    s.initialized = true;
}

void shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    flush_locked(s);
    s.sinks.clear();
    s.initialized = false;
}

void set_level(LogLevel level) {
    state().global_level.store(level, std::memory_order_relaxed);
}

LogLevel level() {
    return state().global_level.load(std::memory_order_relaxed);
}

Logger& get(std::string_view name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    std::string name_str(name);
    auto it = s.loggers.find(name_str);
    if (it != s.loggers.end()) {
        return *it->second;
    }

    auto logger = std::make_unique<Logger>(name);
    auto& ref = *logger;
    s.loggers.emplace(std::move(name_str), std::move(logger));
    return ref;
}

Logger& default_logger() {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    if (!s.default_logger) {
        s.default_logger = std::make_unique<Logger>("quarry");
    }
    return *s.default_logger;
}

void flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    flush_locked(s);
}

} // namespace logging

} // namespace quarry
