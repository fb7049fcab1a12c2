#pragma once

#include "types.hpp"
#include "string.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace quarry {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : u8 {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// Accepts the names above in any case ("debug", "WARN", ...)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Source location (GCC 9 compatible)
// ============================================================================

struct SourceLocation {
    const char* file;
    int line;
    const char* function;

    static SourceLocation current(const char* file = __builtin_FILE(),
                                  int line = __builtin_LINE(),
                                  const char* func = __builtin_FUNCTION()) {
        return {file, line, func};
    }

    [[nodiscard]] const char* file_name() const { return file; }
    [[nodiscard]] int line_number() const { return line; }
};

// ============================================================================
// Log record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view logger_name;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Log sink interface
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Writes to stderr so that query output on stdout stays clean
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name);

    void trace(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void debug(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void info(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void warn(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void error(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void fatal(std::string_view msg, SourceLocation loc = SourceLocation::current());

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    // Per-logger threshold AND the global threshold must both admit the level
    [[nodiscard]] bool is_enabled(LogLevel level) const;

private:
    void log_impl(LogLevel level, std::string_view message, SourceLocation loc);

    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Global logging configuration
// ============================================================================

namespace logging {

// Initialize logging system with default console sink
void init();

// Initialize with custom sinks
void init(std::vector<std::unique_ptr<LogSink>> sinks);

void shutdown();

// Set global minimum level (default: Warn)
void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

// Get or create a named logger ("html", "css", ...)
[[nodiscard]] Logger& get(std::string_view name);

[[nodiscard]] Logger& default_logger();

void flush();

} // namespace logging

// ============================================================================
// Convenience macros
// ============================================================================

#define QUARRY_LOG_TRACE(msg) ::quarry::logging::default_logger().trace(msg)
#define QUARRY_LOG_DEBUG(msg) ::quarry::logging::default_logger().debug(msg)
#define QUARRY_LOG_INFO(msg)  ::quarry::logging::default_logger().info(msg)
#define QUARRY_LOG_WARN(msg)  ::quarry::logging::default_logger().warn(msg)
#define QUARRY_LOG_ERROR(msg) ::quarry::logging::default_logger().error(msg)
#define QUARRY_LOG_FATAL(msg) ::quarry::logging::default_logger().fatal(msg)

} // namespace quarry
