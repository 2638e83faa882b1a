#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace noexpp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Frame-level detail (every inbound/outbound frame)
    Debug = 1,  // Correlation and registry bookkeeping
    Info  = 2,  // Connection lifecycle
    Warn  = 3,  // Protocol errors, failed reconnect attempts
    Error = 4,  // Callback failures, exhausted retries
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
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

/// Parse a level name ("trace", "INFO", "warning", ...). Case-insensitive.
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Context - which connection and request a line is about
// ─────────────────────────────────────────────────────────────────────────────
// Connection generations and correlation ids both start at 1, so 0 means
// "not applicable".

struct LogContext {
    std::uint64_t connection{0};
    std::uint64_t request{0};

    [[nodiscard]] static LogContext for_connection(std::uint64_t generation) noexcept {
        return LogContext{generation, 0};
    }

    [[nodiscard]] static LogContext for_request(std::uint64_t generation, std::uint64_t id) noexcept {
        return LogContext{generation, id};
    }

    [[nodiscard]] bool empty() const noexcept { return connection == 0 && request == 0; }
};

/// "[conn 3 req 17]", "[conn 3]", "[req 17]" or "" for an empty context
[[nodiscard]] std::string format_context(const LogContext& context);

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    LogContext context;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        LogContext ctx = {},
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , context(ctx)
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, {}, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, {}, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, {}, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, {}, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, {}, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, {}, loc);
    }

    /// Entry point for lines tied to a connection or request
    void write(
        LogLevel level,
        std::string_view msg,
        LogContext context,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), context, loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs (default)
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - Outputs to stderr with colors
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept {
        min_level_ = level;
    }

    [[nodiscard]] LogLevel level() const noexcept {
        return min_level_;
    }

    void set_colors_enabled(bool enabled) noexcept {
        colors_enabled_ = enabled;
    }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Get the global logger instance (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Set a new global logger (takes ownership). nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// These check should_log() before evaluating arguments

#define NOEXPP_LOG_TRACE(msg) \
    do { if (::noexpp::get_logger().should_log(::noexpp::LogLevel::Trace)) \
         ::noexpp::get_logger().trace(msg); } while(false)

#define NOEXPP_LOG_DEBUG(msg) \
    do { if (::noexpp::get_logger().should_log(::noexpp::LogLevel::Debug)) \
         ::noexpp::get_logger().debug(msg); } while(false)

#define NOEXPP_LOG_INFO(msg) \
    do { if (::noexpp::get_logger().should_log(::noexpp::LogLevel::Info)) \
         ::noexpp::get_logger().info(msg); } while(false)

#define NOEXPP_LOG_WARN(msg) \
    do { if (::noexpp::get_logger().should_log(::noexpp::LogLevel::Warn)) \
         ::noexpp::get_logger().warn(msg); } while(false)

#define NOEXPP_LOG_ERROR(msg) \
    do { if (::noexpp::get_logger().should_log(::noexpp::LogLevel::Error)) \
         ::noexpp::get_logger().error(msg); } while(false)

#define NOEXPP_LOG_FATAL(msg) \
    do { if (::noexpp::get_logger().should_log(::noexpp::LogLevel::Fatal)) \
         ::noexpp::get_logger().fatal(msg); } while(false)

// NOEXPP_LOG_CTX(LogLevel::Warn, LogContext::for_request(gen, id), "...")
#define NOEXPP_LOG_CTX(level, context, msg) \
    do { if (::noexpp::get_logger().should_log(level)) \
         ::noexpp::get_logger().write(level, msg, context); } while(false)

}  // namespace noexpp
