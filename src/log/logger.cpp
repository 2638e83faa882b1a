#include "noexpp/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace noexpp {

namespace {

constexpr std::string_view RESET   = "\033[0m";
constexpr std::string_view GRAY    = "\033[90m";
constexpr std::string_view CYAN    = "\033[36m";
constexpr std::string_view GREEN   = "\033[32m";
constexpr std::string_view YELLOW  = "\033[33m";
constexpr std::string_view RED     = "\033[31m";
constexpr std::string_view MAGENTA = "\033[35m";
constexpr std::string_view BOLD    = "\033[1m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return GRAY;
        case LogLevel::Debug: return CYAN;
        case LogLevel::Info:  return GREEN;
        case LogLevel::Warn:  return YELLOW;
        case LogLevel::Error: return RED;
        case LogLevel::Fatal: return MAGENTA;
        case LogLevel::Off:   return RESET;
    }
    return RESET;
}

[[nodiscard]] std::string format_timestamp(
    const std::chrono::system_clock::time_point& tp
) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

[[nodiscard]] std::string_view extract_filename(const char* path) noexcept {
    std::string_view sv(path);
    const auto last_slash = sv.find_last_of('/');
    if (last_slash != std::string_view::npos) {
        return sv.substr(last_slash + 1);
    }
    return sv;
}

}  // namespace

std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal" || lowered == "critical") return LogLevel::Fatal;
    if (lowered == "off" || lowered == "none") return LogLevel::Off;
    return std::nullopt;
}

std::string format_context(const LogContext& context) {
    if (context.empty()) {
        return {};
    }
    std::string out = "[";
    if (context.connection != 0) {
        out += "conn " + std::to_string(context.connection);
    }
    if (context.request != 0) {
        if (context.connection != 0) {
            out += ' ';
        }
        out += "req " + std::to_string(context.request);
    }
    out += ']';
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger Implementation
// ─────────────────────────────────────────────────────────────────────────────
// 12:00:01.250 WARN  [conn 2 req 14] Request 14 (store.all) timed out  request_correlator.cpp:58

void ConsoleLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    const auto paint = [this](std::string_view code) {
        return colors_enabled_ ? code : std::string_view{};
    };

    std::ostringstream oss;
    oss << paint(GRAY) << format_timestamp(record.timestamp) << paint(RESET) << ' '
        << paint(BOLD) << paint(level_color(record.level))
        << std::setw(5) << std::left << to_string(record.level) << paint(RESET) << ' ';

    if (!record.context.empty()) {
        oss << paint(CYAN) << format_context(record.context) << paint(RESET) << ' ';
    }

    oss << record.message << "  "
        << paint(GRAY) << extract_filename(record.location.file_name()) << ':' << record.location.line()
        << paint(RESET) << '\n';

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << oss.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Singleton
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace noexpp
