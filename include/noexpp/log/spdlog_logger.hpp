#pragma once

#include "noexpp/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace noexpp {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Loggers created here are not registered in spdlog's global registry, so
// several clients in one process never collide on a logger name.

class SpdlogLogger final : public ILogger {
public:
    /// Console sink (stdout, colored)
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Multiple sinks
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

    void set_pattern(const std::string& pattern);

    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Console and file at once (the CLI uses this with --log-file)
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Non-blocking console logger on spdlog's background thread pool
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level = LogLevel::Info,
    std::size_t queue_size = 8192,
    std::size_t thread_count = 1
);

}  // namespace noexpp
