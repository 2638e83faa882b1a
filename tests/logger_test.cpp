#include <catch2/catch_test_macros.hpp>

#include "noexpp/log/logger.hpp"
#include "mocks/capture_logger.hpp"

#include <chrono>
#include <string>
#include <string_view>

using namespace noexpp;
using namespace noexpp::testing;

// ─────────────────────────────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("LogLevel names", "[log]") {
    CHECK(to_string(LogLevel::Trace) == "TRACE");
    CHECK(to_string(LogLevel::Info) == "INFO");
    CHECK(to_string(LogLevel::Fatal) == "FATAL");
    CHECK(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("log_level_from_string accepts any case and common aliases", "[log]") {
    CHECK(log_level_from_string("trace") == LogLevel::Trace);
    CHECK(log_level_from_string("DEBUG") == LogLevel::Debug);
    CHECK(log_level_from_string("Info") == LogLevel::Info);
    CHECK(log_level_from_string("warning") == LogLevel::Warn);
    CHECK(log_level_from_string("warn") == LogLevel::Warn);
    CHECK(log_level_from_string("error") == LogLevel::Error);
    CHECK(log_level_from_string("off") == LogLevel::Off);
    CHECK_FALSE(log_level_from_string("verbose").has_value());
    CHECK_FALSE(log_level_from_string("").has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Backends
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("NullLogger logs nothing", "[log]") {
    NullLogger logger;
    CHECK_FALSE(logger.should_log(LogLevel::Fatal));
    logger.error("dropped");
}

TEST_CASE("ConsoleLogger filters below its level", "[log]") {
    ConsoleLogger logger(LogLevel::Warn);
    CHECK_FALSE(logger.should_log(LogLevel::Info));
    CHECK(logger.should_log(LogLevel::Warn));

    logger.set_level(LogLevel::Off);
    CHECK(logger.level() == LogLevel::Off);
    CHECK_FALSE(logger.should_log(LogLevel::Fatal));
}

TEST_CASE("LogRecord carries call site and time", "[log]") {
    CaptureLogger logger;

    const auto before = std::chrono::system_clock::now();
    logger.warn("reconnect attempt 1 failed");
    const auto after = std::chrono::system_clock::now();

    auto records = logger.records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].level == LogLevel::Warn);
    CHECK(std::string_view(records[0].location.file_name()).find("logger_test") != std::string_view::npos);
    CHECK(records[0].timestamp >= before);
    CHECK(records[0].timestamp <= after);
}

// ─────────────────────────────────────────────────────────────────────────────
// Context
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("format_context names the connection and request", "[log]") {
    CHECK(format_context(LogContext{}).empty());
    CHECK(format_context(LogContext::for_connection(3)) == "[conn 3]");
    CHECK(format_context(LogContext::for_request(3, 17)) == "[conn 3 req 17]");
    CHECK(format_context(LogContext::for_request(0, 5)) == "[req 5]");
}

TEST_CASE("write attaches the context to the record", "[log]") {
    CaptureLogger logger(LogLevel::Info);

    logger.write(LogLevel::Debug, "filtered", LogContext::for_connection(1));
    logger.write(LogLevel::Warn, "Request 9 timed out", LogContext::for_request(2, 9));

    auto records = logger.records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].context.connection == 2);
    CHECK(records[0].context.request == 9);
    CHECK(std::string_view(records[0].location.file_name()).find("logger_test") != std::string_view::npos);
}

// ─────────────────────────────────────────────────────────────────────────────
// Global logger and macros
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Global logger defaults to NullLogger", "[log]") {
    set_logger(nullptr);
    CHECK_FALSE(get_logger().should_log(LogLevel::Fatal));
}

TEST_CASE("NOEXPP_LOG macros respect the installed level", "[log]") {
    ScopedCaptureLogger capture(LogLevel::Info);

    NOEXPP_LOG_TRACE("frame in");
    NOEXPP_LOG_DEBUG("request 1 registered");
    NOEXPP_LOG_INFO("Connection state: connecting -> connected");
    NOEXPP_LOG_WARN("Malformed frame");
    NOEXPP_LOG_ERROR("callback threw");

    auto records = capture->records();
    REQUIRE(records.size() == 3);
    CHECK(records[0].level == LogLevel::Info);
    CHECK(records[2].message == "callback threw");
}

TEST_CASE("NOEXPP_LOG macros skip argument evaluation when filtered", "[log]") {
    ScopedCaptureLogger capture(LogLevel::Error);
    int evaluated = 0;
    auto expensive = [&]() {
        ++evaluated;
        return std::string("detail");
    };

    NOEXPP_LOG_DEBUG(expensive());
    CHECK(evaluated == 0);

    NOEXPP_LOG_ERROR(expensive());
    CHECK(evaluated == 1);

    NOEXPP_LOG_CTX(LogLevel::Info, LogContext::for_connection(4), expensive());
    CHECK(evaluated == 1);
}

TEST_CASE("NOEXPP_LOG_CTX carries the context through the global logger", "[log]") {
    ScopedCaptureLogger capture(LogLevel::Debug);

    NOEXPP_LOG_CTX(LogLevel::Debug, LogContext::for_request(5, 42), "Sending request 42 (store.all)");

    auto records = capture->records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].context.request == 42);
    CHECK(records[0].message == "Sending request 42 (store.all)");
}
