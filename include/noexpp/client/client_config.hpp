#ifndef NOEXPP_CLIENT_CLIENT_CONFIG_HPP
#define NOEXPP_CLIENT_CLIENT_CONFIG_HPP

#include "noexpp/security/url_validator.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace noexpp {

// ─────────────────────────────────────────────────────────────────────────────
// Authentication
// ─────────────────────────────────────────────────────────────────────────────
// Replayed after every successful welcome when the server requires auth.
// A token is tried before credentials.

struct Credentials {
    std::string username;
    std::string password;
};

struct AuthConfig {
    std::optional<std::string> token;
    std::optional<Credentials> credentials;

    [[nodiscard]] static AuthConfig with_token(std::string token) {
        AuthConfig config;
        config.token = std::move(token);
        return config;
    }

    [[nodiscard]] static AuthConfig with_credentials(std::string username, std::string password) {
        AuthConfig config;
        config.credentials = Credentials{std::move(username), std::move(password)};
        return config;
    }

    [[nodiscard]] bool empty() const noexcept {
        return !token.has_value() && !credentials.has_value();
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Reconnection
// ─────────────────────────────────────────────────────────────────────────────
// delay(attempt) = min(initial_delay * multiplier^attempt, max_delay) + U(0, jitter)

struct ReconnectConfig {
    bool enabled{true};

    // Number of reconnect attempts before giving up. Unset = keep trying
    // until disconnect() is called.
    std::optional<std::size_t> max_retries;

    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30'000};
    double multiplier{2.0};
    std::chrono::milliseconds jitter{500};

    // Close codes after which the server must not be retried:
    // 1003 unsupported data, 4002 session revoked, 4003 too many connections.
    std::set<int> non_retryable_close_codes{1003, 4002, 4003};

    ReconnectConfig& with_enabled(bool value) {
        enabled = value;
        return *this;
    }

    ReconnectConfig& with_max_retries(std::optional<std::size_t> value) {
        max_retries = value;
        return *this;
    }

    ReconnectConfig& with_initial_delay(std::chrono::milliseconds value) {
        initial_delay = value;
        return *this;
    }

    ReconnectConfig& with_max_delay(std::chrono::milliseconds value) {
        max_delay = value;
        return *this;
    }

    ReconnectConfig& with_multiplier(double value) {
        multiplier = value;
        return *this;
    }

    ReconnectConfig& with_jitter(std::chrono::milliseconds value) {
        jitter = value;
        return *this;
    }

    ReconnectConfig& with_non_retryable_close_code(int code) {
        non_retryable_close_codes.insert(code);
        return *this;
    }

    ReconnectConfig& without_non_retryable_close_code(int code) {
        non_retryable_close_codes.erase(code);
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Client
// ─────────────────────────────────────────────────────────────────────────────

struct ClientConfig {
    // ws:// or wss:// endpoint of the server.
    std::string url;

    std::optional<AuthConfig> auth;
    ReconnectConfig reconnect;

    // Applied to every invoke() without an explicit timeout.
    std::chrono::milliseconds request_timeout{10'000};

    // Bound on transport open plus the welcome frame.
    std::chrono::milliseconds connect_timeout{5'000};

    // Answer server pings with pongs.
    bool heartbeat{true};

    // invoke() during an outage waits for the session instead of failing.
    bool queue_requests_while_reconnecting{true};

    // Reconnect even after the server revoked the session.
    bool reconnect_after_session_revoked{false};

    security::EndpointValidationConfig endpoint;

    ClientConfig& with_url(std::string value) {
        url = std::move(value);
        return *this;
    }

    ClientConfig& with_auth(AuthConfig value) {
        auth = std::move(value);
        return *this;
    }

    ClientConfig& with_reconnect(ReconnectConfig value) {
        reconnect = std::move(value);
        return *this;
    }

    ClientConfig& with_request_timeout(std::chrono::milliseconds value) {
        request_timeout = value;
        return *this;
    }

    ClientConfig& with_connect_timeout(std::chrono::milliseconds value) {
        connect_timeout = value;
        return *this;
    }

    ClientConfig& with_heartbeat(bool value) {
        heartbeat = value;
        return *this;
    }

    ClientConfig& with_queue_requests_while_reconnecting(bool value) {
        queue_requests_while_reconnecting = value;
        return *this;
    }

    ClientConfig& with_reconnect_after_session_revoked(bool value) {
        reconnect_after_session_revoked = value;
        return *this;
    }

    /// Check the configuration and resolve the endpoint.
    [[nodiscard]] tl::expected<security::WebSocketEndpoint, std::string> validate() const;
};

}  // namespace noexpp

#endif  // NOEXPP_CLIENT_CLIENT_CONFIG_HPP
