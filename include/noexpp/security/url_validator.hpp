#ifndef NOEXPP_SECURITY_URL_VALIDATOR_HPP
#define NOEXPP_SECURITY_URL_VALIDATOR_HPP

#include <tl/expected.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace noexpp::security {

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Endpoint Validation
// ═══════════════════════════════════════════════════════════════════════════
// Parses a ws:// or wss:// URL (via ada) into the pieces the transport needs
// for the TCP connect, TLS SNI and the HTTP upgrade request.

struct EndpointValidationConfig {
    bool require_tls = false;          // Reject ws:// entirely
    bool warn_plaintext_remote = true; // Warn on ws:// to a non-loopback host
};

struct WebSocketEndpoint {
    bool secure{false};                // wss://
    std::string host;                  // Hostname or IP, brackets stripped
    std::string port;                  // Explicit port or scheme default
    std::string target;                // Path plus query, at least "/"
    std::string normalized_url;
    std::optional<std::string> warning;

    /// Value for the HTTP Host header (omits default ports)
    [[nodiscard]] std::string host_header() const;
};

[[nodiscard]] tl::expected<WebSocketEndpoint, std::string> parse_websocket_url(
    std::string_view url,
    const EndpointValidationConfig& config = {}
);

namespace detail {

[[nodiscard]] bool is_localhost(std::string_view host);

[[nodiscard]] bool parse_ipv4(std::string_view host, std::array<std::uint8_t, 4>& octets);

}  // namespace detail

}  // namespace noexpp::security

#endif  // NOEXPP_SECURITY_URL_VALIDATOR_HPP
