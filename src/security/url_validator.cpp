#include "noexpp/security/url_validator.hpp"

#include <ada.h>

#include <cctype>
#include <charconv>

namespace noexpp::security {

namespace detail {

bool parse_ipv4(std::string_view host, std::array<std::uint8_t, 4>& octets) {
    std::size_t pos = 0;

    for (int i = 0; i < 4; ++i) {
        if (pos >= host.size()) return false;

        std::size_t end = host.find('.', pos);
        if (i < 3 && end == std::string_view::npos) return false;
        if (i == 3 && end != std::string_view::npos) return false;
        if (i == 3) end = host.size();

        std::string_view octet = host.substr(pos, end - pos);
        if (octet.empty() || octet.size() > 3) return false;
        for (char c : octet) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }

        int value = 0;
        auto [ptr, ec] = std::from_chars(octet.data(), octet.data() + octet.size(), value);
        if (ec != std::errc{} || value > 255) return false;

        octets[i] = static_cast<std::uint8_t>(value);
        pos = end + 1;
    }

    return true;
}

bool is_localhost(std::string_view host) {
    if (host.starts_with('[') && host.ends_with(']')) {
        host = host.substr(1, host.size() - 2);
    }

    if (host == "localhost" || host == "localhost.localdomain") {
        return true;
    }
    if (host == "::1" || host == "0:0:0:0:0:0:0:1") {
        return true;
    }

    std::array<std::uint8_t, 4> octets{};
    if (parse_ipv4(host, octets)) {
        return octets[0] == 127;
    }
    return false;
}

}  // namespace detail

std::string WebSocketEndpoint::host_header() const {
    const bool default_port = (secure && port == "443") || (!secure && port == "80");
    const bool is_ipv6 = host.find(':') != std::string::npos;
    std::string header = is_ipv6 ? "[" + host + "]" : host;
    if (!default_port) {
        header += ":" + port;
    }
    return header;
}

tl::expected<WebSocketEndpoint, std::string> parse_websocket_url(
    std::string_view url,
    const EndpointValidationConfig& config
) {
    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return tl::unexpected(std::string("Invalid URL format"));
    }
    const auto& ada_url = *parsed;

    std::string scheme(ada_url.get_protocol());
    if (!scheme.empty() && scheme.back() == ':') {
        scheme.pop_back();
    }

    WebSocketEndpoint endpoint;
    if (scheme == "wss") {
        endpoint.secure = true;
    } else if (scheme == "ws") {
        if (config.require_tls) {
            return tl::unexpected(std::string("Plaintext ws:// URLs are not allowed"));
        }
    } else {
        return tl::unexpected("Unsupported scheme '" + scheme + "' (expected ws or wss)");
    }

    if (!ada_url.get_username().empty() || !ada_url.get_password().empty()) {
        return tl::unexpected(std::string("URLs with embedded credentials are not allowed"));
    }

    std::string host(ada_url.get_hostname());
    if (host.empty()) {
        return tl::unexpected(std::string("URL has no host"));
    }
    if (host.starts_with('[') && host.ends_with(']')) {
        host = host.substr(1, host.size() - 2);
    }
    endpoint.host = std::move(host);

    std::string port(ada_url.get_port());
    endpoint.port = port.empty() ? (endpoint.secure ? "443" : "80") : std::move(port);

    std::string target(ada_url.get_pathname());
    if (target.empty()) {
        target = "/";
    }
    target += std::string(ada_url.get_search());
    endpoint.target = std::move(target);
    endpoint.normalized_url = std::string(ada_url.get_href());

    if (!endpoint.secure && config.warn_plaintext_remote && !detail::is_localhost(endpoint.host)) {
        endpoint.warning = "Unencrypted ws:// connection to remote host " + endpoint.host;
    }

    return endpoint;
}

}  // namespace noexpp::security
