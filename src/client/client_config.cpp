#include "noexpp/client/client_config.hpp"

namespace noexpp {

tl::expected<security::WebSocketEndpoint, std::string> ClientConfig::validate() const {
    if (request_timeout.count() <= 0) {
        return tl::unexpected(std::string("request_timeout must be positive"));
    }
    if (connect_timeout.count() <= 0) {
        return tl::unexpected(std::string("connect_timeout must be positive"));
    }
    if (reconnect.initial_delay.count() < 0 || reconnect.max_delay.count() < 0 || reconnect.jitter.count() < 0) {
        return tl::unexpected(std::string("reconnect delays must not be negative"));
    }
    if (reconnect.max_delay < reconnect.initial_delay) {
        return tl::unexpected(std::string("reconnect max_delay must not be below initial_delay"));
    }
    if (reconnect.multiplier < 1.0) {
        return tl::unexpected(std::string("reconnect multiplier must be at least 1.0"));
    }
    if (auth && auth->credentials && auth->credentials->username.empty()) {
        return tl::unexpected(std::string("credentials require a username"));
    }
    return security::parse_websocket_url(url, endpoint);
}

}  // namespace noexpp
