#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by the WebSocket transport and the connection layer.
//
// For the transport interface, use: #include "noexpp/transport/websocket_transport.hpp"
// For the Beast implementation, use: #include "noexpp/transport/beast_websocket_transport.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace noexpp {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category { Network, Timeout, Protocol, Closed };

    Category category{};
    std::string message;
    std::optional<int> close_code{};  ///< WebSocket close code, when the peer sent one

    [[nodiscard]] static TransportError network(std::string msg) {
        return {Category::Network, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError timeout(std::string msg) {
        return {Category::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError protocol(std::string msg) {
        return {Category::Protocol, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError closed(std::optional<int> code, std::string reason) {
        return {Category::Closed, std::move(reason), code};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "Network";
        case TransportError::Category::Timeout:  return "Timeout";
        case TransportError::Category::Protocol: return "Protocol";
        case TransportError::Category::Closed:   return "Closed";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace noexpp
