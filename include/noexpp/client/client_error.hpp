#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Single error type surfaced by every client operation. Server-originated
// failures keep the server's code, message and details untouched.

#include "noexpp/protocol/frame.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace noexpp {

enum class ClientErrorCode {
    Timeout,          ///< No response within the request timeout
    Disconnected,     ///< Connection lost or client disconnected while pending
    ServerError,      ///< Server answered with an error frame
    ProtocolError,    ///< Malformed or unexpected frame
    AuthError,        ///< Login was rejected or no credentials are configured
    Unauthorized,     ///< Operation requires an authenticated session
    InvalidArgument,  ///< Caller supplied an unusable argument
    ConnectFailed     ///< Could not open the connection or complete the handshake
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::Timeout:         return "Timeout";
        case ClientErrorCode::Disconnected:    return "Disconnected";
        case ClientErrorCode::ServerError:     return "ServerError";
        case ClientErrorCode::ProtocolError:   return "ProtocolError";
        case ClientErrorCode::AuthError:       return "AuthError";
        case ClientErrorCode::Unauthorized:    return "Unauthorized";
        case ClientErrorCode::InvalidArgument: return "InvalidArgument";
        case ClientErrorCode::ConnectFailed:   return "ConnectFailed";
        default:                               return "Unknown";
    }
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<protocol::ServerError> server_error;  ///< Set for ServerError and AuthError from the server

    /// Server-supplied code, or the client code name otherwise.
    [[nodiscard]] std::string code_name() const {
        if (server_error) {
            return server_error->code;
        }
        return std::string(to_string(code));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError timeout(std::string_view operation, std::chrono::milliseconds after) {
        return {
            ClientErrorCode::Timeout,
            "Request '" + std::string(operation) + "' timed out after " + std::to_string(after.count()) + "ms",
            std::nullopt
        };
    }

    [[nodiscard]] static ClientError disconnected(std::string msg = "Client disconnected") {
        return {ClientErrorCode::Disconnected, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError from_server(protocol::ServerError err) {
        std::string msg = err.message;
        return {ClientErrorCode::ServerError, std::move(msg), std::move(err)};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError auth_error(std::string msg) {
        return {ClientErrorCode::AuthError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError auth_error(protocol::ServerError err) {
        std::string msg = err.message;
        return {ClientErrorCode::AuthError, std::move(msg), std::move(err)};
    }

    [[nodiscard]] static ClientError unauthorized(std::string_view operation) {
        return {
            ClientErrorCode::Unauthorized,
            "Operation '" + std::string(operation) + "' requires an authenticated session",
            std::nullopt
        };
    }

    [[nodiscard]] static ClientError invalid_argument(std::string msg) {
        return {ClientErrorCode::InvalidArgument, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError connect_failed(std::string msg) {
        return {ClientErrorCode::ConnectFailed, std::move(msg), std::nullopt};
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace noexpp
