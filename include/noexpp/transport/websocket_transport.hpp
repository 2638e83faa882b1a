#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// One instance carries exactly one physical connection. The connection layer
// asks the factory for a fresh transport on every (re)connect and never
// reopens a transport that has been closed.
//
// All awaitables complete on the executor returned by get_executor(). A peer
// close surfaces from async_receive() as TransportError::Category::Closed
// with the peer's close code.

#include "noexpp/security/url_validator.hpp"
#include "noexpp/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <functional>
#include <memory>
#include <string>

namespace noexpp {

class IWebSocketTransport {
public:
    virtual ~IWebSocketTransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// TCP connect, optional TLS handshake and the HTTP upgrade
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_open(
        const security::WebSocketEndpoint& endpoint
    ) = 0;

    /// Send one text message
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(std::string text) = 0;

    /// Receive the next text message
    [[nodiscard]] virtual asio::awaitable<TransportResult<std::string>> async_receive() = 0;

    /// Close with a normal close frame. Safe to call more than once.
    [[nodiscard]] virtual asio::awaitable<void> async_close(std::string reason) = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/// Creates the transport for the next physical connection
using TransportFactory = std::function<std::unique_ptr<IWebSocketTransport>(asio::any_io_executor)>;

}  // namespace noexpp
