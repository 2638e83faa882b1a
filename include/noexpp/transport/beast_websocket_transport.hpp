#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Beast WebSocket Transport
// ═══════════════════════════════════════════════════════════════════════════
// IWebSocketTransport over Boost.Beast, for ws:// and wss:// (OpenSSL).
//
// Beast runs on Boost.Asio, the client on standalone Asio, so each transport
// owns a private Boost io_context driven by one background thread. Every
// operation is started on that thread and its result is posted back to the
// client executor through a single-slot channel.
//
// Usage:
//   ClientConfig config;
//   config.url = "wss://example.com/ws";
//   NoexClient client(io.get_executor(), config, make_beast_transport_factory());

#include "noexpp/transport/websocket_transport.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace noexpp {

struct WebSocketTransportConfig {
    // TCP connect plus TLS handshake; the WebSocket upgrade uses Beast's
    // suggested client timeouts.
    std::chrono::milliseconds open_timeout{10'000};

    // Inbound messages larger than this fail the connection.
    std::size_t max_message_size{16 * 1024 * 1024};

    std::string user_agent{"noexpp/0.1"};

    // Verify the server certificate chain and host name (wss:// only).
    bool verify_peer{true};

    // CA bundle for verification. Empty = system default paths.
    std::string ca_cert_path;

    WebSocketTransportConfig& with_open_timeout(std::chrono::milliseconds value) {
        open_timeout = value;
        return *this;
    }

    WebSocketTransportConfig& with_max_message_size(std::size_t value) {
        max_message_size = value;
        return *this;
    }

    WebSocketTransportConfig& with_user_agent(std::string value) {
        user_agent = std::move(value);
        return *this;
    }

    WebSocketTransportConfig& with_verify_peer(bool value) {
        verify_peer = value;
        return *this;
    }

    WebSocketTransportConfig& with_ca_cert_path(std::string value) {
        ca_cert_path = std::move(value);
        return *this;
    }
};

class BeastWebSocketTransport final : public IWebSocketTransport {
public:
    BeastWebSocketTransport(asio::any_io_executor executor, WebSocketTransportConfig config = {});
    ~BeastWebSocketTransport() override;

    BeastWebSocketTransport(const BeastWebSocketTransport&) = delete;
    BeastWebSocketTransport& operator=(const BeastWebSocketTransport&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override { return executor_; }

    [[nodiscard]] asio::awaitable<TransportResult<void>> async_open(
        const security::WebSocketEndpoint& endpoint
    ) override;

    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(std::string text) override;
    [[nodiscard]] asio::awaitable<TransportResult<std::string>> async_receive() override;
    [[nodiscard]] asio::awaitable<void> async_close(std::string reason) override;

    [[nodiscard]] bool is_open() const override;

private:
    struct Runtime;

    asio::any_io_executor executor_;
    WebSocketTransportConfig config_;
    std::unique_ptr<Runtime> runtime_;
};

/// Factory producing a fresh BeastWebSocketTransport per connection
[[nodiscard]] TransportFactory make_beast_transport_factory(WebSocketTransportConfig config = {});

}  // namespace noexpp
