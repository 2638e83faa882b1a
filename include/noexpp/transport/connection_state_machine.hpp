#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection State Machine
// ═══════════════════════════════════════════════════════════════════════════
// Sole owner of the current Connection.
//
//   Disconnected ──open()──▶ Connecting ──welcome──▶ Connected
//                                 │                      │
//                                 └──fail/close()──┐     ├──loss──▶ Reconnecting ──open()──▶ Connected
//                                                  ▼     ▼               │
//                                               Disconnected ◀──close()/exhausted
//
// open() creates a fresh transport, starts its read loop and waits for the
// welcome frame, bounded by the connect timeout. The read loop decodes every
// frame and hands it to the IFrameHandler; pings are answered here when the
// heartbeat is enabled. Loss of a Connected connection is reported through
// IFrameHandler::on_connection_lost(); the caller decides whether to move to
// Reconnecting or Disconnected.
//
// Leaving Connected invalidates the connection, so handles obtained from
// handle() stop sending immediately.

#include "noexpp/client/client_error.hpp"
#include "noexpp/protocol/frame.hpp"
#include "noexpp/transport/connection.hpp"
#include "noexpp/transport/websocket_transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace noexpp {

/// Receives decoded frames and connection loss, on the strand
class IFrameHandler {
public:
    virtual ~IFrameHandler() = default;

    virtual void on_response(const protocol::ResponseFrame& frame) = 0;
    virtual void on_push(const protocol::PushFrame& frame) = 0;
    virtual void on_session_revoked(const std::string& reason) = 0;
    virtual void on_protocol_error(const std::string& message) = 0;
    virtual void on_connection_lost(const TransportError& error) = 0;
};

struct ConnectionOptions {
    std::chrono::milliseconds connect_timeout{5'000};
    bool heartbeat{true};
};

class ConnectionStateMachine {
public:
    ConnectionStateMachine(
        asio::strand<asio::any_io_executor> strand,
        TransportFactory factory,
        security::WebSocketEndpoint endpoint,
        ConnectionOptions options,
        IFrameHandler& handler
    );

    ConnectionStateMachine(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;

    /// Open a new physical connection and wait for its welcome
    [[nodiscard]] asio::awaitable<ClientResult<protocol::WelcomeInfo>> open();

    /// Explicit close. Aborts a handshake in progress; ends in Disconnected.
    [[nodiscard]] asio::awaitable<void> close(std::string reason);

    /// Strand only. Returns false (and changes nothing) for an illegal move.
    bool transition_to(ConnectionState next);

    [[nodiscard]] ConnectionState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    /// Strand only
    [[nodiscard]] ConnectionHandle handle() const;

    /// Welcome of the most recent connection
    [[nodiscard]] std::optional<protocol::WelcomeInfo> welcome() const;

    /// Number of physical connections created so far
    [[nodiscard]] std::uint64_t generation() const noexcept {
        return generation_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const security::WebSocketEndpoint& endpoint() const noexcept { return endpoint_; }

    [[nodiscard]] static bool is_legal_transition(ConnectionState from, ConnectionState to) noexcept;

private:
    using HandshakeChannel = asio::experimental::channel<
        void(asio::error_code, ClientResult<protocol::WelcomeInfo>)
    >;

    asio::awaitable<void> establish(std::shared_ptr<Connection> connection, std::shared_ptr<HandshakeChannel> handshake);
    asio::awaitable<void> read_loop(std::shared_ptr<Connection> connection, std::shared_ptr<HandshakeChannel> handshake);
    void dispatch(protocol::InboundFrame& frame);

    asio::strand<asio::any_io_executor> strand_;
    TransportFactory factory_;
    security::WebSocketEndpoint endpoint_;
    ConnectionOptions options_;
    IFrameHandler& handler_;
    protocol::FrameCodec codec_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<std::uint64_t> generation_{0};
    std::shared_ptr<Connection> current_;
    std::shared_ptr<HandshakeChannel> handshake_;

    mutable std::mutex welcome_mutex_;
    std::optional<protocol::WelcomeInfo> welcome_;
};

}  // namespace noexpp
