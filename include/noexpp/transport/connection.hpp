#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════
// One physical WebSocket connection. Created by the ConnectionStateMachine
// for every (re)connect and never reused once it leaves Connected.
//
// Other components only see a ConnectionHandle: a weak, read-only view that
// stops accepting frames as soon as its connection is invalidated.
//
// Connection and ConnectionHandle are not thread-safe; use them from the
// client strand only.

#include "noexpp/protocol/frame.hpp"
#include "noexpp/transport/websocket_transport.hpp"

#include <asio/awaitable.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace noexpp {

enum class ConnectionState {
    Connecting,
    Connected,
    Reconnecting,
    Disconnected
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

class Connection {
public:
    Connection(std::uint64_t generation, std::unique_ptr<IWebSocketTransport> transport);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

    /// Connecting until the welcome arrives, Disconnected once invalidated
    [[nodiscard]] ConnectionState state() const noexcept { return state_; }

    [[nodiscard]] bool usable() const noexcept { return state_ == ConnectionState::Connected; }

    [[nodiscard]] const std::optional<protocol::WelcomeInfo>& welcome() const noexcept { return welcome_; }

    void mark_connected(protocol::WelcomeInfo welcome);

    /// Permanently retire this connection. Outstanding handles go stale.
    void invalidate() noexcept;

    [[nodiscard]] asio::awaitable<TransportResult<void>> open(const security::WebSocketEndpoint& endpoint);
    [[nodiscard]] asio::awaitable<TransportResult<void>> send(std::string frame);
    [[nodiscard]] asio::awaitable<TransportResult<std::string>> receive();
    [[nodiscard]] asio::awaitable<void> close(std::string reason);

private:
    std::uint64_t generation_;
    std::unique_ptr<IWebSocketTransport> transport_;
    ConnectionState state_{ConnectionState::Connecting};
    std::optional<protocol::WelcomeInfo> welcome_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionHandle
// ─────────────────────────────────────────────────────────────────────────────

class ConnectionHandle {
public:
    ConnectionHandle() = default;
    explicit ConnectionHandle(std::weak_ptr<Connection> connection)
        : connection_(std::move(connection)) {}

    /// True while the connection exists and is Connected
    [[nodiscard]] bool valid() const;

    /// 0 when the handle is empty or stale
    [[nodiscard]] std::uint64_t generation() const;

    /// Fails with Category::Closed once the handle is stale
    [[nodiscard]] asio::awaitable<TransportResult<void>> send(std::string frame) const;

private:
    std::weak_ptr<Connection> connection_;
};

}  // namespace noexpp
