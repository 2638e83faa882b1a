#include "noexpp/transport/connection.hpp"
#include "noexpp/log/logger.hpp"

namespace noexpp {

Connection::Connection(std::uint64_t generation, std::unique_ptr<IWebSocketTransport> transport)
    : generation_(generation)
    , transport_(std::move(transport))
{}

void Connection::mark_connected(protocol::WelcomeInfo welcome) {
    if (state_ != ConnectionState::Connecting) {
        return;
    }
    welcome_ = std::move(welcome);
    state_ = ConnectionState::Connected;
}

void Connection::invalidate() noexcept {
    state_ = ConnectionState::Disconnected;
}

asio::awaitable<TransportResult<void>> Connection::open(const security::WebSocketEndpoint& endpoint) {
    co_return co_await transport_->async_open(endpoint);
}

asio::awaitable<TransportResult<void>> Connection::send(std::string frame) {
    if (state_ == ConnectionState::Disconnected) {
        co_return tl::unexpected(TransportError::closed(std::nullopt, "Connection is closed"));
    }
    NOEXPP_LOG_TRACE("[conn " + std::to_string(generation_) + "] >> " + frame);
    co_return co_await transport_->async_send(std::move(frame));
}

asio::awaitable<TransportResult<std::string>> Connection::receive() {
    auto result = co_await transport_->async_receive();
    if (result) {
        NOEXPP_LOG_TRACE("[conn " + std::to_string(generation_) + "] << " + *result);
    }
    co_return result;
}

asio::awaitable<void> Connection::close(std::string reason) {
    invalidate();
    if (transport_->is_open()) {
        co_await transport_->async_close(std::move(reason));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionHandle
// ─────────────────────────────────────────────────────────────────────────────

bool ConnectionHandle::valid() const {
    auto connection = connection_.lock();
    return connection && connection->usable();
}

std::uint64_t ConnectionHandle::generation() const {
    auto connection = connection_.lock();
    if (!connection || !connection->usable()) {
        return 0;
    }
    return connection->generation();
}

asio::awaitable<TransportResult<void>> ConnectionHandle::send(std::string frame) const {
    auto connection = connection_.lock();
    if (!connection || !connection->usable()) {
        co_return tl::unexpected(TransportError::closed(std::nullopt, "Connection is not available"));
    }
    co_return co_await connection->send(std::move(frame));
}

}  // namespace noexpp
