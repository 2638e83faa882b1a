#include "noexpp/transport/connection_state_machine.hpp"
#include "noexpp/log/logger.hpp"

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/dispatch.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

namespace noexpp {

ConnectionStateMachine::ConnectionStateMachine(
    asio::strand<asio::any_io_executor> strand,
    TransportFactory factory,
    security::WebSocketEndpoint endpoint,
    ConnectionOptions options,
    IFrameHandler& handler
)
    : strand_(std::move(strand))
    , factory_(std::move(factory))
    , endpoint_(std::move(endpoint))
    , options_(options)
    , handler_(handler)
{}

// ═══════════════════════════════════════════════════════════════════════════
// State
// ═══════════════════════════════════════════════════════════════════════════

bool ConnectionStateMachine::is_legal_transition(ConnectionState from, ConnectionState to) noexcept {
    switch (from) {
        case ConnectionState::Disconnected:
            return to == ConnectionState::Connecting;
        case ConnectionState::Connecting:
            return to == ConnectionState::Connected || to == ConnectionState::Disconnected;
        case ConnectionState::Connected:
            return to == ConnectionState::Reconnecting || to == ConnectionState::Disconnected;
        case ConnectionState::Reconnecting:
            return to == ConnectionState::Connected || to == ConnectionState::Disconnected;
    }
    return false;
}

bool ConnectionStateMachine::transition_to(ConnectionState next) {
    const auto current = state();
    if (current == next) {
        return true;
    }
    if (!is_legal_transition(current, next)) {
        NOEXPP_LOG_WARN("Ignoring illegal transition " + std::string(to_string(current)) +
                        " -> " + std::string(to_string(next)));
        return false;
    }

    if (current == ConnectionState::Connected && current_) {
        current_->invalidate();
    }

    state_.store(next, std::memory_order_release);
    NOEXPP_LOG_INFO("Connection state: " + std::string(to_string(current)) +
                    " -> " + std::string(to_string(next)));
    return true;
}

ConnectionHandle ConnectionStateMachine::handle() const {
    if (state() != ConnectionState::Connected || !current_) {
        return ConnectionHandle{};
    }
    return ConnectionHandle{current_};
}

std::optional<protocol::WelcomeInfo> ConnectionStateMachine::welcome() const {
    std::lock_guard<std::mutex> lock(welcome_mutex_);
    return welcome_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Open / Close
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<protocol::WelcomeInfo>> ConnectionStateMachine::open() {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    if (state() == ConnectionState::Connected || handshake_) {
        co_return tl::unexpected(ClientError::invalid_argument("A connection is already open or opening"));
    }
    if (state() == ConnectionState::Disconnected) {
        transition_to(ConnectionState::Connecting);
    }

    auto transport = factory_(strand_);
    if (!transport) {
        transition_to(ConnectionState::Disconnected);
        co_return tl::unexpected(ClientError::connect_failed("Transport factory returned no transport"));
    }

    const auto generation = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    auto connection = std::make_shared<Connection>(generation, std::move(transport));
    current_ = connection;

    auto handshake = std::make_shared<HandshakeChannel>(strand_, 1);
    handshake_ = handshake;

    const auto context = LogContext::for_connection(generation);
    NOEXPP_LOG_CTX(LogLevel::Info, context, "Opening " + endpoint_.normalized_url);

    // The timeout covers the transport open as well as the welcome
    asio::steady_timer timer(strand_);
    timer.expires_after(options_.connect_timeout);
    timer.async_wait([handshake, timeout = options_.connect_timeout](asio::error_code ec) {
        if (ec) {
            return;
        }
        handshake->try_send(asio::error_code{}, tl::unexpected(ClientError::connect_failed(
            "Timeout waiting for welcome message after " + std::to_string(timeout.count()) + "ms"
        )));
    });

    asio::co_spawn(strand_, establish(connection, handshake), asio::detached);

    auto result = co_await handshake->async_receive(asio::use_awaitable);
    timer.cancel();
    if (handshake_ == handshake) {
        handshake_.reset();
    }

    if (!result || !connection->usable()) {
        if (result) {
            result = tl::unexpected(ClientError::disconnected("Connection closed during handshake"));
        }
        NOEXPP_LOG_CTX(LogLevel::Warn, context, "Handshake failed: " + result.error().message);
        co_await connection->close("Handshake failed");
        if (state() == ConnectionState::Connecting) {
            transition_to(ConnectionState::Disconnected);
        }
        co_return result;
    }

    {
        std::lock_guard<std::mutex> lock(welcome_mutex_);
        welcome_ = *result;
    }
    transition_to(ConnectionState::Connected);

    NOEXPP_LOG_CTX(LogLevel::Info, context, "Welcome received (server " + result->version + ", requiresAuth=" +
                   (result->requires_auth ? "true" : "false") + ")");
    co_return result;
}

asio::awaitable<void> ConnectionStateMachine::close(std::string reason) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    if (handshake_) {
        handshake_->try_send(asio::error_code{}, tl::unexpected(ClientError::disconnected(
            "Connection closed during handshake"
        )));
    }

    auto connection = current_;
    if (connection) {
        connection->invalidate();
    }
    transition_to(ConnectionState::Disconnected);

    if (connection) {
        co_await connection->close(std::move(reason));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Read Loop
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ConnectionStateMachine::establish(
    std::shared_ptr<Connection> connection,
    std::shared_ptr<HandshakeChannel> handshake
) {
    auto opened = co_await connection->open(endpoint_);
    if (!opened) {
        handshake->try_send(asio::error_code{}, tl::unexpected(ClientError::connect_failed(
            "Failed to open " + endpoint_.normalized_url + ": " + opened.error().message
        )));
        co_return;
    }

    if (connection->state() == ConnectionState::Disconnected) {
        // Timed out or closed while the transport was still opening
        co_await connection->close("Connection abandoned");
        co_return;
    }

    co_await read_loop(std::move(connection), std::move(handshake));
}

asio::awaitable<void> ConnectionStateMachine::read_loop(
    std::shared_ptr<Connection> connection,
    std::shared_ptr<HandshakeChannel> handshake
) {
    bool welcomed = false;

    while (true) {
        auto message = co_await connection->receive();

        if (!message) {
            const bool was_usable = connection->usable();
            connection->invalidate();

            if (!welcomed) {
                handshake->try_send(asio::error_code{}, tl::unexpected(ClientError::connect_failed(
                    "Connection closed before welcome: " + message.error().message
                )));
            } else if (was_usable && connection == current_) {
                NOEXPP_LOG_CTX(LogLevel::Warn, LogContext::for_connection(connection->generation()),
                               "Connection lost: " + message.error().message);
                handler_.on_connection_lost(message.error());
            }
            co_return;
        }

        auto frame = codec_.decode(*message);

        if (auto* welcome = std::get_if<protocol::WelcomeInfo>(&frame)) {
            if (!welcomed) {
                welcomed = true;
                connection->mark_connected(*welcome);
                handshake->try_send(asio::error_code{}, *welcome);
            } else {
                NOEXPP_LOG_DEBUG("Ignoring repeated welcome");
            }
            continue;
        }

        if (auto* ping = std::get_if<protocol::PingFrame>(&frame)) {
            if (options_.heartbeat) {
                auto sent = co_await connection->send(protocol::FrameCodec::encode_pong(ping->timestamp));
                if (!sent) {
                    NOEXPP_LOG_DEBUG("Failed to answer ping: " + sent.error().message);
                }
            }
            continue;
        }

        if (connection != current_) {
            continue;
        }
        dispatch(frame);
    }
}

void ConnectionStateMachine::dispatch(protocol::InboundFrame& frame) {
    if (auto* response = std::get_if<protocol::ResponseFrame>(&frame)) {
        handler_.on_response(*response);
    } else if (auto* push = std::get_if<protocol::PushFrame>(&frame)) {
        handler_.on_push(*push);
    } else if (auto* revoked = std::get_if<protocol::SessionRevokedFrame>(&frame)) {
        handler_.on_session_revoked(revoked->reason);
    } else if (auto* malformed = std::get_if<protocol::MalformedFrame>(&frame)) {
        NOEXPP_LOG_WARN("Malformed frame: " + malformed->reason);
        handler_.on_protocol_error(malformed->reason);
    }
}

}  // namespace noexpp
