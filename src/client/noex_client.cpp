#include "noexpp/client/noex_client.hpp"
#include "noexpp/log/logger.hpp"
#include "noexpp/transport/beast_websocket_transport.hpp"

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/dispatch.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <stdexcept>

namespace noexpp {

namespace {

security::WebSocketEndpoint resolve_endpoint(const ClientConfig& config) {
    auto endpoint = config.validate();
    if (!endpoint) {
        throw std::invalid_argument("Invalid client configuration: " + endpoint.error());
    }
    if (endpoint->warning) {
        NOEXPP_LOG_WARN(*endpoint->warning);
    }
    return std::move(*endpoint);
}

std::unique_ptr<IBackoffPolicy> default_backoff(const ReconnectConfig& config) {
    return std::make_unique<ExponentialBackoff>(
        config.initial_delay,
        config.multiplier,
        config.max_delay,
        config.jitter
    );
}

ReconnectPolicy make_reconnect_policy(const ClientConfig& config) {
    ReconnectPolicy policy(config.reconnect);
    policy.with_reconnect_after_revocation(config.reconnect_after_session_revoked);
    return policy;
}

std::string describe_loss(const TransportError& error) {
    std::string reason = "Connection lost";
    if (error.close_code) {
        reason += " (code " + std::to_string(*error.close_code) + ")";
    }
    if (!error.message.empty()) {
        reason += ": " + error.message;
    }
    return reason;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

NoexClient::NoexClient(asio::any_io_executor executor, ClientConfig config)
    : NoexClient(std::move(executor), std::move(config), make_beast_transport_factory())
{}

NoexClient::NoexClient(
    asio::any_io_executor executor,
    ClientConfig config,
    TransportFactory transport_factory,
    std::unique_ptr<IBackoffPolicy> backoff
)
    : config_(std::move(config))
    , strand_(asio::make_strand(std::move(executor)))
    , events_(strand_)
    , correlator_(strand_, config_.request_timeout)
    , subscriptions_(strand_, *this)
    , session_(*this, config_.auth)
    , connection_(
          strand_,
          std::move(transport_factory),
          resolve_endpoint(config_),
          ConnectionOptions{config_.connect_timeout, config_.heartbeat},
          *this
      )
    , reconnector_(
          strand_,
          make_reconnect_policy(config_),
          backoff ? std::move(backoff) : default_backoff(config_.reconnect)
      )
{}

NoexClient::~NoexClient() {
    // disconnect() should already have run; this only stops a pending delay
    closing_ = true;
    reconnector_.stop();
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<protocol::WelcomeInfo>> NoexClient::connect() {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    if (state() != ConnectionState::Disconnected || reconnect_loop_active_) {
        co_return tl::unexpected(ClientError::invalid_argument("Client is already connected or connecting"));
    }

    closing_ = false;
    session_.clear_revocation();
    NOEXPP_LOG_INFO("Connecting to " + config_.url);

    auto welcome = co_await connection_.open();
    if (!welcome) {
        co_return tl::unexpected(welcome.error());
    }

    co_await restore_session(*welcome);

    if (closing_) {
        co_return tl::unexpected(ClientError::disconnected("Disconnected while connecting"));
    }

    if (state() == ConnectionState::Connected) {
        set_ready(true);
        events_.emit_connected();
        events_.emit_welcome(*welcome);
    }

    co_return welcome;
}

asio::awaitable<void> NoexClient::disconnect() {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    const bool was_disconnected = state() == ConnectionState::Disconnected && !reconnect_loop_active_;

    closing_ = true;
    reconnector_.stop();
    // A loop parked in its delay resumes later and exits as stale
    ++reconnect_loop_id_;
    reconnect_loop_active_ = false;

    set_ready(false);
    release_waiters(false);
    correlator_.reject_all(ClientError::disconnected("Client disconnected"));
    subscriptions_.clear();
    session_.invalidate();

    co_await connection_.close("Client disconnect");

    if (!was_disconnected) {
        events_.emit_disconnected("Client disconnected");
    }
}

asio::awaitable<void> NoexClient::restore_session(const protocol::WelcomeInfo& welcome) {
    session_.invalidate();

    if (welcome.requires_auth && session_.has_auth()) {
        auto login = co_await session_.auto_login();
        if (!login) {
            NOEXPP_LOG_WARN("Automatic login failed: " + login.error().message);
            events_.emit_error(login.error());
        }
    }

    if (closing_ || state() != ConnectionState::Connected) {
        co_return;
    }

    auto report = co_await subscriptions_.resubscribe_all();
    for (const auto& [handle, error] : report.failed) {
        events_.emit_error(ClientError{
            error.code,
            "Failed to resubscribe subscription " + std::to_string(handle) + ": " + error.message,
            error.server_error
        });
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Loss and Reconnection
// ═══════════════════════════════════════════════════════════════════════════

void NoexClient::on_connection_lost(const TransportError& error) {
    const auto reason = describe_loss(error);

    ready_.store(false, std::memory_order_release);
    session_.invalidate();
    correlator_.reject_all(ClientError::disconnected(reason));
    subscriptions_.release_server_ids();

    if (closing_) {
        return;
    }

    if (!reconnector_.policy().should_reconnect(error, session_.revoked())) {
        reconnector_.stop();
        enter_disconnected(reason);
        return;
    }

    connection_.transition_to(ConnectionState::Reconnecting);

    if (!reconnect_loop_active_) {
        reconnect_loop_active_ = true;
        reconnector_.arm();
        asio::co_spawn(strand_, reconnect_loop(++reconnect_loop_id_), asio::detached);
    }
}

asio::awaitable<void> NoexClient::reconnect_loop(std::uint64_t loop_id) {
    auto stale = [this, loop_id] { return loop_id != reconnect_loop_id_; };

    while (true) {
        auto outcome = co_await reconnector_.run(
            [this]() -> asio::awaitable<ClientResult<void>> {
                auto welcome = co_await connection_.open();
                if (!welcome) {
                    co_return tl::unexpected(welcome.error());
                }
                co_return ClientResult<void>{};
            },
            ReconnectionController::Hooks{
                [this](std::size_t attempt, std::chrono::milliseconds) {
                    events_.emit_reconnecting(attempt);
                },
                [this](std::size_t attempt, const ClientError& error) {
                    events_.emit_error(ClientError{
                        error.code,
                        "Reconnect attempt " + std::to_string(attempt) + " failed: " + error.message,
                        error.server_error
                    });
                }
            }
        );

        if (outcome == ReconnectOutcome::Stopped || stale()) {
            break;
        }
        if (outcome == ReconnectOutcome::Exhausted) {
            enter_disconnected("Max reconnect attempts reached");
            break;
        }

        auto welcome = connection_.welcome();
        co_await restore_session(welcome.value_or(protocol::WelcomeInfo{}));

        if (closing_ || stale()) {
            break;
        }
        if (state() == ConnectionState::Reconnecting) {
            // Lost again while restoring
            reconnector_.arm();
            continue;
        }
        if (state() != ConnectionState::Connected) {
            break;
        }

        set_ready(true);
        events_.emit_connected();
        events_.emit_reconnected();
        events_.emit_welcome(welcome.value_or(protocol::WelcomeInfo{}));
        break;
    }

    if (!stale()) {
        reconnect_loop_active_ = false;
    }
}

void NoexClient::enter_disconnected(const std::string& reason) {
    set_ready(false);
    release_waiters(false);
    correlator_.reject_all(ClientError::disconnected(reason));
    connection_.transition_to(ConnectionState::Disconnected);
    events_.emit_disconnected(reason);
}

// ═══════════════════════════════════════════════════════════════════════════
// Readiness Gate
// ═══════════════════════════════════════════════════════════════════════════

void NoexClient::set_ready(bool ready) {
    ready_.store(ready, std::memory_order_release);
    if (ready) {
        release_waiters(true);
    }
}

void NoexClient::release_waiters(bool ready) {
    auto waiters = std::move(ready_waiters_);
    ready_waiters_.clear();
    for (auto& waiter : waiters) {
        waiter->try_send(asio::error_code{}, ready);
    }
}

asio::awaitable<ClientResult<void>> NoexClient::wait_until_ready(std::chrono::steady_clock::time_point deadline) {
    if (is_ready()) {
        co_return ClientResult<void>{};
    }
    if (state() == ConnectionState::Disconnected && !reconnect_loop_active_) {
        co_return tl::unexpected(ClientError::disconnected("Not connected"));
    }

    auto waiter = std::make_shared<ReadyChannel>(strand_, 1);
    ready_waiters_.push_back(waiter);

    asio::steady_timer timer(strand_);
    timer.expires_at(deadline);
    timer.async_wait([waiter](asio::error_code ec) {
        if (!ec) {
            waiter->try_send(asio::error_code{}, false);
        }
    });

    const bool ready = co_await waiter->async_receive(asio::use_awaitable);
    timer.cancel();
    std::erase(ready_waiters_, waiter);

    if (ready) {
        co_return ClientResult<void>{};
    }
    if (state() == ConnectionState::Disconnected) {
        co_return tl::unexpected(ClientError::disconnected("Connection closed while waiting"));
    }
    co_return tl::unexpected(ClientError{ClientErrorCode::Timeout, "Timed out waiting for the connection", std::nullopt});
}

// ═══════════════════════════════════════════════════════════════════════════
// Remote Operations
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<Json>> NoexClient::invoke(std::string operation, Json payload, InvokeOptions options) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    if (operation.empty()) {
        co_return tl::unexpected(ClientError::invalid_argument("Operation name must not be empty"));
    }

    const auto timeout = options.timeout.value_or(config_.request_timeout);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    if (!is_ready()) {
        if (!config_.queue_requests_while_reconnecting) {
            co_return tl::unexpected(ClientError::disconnected("Not connected"));
        }
        auto ready = co_await wait_until_ready(deadline);
        if (!ready) {
            if (ready.error().code == ClientErrorCode::Timeout) {
                co_return tl::unexpected(ClientError::timeout(operation, timeout));
            }
            co_return tl::unexpected(ready.error());
        }
    }

    if (options.requires_auth && !session_.authenticated()) {
        co_return tl::unexpected(ClientError::unauthorized(operation));
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()
    );
    if (remaining.count() <= 0) {
        co_return tl::unexpected(ClientError::timeout(operation, timeout));
    }

    co_return co_await correlator_.send(connection_.handle(), std::move(operation), std::move(payload), remaining);
}

asio::awaitable<ClientResult<Json>> NoexClient::request(std::string operation, Json payload) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));
    co_return co_await correlator_.send(connection_.handle(), std::move(operation), std::move(payload));
}

asio::awaitable<ClientResult<Subscription>> NoexClient::subscribe(
    std::string query,
    Json params,
    SubscriptionCallback callback
) {
    co_return co_await subscribe(SubscriptionRequest::query(std::move(query), std::move(params)), std::move(callback));
}

asio::awaitable<ClientResult<Subscription>> NoexClient::subscribe(
    SubscriptionRequest request,
    SubscriptionCallback callback
) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    if (!is_ready()) {
        auto ready = co_await wait_until_ready(std::chrono::steady_clock::now() + config_.request_timeout);
        if (!ready) {
            co_return tl::unexpected(ready.error());
        }
    }

    co_return co_await subscriptions_.subscribe(std::move(request), std::move(callback));
}

bool NoexClient::unsubscribe(SubscriptionHandle handle) {
    return subscriptions_.unsubscribe(handle);
}

// ═══════════════════════════════════════════════════════════════════════════
// Authentication
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<SessionInfo>> NoexClient::login(std::string token) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    auto ready = co_await wait_until_ready(std::chrono::steady_clock::now() + config_.request_timeout);
    if (!ready) {
        co_return tl::unexpected(ready.error());
    }
    co_return co_await session_.login_with_token(std::move(token));
}

asio::awaitable<ClientResult<SessionInfo>> NoexClient::login(std::string username, std::string password) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    auto ready = co_await wait_until_ready(std::chrono::steady_clock::now() + config_.request_timeout);
    if (!ready) {
        co_return tl::unexpected(ready.error());
    }
    co_return co_await session_.login_with_credentials(std::move(username), std::move(password));
}

asio::awaitable<ClientResult<void>> NoexClient::logout() {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    auto ready = co_await wait_until_ready(std::chrono::steady_clock::now() + config_.request_timeout);
    if (!ready) {
        co_return tl::unexpected(ready.error());
    }
    co_return co_await session_.logout();
}

// ═══════════════════════════════════════════════════════════════════════════
// Frame Handling (IFrameHandler)
// ═══════════════════════════════════════════════════════════════════════════

void NoexClient::on_response(const protocol::ResponseFrame& frame) {
    correlator_.resolve(frame);
}

void NoexClient::on_push(const protocol::PushFrame& frame) {
    if (!subscriptions_.handle_push(frame)) {
        NOEXPP_LOG_DEBUG("Push for unknown subscription " + frame.subscription_id + " on " + frame.channel);
    }
}

void NoexClient::on_session_revoked(const std::string& reason) {
    session_.mark_revoked(reason);
    events_.emit_session_revoked(reason);
}

void NoexClient::on_protocol_error(const std::string& message) {
    events_.emit_error(ClientError::protocol_error(message));
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle Events
// ═══════════════════════════════════════════════════════════════════════════

ListenerId NoexClient::on_connected(LifecycleEvents::ConnectedHandler handler) {
    return events_.on_connected(std::move(handler));
}

ListenerId NoexClient::on_disconnected(LifecycleEvents::DisconnectedHandler handler) {
    return events_.on_disconnected(std::move(handler));
}

ListenerId NoexClient::on_reconnecting(LifecycleEvents::ReconnectingHandler handler) {
    return events_.on_reconnecting(std::move(handler));
}

ListenerId NoexClient::on_reconnected(LifecycleEvents::ReconnectedHandler handler) {
    return events_.on_reconnected(std::move(handler));
}

ListenerId NoexClient::on_error(LifecycleEvents::ErrorHandler handler) {
    return events_.on_error(std::move(handler));
}

ListenerId NoexClient::on_welcome(LifecycleEvents::WelcomeHandler handler) {
    return events_.on_welcome(std::move(handler));
}

ListenerId NoexClient::on_session_revoked(LifecycleEvents::SessionRevokedHandler handler) {
    return events_.on_session_revoked(std::move(handler));
}

bool NoexClient::remove_listener(ListenerId id) {
    return events_.remove(id);
}

}  // namespace noexpp
