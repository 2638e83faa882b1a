#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// NoexClient
// ═══════════════════════════════════════════════════════════════════════════
// One logical session against a noex server across any number of physical
// connections.
//
// Usage:
//   asio::io_context io;
//   NoexClient client(io.get_executor(),
//                     ClientConfig{}.with_url("ws://localhost:8080")
//                                   .with_auth(AuthConfig::with_token("...")));
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       co_await client.connect();
//       auto users = co_await client.invoke("store.all", {{"bucket", "users"}});
//       auto sub = co_await client.subscribe("all-users", nullptr,
//                                            [](const Json& rows) { ... });
//       co_await client.disconnect();
//   }, asio::detached);
//
//   io.run();
//
// Threading: all session state lives on one strand. Public coroutines hop
// onto it first, so they may be started from any executor. The client must
// outlive every coroutine it started; call disconnect() before destroying it.

#include "noexpp/client/client_config.hpp"
#include "noexpp/client/client_error.hpp"
#include "noexpp/client/lifecycle_events.hpp"
#include "noexpp/client/request_correlator.hpp"
#include "noexpp/client/request_sender.hpp"
#include "noexpp/client/session_coordinator.hpp"
#include "noexpp/client/subscription_registry.hpp"
#include "noexpp/transport/backoff_policy.hpp"
#include "noexpp/transport/connection_state_machine.hpp"
#include "noexpp/transport/reconnection_controller.hpp"
#include "noexpp/transport/websocket_transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace noexpp {

struct InvokeOptions {
    /// Overrides ClientConfig::request_timeout
    std::optional<std::chrono::milliseconds> timeout;

    /// Fail with Unauthorized unless a login has succeeded on this session
    bool requires_auth{false};

    InvokeOptions& with_timeout(std::chrono::milliseconds value) {
        timeout = value;
        return *this;
    }

    InvokeOptions& with_requires_auth(bool value) {
        requires_auth = value;
        return *this;
    }
};

class NoexClient final : private IRequestSender, private IFrameHandler {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Construction
    // ─────────────────────────────────────────────────────────────────────────

    /// Uses the Beast transport. Throws std::invalid_argument for an invalid
    /// configuration (bad URL, negative delays).
    NoexClient(asio::any_io_executor executor, ClientConfig config);

    /// Custom transport, and optionally a custom reconnect backoff
    NoexClient(
        asio::any_io_executor executor,
        ClientConfig config,
        TransportFactory transport_factory,
        std::unique_ptr<IBackoffPolicy> backoff = nullptr
    );

    ~NoexClient() override;

    NoexClient(const NoexClient&) = delete;
    NoexClient& operator=(const NoexClient&) = delete;
    NoexClient(NoexClient&&) = delete;
    NoexClient& operator=(NoexClient&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Open the connection, wait for the welcome and log in if the server
    /// requires it. A failed login is reported as an error event only.
    [[nodiscard]] asio::awaitable<ClientResult<protocol::WelcomeInfo>> connect();

    /// Stop reconnecting, fail pending requests, drop subscriptions and close
    /// the transport. Everything has happened when this returns.
    [[nodiscard]] asio::awaitable<void> disconnect();

    [[nodiscard]] ConnectionState state() const noexcept { return connection_.state(); }
    [[nodiscard]] bool is_connected() const noexcept { return state() == ConnectionState::Connected; }

    /// Connected and past the login replay and resubscribe
    [[nodiscard]] bool is_ready() const noexcept { return ready_.load(std::memory_order_acquire); }

    // ─────────────────────────────────────────────────────────────────────────
    // Remote Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Generic entry point for every remote operation. While reconnecting the
    /// call waits for the session, within the same timeout.
    [[nodiscard]] asio::awaitable<ClientResult<Json>> invoke(
        std::string operation,
        Json payload = Json::object(),
        InvokeOptions options = {}
    );

    [[nodiscard]] asio::awaitable<ClientResult<Subscription>> subscribe(
        std::string query,
        Json params,
        SubscriptionCallback callback
    );

    [[nodiscard]] asio::awaitable<ClientResult<Subscription>> subscribe(
        SubscriptionRequest request,
        SubscriptionCallback callback
    );

    /// Local removal is immediate; the server is told in the background
    bool unsubscribe(SubscriptionHandle handle);

    // ─────────────────────────────────────────────────────────────────────────
    // Authentication
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<ClientResult<SessionInfo>> login(std::string token);
    [[nodiscard]] asio::awaitable<ClientResult<SessionInfo>> login(std::string username, std::string password);
    [[nodiscard]] asio::awaitable<ClientResult<void>> logout();

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle Events
    // ─────────────────────────────────────────────────────────────────────────

    ListenerId on_connected(LifecycleEvents::ConnectedHandler handler);
    ListenerId on_disconnected(LifecycleEvents::DisconnectedHandler handler);
    ListenerId on_reconnecting(LifecycleEvents::ReconnectingHandler handler);
    ListenerId on_reconnected(LifecycleEvents::ReconnectedHandler handler);
    ListenerId on_error(LifecycleEvents::ErrorHandler handler);
    ListenerId on_welcome(LifecycleEvents::WelcomeHandler handler);
    ListenerId on_session_revoked(LifecycleEvents::SessionRevokedHandler handler);
    bool remove_listener(ListenerId id);

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<protocol::WelcomeInfo> welcome() const { return connection_.welcome(); }
    [[nodiscard]] std::optional<SessionInfo> session() const { return session_.session(); }
    [[nodiscard]] std::size_t pending_requests() const noexcept { return correlator_.pending_count(); }
    [[nodiscard]] std::size_t subscription_count() const { return subscriptions_.size(); }
    [[nodiscard]] const std::string& url() const noexcept { return config_.url; }
    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::uint64_t connection_generation() const noexcept { return connection_.generation(); }

    /// Strand only
    [[nodiscard]] ReconnectState reconnect_state() const { return reconnector_.state(); }

    [[nodiscard]] asio::any_io_executor get_executor() const { return strand_; }

private:
    using ReadyChannel = asio::experimental::channel<void(asio::error_code, bool)>;

    // IRequestSender: bypasses the readiness gate (login, resubscribe)
    asio::awaitable<ClientResult<Json>> request(std::string operation, Json payload) override;

    // IFrameHandler
    void on_response(const protocol::ResponseFrame& frame) override;
    void on_push(const protocol::PushFrame& frame) override;
    void on_session_revoked(const std::string& reason) override;
    void on_protocol_error(const std::string& message) override;
    void on_connection_lost(const TransportError& error) override;

    asio::awaitable<void> reconnect_loop(std::uint64_t loop_id);
    asio::awaitable<void> restore_session(const protocol::WelcomeInfo& welcome);
    void enter_disconnected(const std::string& reason);

    asio::awaitable<ClientResult<void>> wait_until_ready(std::chrono::steady_clock::time_point deadline);
    void set_ready(bool ready);
    void release_waiters(bool ready);

    ClientConfig config_;
    asio::strand<asio::any_io_executor> strand_;

    LifecycleEvents events_;
    RequestCorrelator correlator_;
    SubscriptionRegistry subscriptions_;
    SessionCoordinator session_;
    ConnectionStateMachine connection_;
    ReconnectionController reconnector_;

    std::atomic<bool> ready_{false};
    bool closing_{false};
    bool reconnect_loop_active_{false};
    std::uint64_t reconnect_loop_id_{0};
    std::vector<std::shared_ptr<ReadyChannel>> ready_waiters_;
};

}  // namespace noexpp
