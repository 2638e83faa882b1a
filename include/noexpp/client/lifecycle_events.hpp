#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle Events
// ═══════════════════════════════════════════════════════════════════════════
// Advisory notifications for application code:
//
//   connected, disconnected(reason), reconnecting(attempt), reconnected,
//   error(ClientError), welcome(WelcomeInfo), session_revoked(reason)
//
// Emission never runs listeners inline: the current listener set is copied
// and invoked from a handler posted to the executor, so protocol processing
// never waits on application code. Events posted to the same strand keep
// their relative order. Exceptions thrown by listeners are logged and
// swallowed.

#include "noexpp/client/client_error.hpp"
#include "noexpp/protocol/frame.hpp"

#include <asio/any_io_executor.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace noexpp {

using ListenerId = std::uint64_t;

class LifecycleEvents {
public:
    using ConnectedHandler = std::function<void()>;
    using DisconnectedHandler = std::function<void(const std::string& reason)>;
    using ReconnectingHandler = std::function<void(std::size_t attempt)>;
    using ReconnectedHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const ClientError& error)>;
    using WelcomeHandler = std::function<void(const protocol::WelcomeInfo& welcome)>;
    using SessionRevokedHandler = std::function<void(const std::string& reason)>;

    explicit LifecycleEvents(asio::any_io_executor executor)
        : executor_(std::move(executor)) {}

    LifecycleEvents(const LifecycleEvents&) = delete;
    LifecycleEvents& operator=(const LifecycleEvents&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Registration
    // ─────────────────────────────────────────────────────────────────────────

    ListenerId on_connected(ConnectedHandler handler);
    ListenerId on_disconnected(DisconnectedHandler handler);
    ListenerId on_reconnecting(ReconnectingHandler handler);
    ListenerId on_reconnected(ReconnectedHandler handler);
    ListenerId on_error(ErrorHandler handler);
    ListenerId on_welcome(WelcomeHandler handler);
    ListenerId on_session_revoked(SessionRevokedHandler handler);

    /// Returns false if the id is unknown or was already removed
    bool remove(ListenerId id);

    [[nodiscard]] std::size_t listener_count() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Emission
    // ─────────────────────────────────────────────────────────────────────────

    void emit_connected();
    void emit_disconnected(std::string reason);
    void emit_reconnecting(std::size_t attempt);
    void emit_reconnected();
    void emit_error(ClientError error);
    void emit_welcome(protocol::WelcomeInfo welcome);
    void emit_session_revoked(std::string reason);

private:
    template <typename Handler>
    using Table = std::vector<std::pair<ListenerId, Handler>>;

    template <typename Handler>
    ListenerId add(Table<Handler>& table, Handler handler);

    template <typename Handler, typename... Args>
    void emit(const char* event, const Table<Handler>& table, Args... args);

    asio::any_io_executor executor_;

    mutable std::mutex mutex_;
    ListenerId next_id_{1};
    Table<ConnectedHandler> connected_;
    Table<DisconnectedHandler> disconnected_;
    Table<ReconnectingHandler> reconnecting_;
    Table<ReconnectedHandler> reconnected_;
    Table<ErrorHandler> error_;
    Table<WelcomeHandler> welcome_;
    Table<SessionRevokedHandler> session_revoked_;
};

}  // namespace noexpp
