#include "noexpp/client/lifecycle_events.hpp"
#include "noexpp/log/logger.hpp"

#include <asio/post.hpp>

#include <algorithm>

namespace noexpp {

template <typename Handler>
ListenerId LifecycleEvents::add(Table<Handler>& table, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    if (handler) {
        table.emplace_back(id, std::move(handler));
    }
    return id;
}

template <typename Handler, typename... Args>
void LifecycleEvents::emit(const char* event, const Table<Handler>& table, Args... args) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers.reserve(table.size());
        for (const auto& [id, handler] : table) {
            handlers.push_back(handler);
        }
    }

    if (handlers.empty()) {
        return;
    }

    asio::post(executor_, [event, handlers = std::move(handlers), args...]() {
        for (const auto& handler : handlers) {
            try {
                handler(args...);
            } catch (const std::exception& e) {
                NOEXPP_LOG_ERROR(std::string("Exception in '") + event + "' listener: " + e.what());
            }
        }
    });
}

// ─────────────────────────────────────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────────────────────────────────────

ListenerId LifecycleEvents::on_connected(ConnectedHandler handler) {
    return add(connected_, std::move(handler));
}

ListenerId LifecycleEvents::on_disconnected(DisconnectedHandler handler) {
    return add(disconnected_, std::move(handler));
}

ListenerId LifecycleEvents::on_reconnecting(ReconnectingHandler handler) {
    return add(reconnecting_, std::move(handler));
}

ListenerId LifecycleEvents::on_reconnected(ReconnectedHandler handler) {
    return add(reconnected_, std::move(handler));
}

ListenerId LifecycleEvents::on_error(ErrorHandler handler) {
    return add(error_, std::move(handler));
}

ListenerId LifecycleEvents::on_welcome(WelcomeHandler handler) {
    return add(welcome_, std::move(handler));
}

ListenerId LifecycleEvents::on_session_revoked(SessionRevokedHandler handler) {
    return add(session_revoked_, std::move(handler));
}

bool LifecycleEvents::remove(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto erase_from = [id](auto& table) {
        return std::erase_if(table, [id](const auto& entry) { return entry.first == id; }) > 0;
    };
    return erase_from(connected_)
        || erase_from(disconnected_)
        || erase_from(reconnecting_)
        || erase_from(reconnected_)
        || erase_from(error_)
        || erase_from(welcome_)
        || erase_from(session_revoked_);
}

std::size_t LifecycleEvents::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_.size() + disconnected_.size() + reconnecting_.size() + reconnected_.size()
        + error_.size() + welcome_.size() + session_revoked_.size();
}

// ─────────────────────────────────────────────────────────────────────────────
// Emission
// ─────────────────────────────────────────────────────────────────────────────

void LifecycleEvents::emit_connected() {
    NOEXPP_LOG_INFO("Connected");
    emit("connected", connected_);
}

void LifecycleEvents::emit_disconnected(std::string reason) {
    NOEXPP_LOG_INFO("Disconnected: " + reason);
    emit("disconnected", disconnected_, std::move(reason));
}

void LifecycleEvents::emit_reconnecting(std::size_t attempt) {
    emit("reconnecting", reconnecting_, attempt);
}

void LifecycleEvents::emit_reconnected() {
    NOEXPP_LOG_INFO("Reconnected");
    emit("reconnected", reconnected_);
}

void LifecycleEvents::emit_error(ClientError error) {
    emit("error", error_, std::move(error));
}

void LifecycleEvents::emit_welcome(protocol::WelcomeInfo welcome) {
    emit("welcome", welcome_, std::move(welcome));
}

void LifecycleEvents::emit_session_revoked(std::string reason) {
    NOEXPP_LOG_WARN("Session revoked: " + reason);
    emit("session_revoked", session_revoked_, std::move(reason));
}

}  // namespace noexpp
