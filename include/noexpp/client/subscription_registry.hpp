#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Subscription Registry
// ═══════════════════════════════════════════════════════════════════════════
// Reactive subscriptions keyed by a client-local handle that lives as long as
// the logical session. The server-assigned id is valid for one physical
// connection only: it is dropped when the connection goes away and reissued
// by resubscribe_all() after the next welcome.
//
// Push frames are delivered synchronously, in arrival order, from the frame
// dispatch step. Callbacks must not block.

#include "noexpp/client/client_error.hpp"
#include "noexpp/client/request_sender.hpp"
#include "noexpp/protocol/frame.hpp"

#include <asio/awaitable.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace noexpp {

using SubscriptionHandle = std::uint64_t;
using SubscriptionCallback = std::function<void(const Json& data)>;

/// The remote call that establishes (and cancels) one subscription
struct SubscriptionRequest {
    std::string subscribe_operation{"store.subscribe"};
    std::string unsubscribe_operation{"store.unsubscribe"};
    Json payload = Json::object();

    /// store.subscribe {query, params}
    [[nodiscard]] static SubscriptionRequest query(std::string name, Json params = nullptr);

    /// rules.subscribe {pattern}
    [[nodiscard]] static SubscriptionRequest rules(std::string pattern);
};

struct Subscription {
    SubscriptionHandle handle{0};
    std::string server_id;
    Json data;  ///< Initial result set, already delivered to the callback
};

struct ResyncReport {
    std::size_t resubscribed{0};
    std::vector<std::pair<SubscriptionHandle, ClientError>> failed;  ///< Dropped from the registry
    std::size_t deferred{0};  ///< Connection lost mid-resync; kept for the next reconnect
};

class SubscriptionRegistry {
public:
    SubscriptionRegistry(asio::strand<asio::any_io_executor> strand, IRequestSender& sender);

    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    /// Issue the subscribe call, register the callback and hand it the
    /// initial data. A callback that throws on the initial data undoes the
    /// subscription.
    [[nodiscard]] asio::awaitable<ClientResult<Subscription>> subscribe(
        SubscriptionRequest request,
        SubscriptionCallback callback
    );

    /// Remove locally right away; the server-side cancel is best effort.
    /// Returns false for an unknown handle.
    bool unsubscribe(SubscriptionHandle handle);

    /// Route a push frame. Returns false if no subscription owns its id.
    bool handle_push(const protocol::PushFrame& push);

    /// Forget all server ids (the connection they belonged to is gone)
    void release_server_ids();

    /// Re-establish every subscription on the current connection, concurrently.
    /// Each surviving callback receives the fresh data exactly once.
    [[nodiscard]] asio::awaitable<ResyncReport> resubscribe_all();

    /// Drop everything, nothing is kept for replay
    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool contains(SubscriptionHandle handle) const;
    [[nodiscard]] std::optional<std::string> server_id(SubscriptionHandle handle) const;

private:
    struct Entry {
        SubscriptionRequest request;
        SubscriptionCallback callback;
        std::optional<std::string> server_id;
    };

    asio::awaitable<void> resubscribe_one(
        SubscriptionHandle handle,
        SubscriptionRequest request,
        std::shared_ptr<ResyncReport> report
    );

    void cancel_on_server(std::string operation, std::string server_id);
    void drop(SubscriptionHandle handle);

    /// Returns the exception message if the callback threw
    static std::optional<std::string> invoke_callback(
        SubscriptionHandle handle,
        const SubscriptionCallback& callback,
        const Json& data
    );

    asio::strand<asio::any_io_executor> strand_;
    IRequestSender& sender_;

    mutable std::mutex mutex_;
    std::unordered_map<SubscriptionHandle, Entry> entries_;
    std::unordered_map<std::string, SubscriptionHandle> by_server_id_;
    std::atomic<SubscriptionHandle> next_handle_{1};
};

}  // namespace noexpp
