#include "noexpp/client/subscription_registry.hpp"
#include "noexpp/log/logger.hpp"

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/dispatch.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/use_awaitable.hpp>

namespace noexpp {

namespace {

std::optional<std::string> extract_server_id(const Json& result) {
    if (!result.is_object()) {
        return std::nullopt;
    }
    auto it = result.find("subscriptionId");
    if (it == result.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

SubscriptionRequest SubscriptionRequest::query(std::string name, Json params) {
    SubscriptionRequest request;
    request.payload = Json{{"query", std::move(name)}};
    if (!params.is_null()) {
        request.payload["params"] = std::move(params);
    }
    return request;
}

SubscriptionRequest SubscriptionRequest::rules(std::string pattern) {
    SubscriptionRequest request;
    request.subscribe_operation = "rules.subscribe";
    request.unsubscribe_operation = "rules.unsubscribe";
    request.payload = Json{{"pattern", std::move(pattern)}};
    return request;
}

SubscriptionRegistry::SubscriptionRegistry(asio::strand<asio::any_io_executor> strand, IRequestSender& sender)
    : strand_(std::move(strand))
    , sender_(sender)
{}

// ═══════════════════════════════════════════════════════════════════════════
// Subscribe / Unsubscribe
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<Subscription>> SubscriptionRegistry::subscribe(
    SubscriptionRequest request,
    SubscriptionCallback callback
) {
    if (!callback) {
        co_return tl::unexpected(ClientError::invalid_argument("Subscription callback must not be empty"));
    }

    auto result = co_await sender_.request(request.subscribe_operation, request.payload);
    if (!result) {
        co_return tl::unexpected(result.error());
    }

    auto server_id = extract_server_id(*result);
    if (!server_id) {
        co_return tl::unexpected(ClientError::protocol_error(
            "Response to '" + request.subscribe_operation + "' carries no subscriptionId"
        ));
    }

    const auto handle = next_handle_.fetch_add(1, std::memory_order_relaxed);
    const auto unsubscribe_operation = request.unsubscribe_operation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.emplace(handle, Entry{std::move(request), callback, *server_id});
        by_server_id_[*server_id] = handle;
    }

    NOEXPP_LOG_DEBUG("Subscription " + std::to_string(handle) + " registered as " + *server_id);

    Json data = result->value("data", Json());
    if (auto failure = invoke_callback(handle, callback, data)) {
        drop(handle);
        cancel_on_server(unsubscribe_operation, *server_id);
        co_return tl::unexpected(ClientError::invalid_argument(
            "Subscription callback threw on initial data: " + *failure
        ));
    }

    co_return Subscription{handle, std::move(*server_id), std::move(data)};
}

bool SubscriptionRegistry::unsubscribe(SubscriptionHandle handle) {
    std::optional<std::string> server_id;
    std::string operation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(handle);
        if (it == entries_.end()) {
            return false;
        }
        server_id = it->second.server_id;
        operation = it->second.request.unsubscribe_operation;
        if (server_id) {
            by_server_id_.erase(*server_id);
        }
        entries_.erase(it);
    }

    NOEXPP_LOG_DEBUG("Subscription " + std::to_string(handle) + " removed");

    if (server_id) {
        cancel_on_server(std::move(operation), std::move(*server_id));
    }
    return true;
}

void SubscriptionRegistry::cancel_on_server(std::string operation, std::string server_id) {
    asio::co_spawn(strand_,
        [this, operation = std::move(operation), server_id = std::move(server_id)]() -> asio::awaitable<void> {
            auto result = co_await sender_.request(operation, Json{{"subscriptionId", server_id}});
            if (!result) {
                NOEXPP_LOG_DEBUG("Server-side cancel of " + server_id + " failed: " + result.error().message);
            }
        },
        asio::detached
    );
}

void SubscriptionRegistry::drop(SubscriptionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return;
    }
    if (it->second.server_id) {
        by_server_id_.erase(*it->second.server_id);
    }
    entries_.erase(it);
}

// ═══════════════════════════════════════════════════════════════════════════
// Push Delivery
// ═══════════════════════════════════════════════════════════════════════════

bool SubscriptionRegistry::handle_push(const protocol::PushFrame& push) {
    SubscriptionHandle handle = 0;
    SubscriptionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto index = by_server_id_.find(push.subscription_id);
        if (index == by_server_id_.end()) {
            return false;
        }
        handle = index->second;
        auto it = entries_.find(handle);
        if (it == entries_.end()) {
            return false;
        }
        callback = it->second.callback;
    }

    // Unlocked so the callback may unsubscribe
    invoke_callback(handle, callback, push.data);
    return true;
}

std::optional<std::string> SubscriptionRegistry::invoke_callback(
    SubscriptionHandle handle,
    const SubscriptionCallback& callback,
    const Json& data
) {
    try {
        callback(data);
    } catch (const std::exception& e) {
        NOEXPP_LOG_ERROR("Subscription " + std::to_string(handle) + " callback threw: " + e.what());
        return std::string(e.what());
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Resync
// ═══════════════════════════════════════════════════════════════════════════

void SubscriptionRegistry::release_server_ids() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [handle, entry] : entries_) {
        entry.server_id.reset();
    }
    by_server_id_.clear();
}

asio::awaitable<ResyncReport> SubscriptionRegistry::resubscribe_all() {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    std::vector<std::pair<SubscriptionHandle, SubscriptionRequest>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(entries_.size());
        for (auto& [handle, entry] : entries_) {
            entry.server_id.reset();
            snapshot.emplace_back(handle, entry.request);
        }
        by_server_id_.clear();
    }

    if (snapshot.empty()) {
        co_return ResyncReport{};
    }

    NOEXPP_LOG_INFO("Resubscribing " + std::to_string(snapshot.size()) + " subscription(s)");

    using DoneChannel = asio::experimental::channel<void(asio::error_code)>;
    auto report = std::make_shared<ResyncReport>();
    auto done = std::make_shared<DoneChannel>(strand_, snapshot.size());

    // Each resubscribe runs on its own so one slow or failing call does not hold up the rest
    for (auto& [handle, request] : snapshot) {
        asio::co_spawn(strand_,
            resubscribe_one(handle, std::move(request), report),
            [done, handle](std::exception_ptr ep) {
                if (ep) {
                    NOEXPP_LOG_ERROR("Resubscribe of " + std::to_string(handle) + " ended with an exception");
                }
                done->try_send(asio::error_code{});
            }
        );
    }

    for (std::size_t i = 0; i < snapshot.size(); ++i) {
        co_await done->async_receive(asio::use_awaitable);
    }

    co_return std::move(*report);
}

asio::awaitable<void> SubscriptionRegistry::resubscribe_one(
    SubscriptionHandle handle,
    SubscriptionRequest request,
    std::shared_ptr<ResyncReport> report
) {
    auto result = co_await sender_.request(request.subscribe_operation, request.payload);

    std::optional<std::string> server_id;
    if (result) {
        server_id = extract_server_id(*result);
        if (!server_id) {
            result = tl::unexpected(ClientError::protocol_error(
                "Response to '" + request.subscribe_operation + "' carries no subscriptionId"
            ));
        }
    }

    if (!result && result.error().code == ClientErrorCode::Disconnected) {
        // Server id is already released, so the next resync picks this entry up again
        NOEXPP_LOG_WARN("Resubscribe of " + std::to_string(handle) + " interrupted by connection loss: " +
                        result.error().message);
        ++report->deferred;
        co_return;
    }

    if (!result) {
        NOEXPP_LOG_ERROR("Dropping subscription " + std::to_string(handle) + " after failed resubscribe: " +
                         result.error().message);
        drop(handle);
        report->failed.emplace_back(handle, result.error());
        co_return;
    }

    SubscriptionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(handle);
        if (it != entries_.end()) {
            it->second.server_id = *server_id;
            by_server_id_[*server_id] = handle;
            callback = it->second.callback;
        }
    }

    if (!callback) {
        // Unsubscribed while the call was in flight
        cancel_on_server(request.unsubscribe_operation, *server_id);
        co_return;
    }

    ++report->resubscribed;
    invoke_callback(handle, callback, result->value("data", Json()));
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

void SubscriptionRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    by_server_id_.clear();
}

std::size_t SubscriptionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool SubscriptionRegistry::contains(SubscriptionHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(handle);
}

std::optional<std::string> SubscriptionRegistry::server_id(SubscriptionHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.server_id;
}

}  // namespace noexpp
