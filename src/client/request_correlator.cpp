#include "noexpp/client/request_correlator.hpp"
#include "noexpp/log/logger.hpp"

#include <asio/bind_executor.hpp>
#include <asio/dispatch.hpp>
#include <asio/use_awaitable.hpp>

namespace noexpp {

RequestCorrelator::RequestCorrelator(
    asio::strand<asio::any_io_executor> strand,
    std::chrono::milliseconds default_timeout
)
    : strand_(std::move(strand))
    , default_timeout_(default_timeout)
{}

RequestCorrelator::~RequestCorrelator() {
    *alive_ = false;
    for (auto& [id, req] : pending_requests_) {
        req->timeout_timer->cancel();
    }
}

protocol::CorrelationId RequestCorrelator::allocate_id() {
    // Skip ids that are still in flight after a wrap-around, and never hand out 0
    while (next_id_ == 0 || pending_requests_.contains(next_id_)) {
        ++next_id_;
    }
    return next_id_++;
}

asio::awaitable<ClientResult<Json>> RequestCorrelator::send(
    ConnectionHandle connection,
    std::string operation,
    Json payload,
    std::optional<std::chrono::milliseconds> timeout
) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    if (!payload.is_null() && !payload.is_object()) {
        co_return tl::unexpected(ClientError::invalid_argument(
            "Payload for '" + operation + "' must be a JSON object"
        ));
    }

    if (!connection.valid()) {
        co_return tl::unexpected(ClientError::disconnected("Not connected"));
    }

    const auto effective_timeout = timeout.value_or(default_timeout_);
    const auto id = allocate_id();
    const auto context = LogContext::for_request(connection.generation(), id);

    auto frame = protocol::FrameCodec::encode_request(id, operation, payload);
    if (!frame) {
        NOEXPP_LOG_CTX(LogLevel::Warn, context, frame.error());
        co_return tl::unexpected(ClientError::invalid_argument(frame.error()));
    }

    auto pending = std::make_unique<PendingRequest>(strand_, operation);
    pending->deadline = std::chrono::steady_clock::now() + effective_timeout;
    auto channel = pending->channel;  // Outlives the entry if the timer erases it first

    pending->timeout_timer->expires_after(effective_timeout);
    pending->timeout_timer->async_wait(asio::bind_executor(strand_,
        [this, id, context, alive = std::weak_ptr<bool>(alive_), operation, effective_timeout](asio::error_code ec) {
            if (ec || alive.expired()) {
                return;
            }
            if (complete(id, tl::unexpected(ClientError::timeout(operation, effective_timeout)))) {
                NOEXPP_LOG_CTX(LogLevel::Warn, context, "Request " + std::to_string(id) + " (" + operation + ") timed out");
            }
        }
    ));

    pending_requests_.emplace(id, std::move(pending));
    pending_count_.fetch_add(1, std::memory_order_acq_rel);

    NOEXPP_LOG_CTX(LogLevel::Debug, context, "Sending request " + std::to_string(id) + " (" + operation + ")");

    auto send_result = co_await connection.send(std::move(*frame));
    if (!send_result) {
        complete(id, tl::unexpected(ClientError::disconnected(
            "Failed to send '" + operation + "': " + send_result.error().message
        )));
    }

    try {
        co_return co_await channel->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        complete(id, tl::unexpected(ClientError::disconnected(e.what())));
        co_return tl::unexpected(ClientError::disconnected(e.what()));
    }
}

bool RequestCorrelator::resolve(const protocol::ResponseFrame& frame) {
    ClientResult<Json> result = frame.outcome
        ? ClientResult<Json>(*frame.outcome)
        : ClientResult<Json>(tl::unexpected(ClientError::from_server(frame.outcome.error())));

    if (!complete(frame.id, std::move(result))) {
        NOEXPP_LOG_DEBUG("Ignoring response for unknown or settled request " + std::to_string(frame.id));
        return false;
    }
    return true;
}

std::size_t RequestCorrelator::reject_all(const ClientError& error) {
    auto pending = std::move(pending_requests_);
    pending_requests_.clear();
    pending_count_.store(0, std::memory_order_release);

    for (auto& [id, req] : pending) {
        req->timeout_timer->cancel();
        req->channel->try_send(asio::error_code{}, tl::unexpected(error));
    }

    if (!pending.empty()) {
        NOEXPP_LOG_INFO("Rejected " + std::to_string(pending.size()) + " pending request(s): " + error.message);
    }
    return pending.size();
}

bool RequestCorrelator::is_pending(protocol::CorrelationId id) const {
    return pending_requests_.contains(id);
}

bool RequestCorrelator::complete(protocol::CorrelationId id, ClientResult<Json> result) {
    auto it = pending_requests_.find(id);
    if (it == pending_requests_.end()) {
        return false;
    }

    auto req = std::move(it->second);
    pending_requests_.erase(it);
    pending_count_.fetch_sub(1, std::memory_order_acq_rel);

    req->timeout_timer->cancel();
    req->channel->try_send(asio::error_code{}, std::move(result));
    return true;
}

}  // namespace noexpp
