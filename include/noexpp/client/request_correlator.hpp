#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Request Correlator
// ═══════════════════════════════════════════════════════════════════════════
// Matches responses to in-flight requests over a single socket.
//
// Every request gets a correlation id, a single-slot response channel and a
// deadline timer. The first of {response, deadline, rejection} to arrive
// removes the entry and fills the channel; anything later finds no entry and
// is dropped. Nothing is ever retried.
//
// All bookkeeping happens on the strand passed at construction; send() hops
// onto it before touching the table.

#include "noexpp/client/client_error.hpp"
#include "noexpp/protocol/frame.hpp"
#include "noexpp/transport/connection.hpp"

#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace noexpp {

class RequestCorrelator {
public:
    RequestCorrelator(
        asio::strand<asio::any_io_executor> strand,
        std::chrono::milliseconds default_timeout
    );

    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// Send one request over `connection` and wait for its single resolution.
    [[nodiscard]] asio::awaitable<ClientResult<Json>> send(
        ConnectionHandle connection,
        std::string operation,
        Json payload,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// Deliver a response frame. Returns false if no request is waiting on it.
    bool resolve(const protocol::ResponseFrame& frame);

    /// Fail every pending request with `error`. Returns how many were failed.
    std::size_t reject_all(const ClientError& error);

    [[nodiscard]] std::size_t pending_count() const noexcept {
        return pending_count_.load(std::memory_order_acquire);
    }

    /// Strand only
    [[nodiscard]] bool is_pending(protocol::CorrelationId id) const;

    [[nodiscard]] std::chrono::milliseconds default_timeout() const noexcept { return default_timeout_; }

private:
    using ResponseChannel = asio::experimental::channel<void(asio::error_code, ClientResult<Json>)>;

    struct PendingRequest {
        std::shared_ptr<ResponseChannel> channel;
        std::unique_ptr<asio::steady_timer> timeout_timer;
        std::string operation;
        std::chrono::steady_clock::time_point deadline;

        PendingRequest(asio::any_io_executor exec, std::string op)
            : channel(std::make_shared<ResponseChannel>(exec, 1))
            , timeout_timer(std::make_unique<asio::steady_timer>(exec))
            , operation(std::move(op))
        {}
    };

    protocol::CorrelationId allocate_id();
    bool complete(protocol::CorrelationId id, ClientResult<Json> result);

    asio::strand<asio::any_io_executor> strand_;
    std::chrono::milliseconds default_timeout_;

    protocol::CorrelationId next_id_{1};
    std::unordered_map<protocol::CorrelationId, std::unique_ptr<PendingRequest>> pending_requests_;
    std::atomic<std::size_t> pending_count_{0};

    // Timer handlers check this before touching the table
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace noexpp
