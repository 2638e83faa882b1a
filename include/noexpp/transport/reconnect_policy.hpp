#ifndef NOEXPP_TRANSPORT_RECONNECT_POLICY_HPP
#define NOEXPP_TRANSPORT_RECONNECT_POLICY_HPP

#include "noexpp/client/client_config.hpp"
#include "noexpp/transport.hpp"

#include <cstddef>
#include <optional>
#include <set>

namespace noexpp {

// ─────────────────────────────────────────────────────────────────────────────
// ReconnectPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides *whether* a lost connection is worth another attempt; IBackoffPolicy
// decides how long to wait first.
//
// Never reconnect when:
// - reconnection is disabled
// - the peer closed with a non-retryable close code (1003, 4002, 4003 by default)
// - the session was revoked and reconnect_after_session_revoked is off
// - the attempt bound has been reached

class ReconnectPolicy {
public:
    ReconnectPolicy() = default;

    explicit ReconnectPolicy(const ReconnectConfig& config)
        : enabled_(config.enabled)
        , max_retries_(config.max_retries)
        , non_retryable_close_codes_(config.non_retryable_close_codes)
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration (Builder Pattern)
    // ─────────────────────────────────────────────────────────────────────────

    ReconnectPolicy& with_enabled(bool enabled) {
        enabled_ = enabled;
        return *this;
    }

    /// std::nullopt = unbounded
    ReconnectPolicy& with_max_retries(std::optional<std::size_t> max_retries) {
        max_retries_ = max_retries;
        return *this;
    }

    ReconnectPolicy& with_non_retryable_close_code(int code) {
        non_retryable_close_codes_.insert(code);
        return *this;
    }

    ReconnectPolicy& without_non_retryable_close_code(int code) {
        non_retryable_close_codes_.erase(code);
        return *this;
    }

    ReconnectPolicy& with_reconnect_after_revocation(bool enable) {
        reconnect_after_revocation_ = enable;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Query Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }

    [[nodiscard]] std::optional<std::size_t> max_retries() const noexcept { return max_retries_; }

    [[nodiscard]] bool is_retryable_close_code(int code) const {
        return !non_retryable_close_codes_.contains(code);
    }

    /// Should the loss of an established connection start reconnecting?
    [[nodiscard]] bool should_reconnect(const TransportError& error, bool session_revoked) const {
        if (enabled_ == false) {
            return false;
        }
        if (error.close_code && !is_retryable_close_code(*error.close_code)) {
            return false;
        }
        if (session_revoked && reconnect_after_revocation_ == false) {
            return false;
        }
        return true;
    }

    /// May attempt number `attempt` (0-based) be made?
    [[nodiscard]] bool allows_attempt(std::size_t attempt) const noexcept {
        return !max_retries_ || attempt < *max_retries_;
    }

private:
    bool enabled_{true};
    std::optional<std::size_t> max_retries_;
    std::set<int> non_retryable_close_codes_{1003, 4002, 4003};
    bool reconnect_after_revocation_{false};
};

}  // namespace noexpp

#endif  // NOEXPP_TRANSPORT_RECONNECT_POLICY_HPP
