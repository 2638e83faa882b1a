#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Reconnection Controller
// ═══════════════════════════════════════════════════════════════════════════
// Drives attempts after an unexpected loss:
//
//   loop:
//     stopped?                      → Stopped
//     attempt not allowed by bound  → Exhausted
//     wait backoff(attempt)           (cancelled by stop())
//     stopped?                      → Stopped
//     try to connect
//     ok                            → attempt = 0, Reconnected
//     failed                        → attempt += 1, repeat
//
// Strand only: arm(), run() and stop() must be called on the strand the
// controller was constructed with.

#include "noexpp/client/client_error.hpp"
#include "noexpp/transport/backoff_policy.hpp"
#include "noexpp/transport/reconnect_policy.hpp"

#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace noexpp {

enum class ReconnectOutcome {
    Reconnected,
    Exhausted,
    Stopped
};

[[nodiscard]] constexpr std::string_view to_string(ReconnectOutcome outcome) noexcept {
    switch (outcome) {
        case ReconnectOutcome::Reconnected: return "Reconnected";
        case ReconnectOutcome::Exhausted:   return "Exhausted";
        case ReconnectOutcome::Stopped:     return "Stopped";
    }
    return "Unknown";
}

/// Snapshot of the controller for diagnostics
struct ReconnectState {
    std::size_t attempt{0};
    std::chrono::milliseconds current_delay{0};
    std::optional<std::size_t> max_retries;
    bool running{false};
};

class ReconnectionController {
public:
    using AttemptFn = std::function<asio::awaitable<ClientResult<void>>()>;

    struct Hooks {
        /// Before each wait; `attempt` is 1-based
        std::function<void(std::size_t attempt, std::chrono::milliseconds delay)> on_attempt_scheduled;

        /// After each failed attempt; `attempt` is 1-based
        std::function<void(std::size_t attempt, const ClientError& error)> on_attempt_failed;
    };

    ReconnectionController(
        asio::strand<asio::any_io_executor> strand,
        ReconnectPolicy policy,
        std::unique_ptr<IBackoffPolicy> backoff
    );

    ReconnectionController(const ReconnectionController&) = delete;
    ReconnectionController& operator=(const ReconnectionController&) = delete;

    /// Reset the attempt counter and clear a previous stop()
    void arm();

    [[nodiscard]] asio::awaitable<ReconnectOutcome> run(AttemptFn attempt, Hooks hooks = {});

    /// Halt immediately, including mid-delay. No further attempts are made,
    /// and a run() in flight returns Stopped even if arm() is called before it resumes.
    void stop();

    /// Delay before attempt `attempt` (0-based), or nullopt past the bound
    [[nodiscard]] std::optional<std::chrono::milliseconds> next_delay(std::size_t attempt);

    [[nodiscard]] ReconnectState state() const;
    [[nodiscard]] bool running() const noexcept { return running_; }
    [[nodiscard]] bool stopped() const noexcept { return stopped_; }
    [[nodiscard]] const ReconnectPolicy& policy() const noexcept { return policy_; }

private:
    ReconnectPolicy policy_;
    std::unique_ptr<IBackoffPolicy> backoff_;
    asio::steady_timer delay_timer_;

    std::size_t attempt_{0};
    std::chrono::milliseconds current_delay_{0};
    bool running_{false};
    bool stopped_{false};
    std::uint64_t epoch_{0};
};

}  // namespace noexpp
