#include "noexpp/transport/reconnection_controller.hpp"
#include "noexpp/log/logger.hpp"

#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

namespace noexpp {

ReconnectionController::ReconnectionController(
    asio::strand<asio::any_io_executor> strand,
    ReconnectPolicy policy,
    std::unique_ptr<IBackoffPolicy> backoff
)
    : policy_(std::move(policy))
    , backoff_(backoff ? std::move(backoff) : std::make_unique<ExponentialBackoff>())
    , delay_timer_(std::move(strand))
{}

void ReconnectionController::arm() {
    stopped_ = false;
    attempt_ = 0;
    current_delay_ = std::chrono::milliseconds{0};
    backoff_->reset();
}

std::optional<std::chrono::milliseconds> ReconnectionController::next_delay(std::size_t attempt) {
    if (!policy_.allows_attempt(attempt)) {
        return std::nullopt;
    }
    return backoff_->next_delay(attempt);
}

asio::awaitable<ReconnectOutcome> ReconnectionController::run(AttemptFn attempt, Hooks hooks) {
    // A stop() bumps the epoch, so a run that was stopped and then re-armed
    // still ends as Stopped when it resumes.
    const auto epoch = epoch_;
    auto halted = [this, epoch] { return stopped_ || epoch != epoch_; };
    auto finish = [this, epoch] {
        if (epoch == epoch_) {
            running_ = false;
        }
    };

    running_ = true;

    while (true) {
        if (halted()) {
            break;
        }

        auto delay = next_delay(attempt_);
        if (!delay) {
            NOEXPP_LOG_ERROR("Giving up after " + std::to_string(attempt_) + " reconnect attempt(s)");
            finish();
            co_return ReconnectOutcome::Exhausted;
        }
        current_delay_ = *delay;

        NOEXPP_LOG_INFO("Reconnect attempt " + std::to_string(attempt_ + 1) + " in " +
                        std::to_string(delay->count()) + "ms");
        if (hooks.on_attempt_scheduled) {
            hooks.on_attempt_scheduled(attempt_ + 1, *delay);
        }

        delay_timer_.expires_after(*delay);
        asio::error_code ec;
        co_await delay_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));

        if (halted()) {
            break;
        }

        auto result = co_await attempt();

        if (halted()) {
            break;
        }

        if (result) {
            attempt_ = 0;
            current_delay_ = std::chrono::milliseconds{0};
            backoff_->reset();
            finish();
            co_return ReconnectOutcome::Reconnected;
        }

        ++attempt_;
        NOEXPP_LOG_WARN("Reconnect attempt " + std::to_string(attempt_) + " failed: " + result.error().message);
        if (hooks.on_attempt_failed) {
            hooks.on_attempt_failed(attempt_, result.error());
        }
    }

    NOEXPP_LOG_INFO("Reconnection stopped");
    finish();
    co_return ReconnectOutcome::Stopped;
}

void ReconnectionController::stop() {
    stopped_ = true;
    running_ = false;
    ++epoch_;
    delay_timer_.cancel();
}

ReconnectState ReconnectionController::state() const {
    return ReconnectState{attempt_, current_delay_, policy_.max_retries(), running_};
}

}  // namespace noexpp
