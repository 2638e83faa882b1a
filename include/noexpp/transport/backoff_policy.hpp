#ifndef NOEXPP_TRANSPORT_BACKOFF_POLICY_HPP
#define NOEXPP_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace noexpp {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// How long to wait before reconnect attempt `attempt` (0 = first attempt after
// the connection was lost). The attempt bound lives in ReconnectPolicy.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = min(initial * multiplier^attempt, max) + uniform(0, jitter)
//
// With initial=1s, multiplier=2, max=30s, jitter=500ms:
//   Attempt 0:  1000ms + [0, 500]
//   Attempt 1:  2000ms + [0, 500]
//   Attempt 2:  4000ms + [0, 500]
//   Attempt 5+: 30000ms + [0, 500]
//
// The jitter is added after the cap, so the worst case is max + jitter.

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{1000},
              2.0,
              std::chrono::milliseconds{30'000},
              std::chrono::milliseconds{500}
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds initial,
        double multiplier,
        std::chrono::milliseconds max,
        std::chrono::milliseconds jitter,
        std::optional<std::uint32_t> seed = std::nullopt
    )
        : initial_(initial)
        , multiplier_(multiplier)
        , max_(max)
        , jitter_(jitter)
        , rng_(seed ? *seed : std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double exponent = static_cast<double>(attempt);
        const double initial_ms = static_cast<double>(initial_.count());
        const double delay_ms = initial_ms * std::pow(multiplier_, exponent);

        const double max_ms = static_cast<double>(max_.count());
        const double capped_ms = std::min(delay_ms, max_ms);

        const double jittered_ms = capped_ms + random_jitter();

        const auto result_ms = static_cast<std::int64_t>(std::max(0.0, jittered_ms));
        return std::chrono::milliseconds{result_ms};
    }

    void reset() override {}

    [[nodiscard]] std::chrono::milliseconds initial() const noexcept { return initial_; }
    [[nodiscard]] std::chrono::milliseconds max() const noexcept { return max_; }
    [[nodiscard]] std::chrono::milliseconds jitter() const noexcept { return jitter_; }
    [[nodiscard]] double multiplier() const noexcept { return multiplier_; }

private:
    double random_jitter() {
        if (jitter_.count() <= 0) {
            return 0.0;
        }
        std::uniform_real_distribution<double> dist(0.0, static_cast<double>(jitter_.count()));
        return dist(rng_);
    }

    std::chrono::milliseconds initial_;
    double multiplier_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds jitter_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return delay_;
    }

    void reset() override {}

private:
    std::chrono::milliseconds delay_;
};

}  // namespace noexpp

#endif  // NOEXPP_TRANSPORT_BACKOFF_POLICY_HPP
