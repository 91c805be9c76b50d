#ifndef TOOLMUX_TRANSPORT_BACKOFF_POLICY_HPP
#define TOOLMUX_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Delay before the next connection attempt. `attempt` is 0 for the first
// retry after a failure.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    virtual void reset() = 0;
};

struct BackoffConfig {
    std::chrono::milliseconds base{500};
    double multiplier{2.0};
    std::chrono::milliseconds max{30'000};
    double jitter{0.25};               // 0.25 = delay scaled by a factor in [0.75, 1.25]
    std::optional<std::uint32_t> seed; // fixed seed for reproducible delays
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
//   delay(n) = min(base * multiplier^n, max) * U(1 - jitter, 1 + jitter)
//
// With the defaults: 500ms, 1s, 2s, 4s, ... capped at 30s.

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff() : ExponentialBackoff(BackoffConfig{}) {}

    explicit ExponentialBackoff(BackoffConfig config)
        : config_(config)
        , rng_(config.seed.has_value() ? *config.seed : std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double grown = static_cast<double>(config_.base.count())
                           * std::pow(config_.multiplier, static_cast<double>(attempt));
        const double capped = std::min(grown, static_cast<double>(config_.max.count()));

        double scaled = capped;
        if (config_.jitter > 0.0) {
            std::uniform_real_distribution<double> factor(1.0 - config_.jitter, 1.0 + config_.jitter);
            scaled = capped * factor(rng_);
        }
        return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, scaled))};
    }

    void reset() override {}

    [[nodiscard]] const BackoffConfig& config() const noexcept { return config_; }

private:
    BackoffConfig config_;
    std::mt19937 rng_;
};

// Zero delay; tests use it to reconnect immediately.
class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }

    void reset() override {}
};

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

}  // namespace toolmux

#endif  // TOOLMUX_TRANSPORT_BACKOFF_POLICY_HPP
