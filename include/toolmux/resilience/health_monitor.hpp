#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Health Monitor
// ═══════════════════════════════════════════════════════════════════════════
// Liveness bookkeeping for one connection. The connection's probe loop sends
// the pings; this class only counts outcomes and says what they mean.
//
//   ┌─────────┐  miss_threshold    ┌──────────┐  failure_threshold  ┌──────┐
//   │ Healthy │ ──────────────────▶│ Degraded │ ───────────────────▶│ Fail │
//   └────▲────┘  consecutive       └────┬─────┘  consecutive        └──────┘
//        │       misses                 │        misses
//        └──────────────────────────────┘
//                 probe ok (Recovered)
//
// Usage:
//   HealthMonitor monitor(HealthConfig{.miss_threshold = 3});
//   switch (monitor.record_miss()) {
//       case ProbeVerdict::Degrade: /* Ready -> Degraded */ break;
//       case ProbeVerdict::Fail:    /* -> Disconnected, reconnect */ break;
//       default: break;
//   }
//   co_await sleep(monitor.next_interval());

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string_view>

namespace toolmux {

struct HealthConfig {
    /// Run the probe loop at all
    bool enabled{true};

    /// Probe period while Ready
    std::chrono::milliseconds interval{std::chrono::seconds(15)};

    /// Probe period while Degraded; shorter than `interval`
    std::chrono::milliseconds degraded_interval{std::chrono::seconds(3)};

    /// Deadline of a single ping
    std::chrono::milliseconds probe_timeout{std::chrono::seconds(5)};

    /// Consecutive misses that demote Ready to Degraded
    std::size_t miss_threshold{3};

    /// Consecutive misses that force a reconnect
    std::size_t failure_threshold{6};
};

enum class ProbeVerdict {
    Alive,      ///< Success while healthy
    Recovered,  ///< Success while degraded: go back to Ready
    Missed,     ///< Miss below every threshold
    Degrade,    ///< Miss that crossed miss_threshold
    Fail        ///< Miss that crossed failure_threshold
};

[[nodiscard]] constexpr std::string_view to_string(ProbeVerdict verdict) noexcept {
    switch (verdict) {
        case ProbeVerdict::Alive:     return "Alive";
        case ProbeVerdict::Recovered: return "Recovered";
        case ProbeVerdict::Missed:    return "Missed";
        case ProbeVerdict::Degrade:   return "Degrade";
        case ProbeVerdict::Fail:      return "Fail";
    }
    return "Unknown";
}

struct HealthStats {
    std::size_t total_probes{0};
    std::size_t total_misses{0};
    std::size_t consecutive_misses{0};
    bool degraded{false};
    std::optional<std::chrono::steady_clock::time_point> last_check;
    std::optional<std::chrono::steady_clock::time_point> last_success;
};

class HealthMonitor {
public:
    HealthMonitor() = default;
    explicit HealthMonitor(HealthConfig config);

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;
    HealthMonitor(HealthMonitor&&) = delete;
    HealthMonitor& operator=(HealthMonitor&&) = delete;

    ProbeVerdict record_success();
    ProbeVerdict record_miss();

    /// Degraded without a probe miss, e.g. after a malformed frame.
    void mark_degraded();

    /// Forget counters for a fresh connection generation. Totals survive.
    void reset();

    [[nodiscard]] std::chrono::milliseconds next_interval() const;
    [[nodiscard]] bool is_degraded() const;
    [[nodiscard]] std::size_t consecutive_misses() const;
    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> last_check() const;
    [[nodiscard]] HealthStats stats() const;

    [[nodiscard]] const HealthConfig& config() const noexcept { return config_; }

private:
    HealthConfig config_;

    mutable std::mutex mutex_;
    bool degraded_{false};
    std::size_t consecutive_misses_{0};
    std::size_t total_probes_{0};
    std::size_t total_misses_{0};
    std::optional<std::chrono::steady_clock::time_point> last_check_;
    std::optional<std::chrono::steady_clock::time_point> last_success_;
};

}  // namespace toolmux
