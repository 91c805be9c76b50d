#include "toolmux/resilience/health_monitor.hpp"

#include <algorithm>

namespace toolmux {

HealthMonitor::HealthMonitor(HealthConfig config)
    : config_(config)
{
    config_.miss_threshold = std::max<std::size_t>(config_.miss_threshold, 1);
    config_.failure_threshold = std::max(config_.failure_threshold, config_.miss_threshold);
}

// ─────────────────────────────────────────────────────────────────────────────
// Outcomes
// ─────────────────────────────────────────────────────────────────────────────

ProbeVerdict HealthMonitor::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = std::chrono::steady_clock::now();
    ++total_probes_;
    last_check_ = now;
    last_success_ = now;
    consecutive_misses_ = 0;

    if (degraded_) {
        degraded_ = false;
        return ProbeVerdict::Recovered;
    }
    return ProbeVerdict::Alive;
}

ProbeVerdict HealthMonitor::record_miss() {
    std::lock_guard<std::mutex> lock(mutex_);

    ++total_probes_;
    ++total_misses_;
    ++consecutive_misses_;
    last_check_ = std::chrono::steady_clock::now();

    if (consecutive_misses_ >= config_.failure_threshold) {
        return ProbeVerdict::Fail;
    }
    if (!degraded_ && (consecutive_misses_ >= config_.miss_threshold)) {
        degraded_ = true;
        return ProbeVerdict::Degrade;
    }
    return ProbeVerdict::Missed;
}

void HealthMonitor::mark_degraded() {
    std::lock_guard<std::mutex> lock(mutex_);
    degraded_ = true;
}

void HealthMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    degraded_ = false;
    consecutive_misses_ = 0;
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

std::chrono::milliseconds HealthMonitor::next_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_ ? config_.degraded_interval : config_.interval;
}

bool HealthMonitor::is_degraded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return degraded_;
}

std::size_t HealthMonitor::consecutive_misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_misses_;
}

std::optional<std::chrono::steady_clock::time_point> HealthMonitor::last_check() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_check_;
}

HealthStats HealthMonitor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return HealthStats{
        total_probes_,
        total_misses_,
        consecutive_misses_,
        degraded_,
        last_check_,
        last_success_
    };
}

}  // namespace toolmux
