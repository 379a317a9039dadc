#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Health Record
// ═══════════════════════════════════════════════════════════════════════════
// Per-provider reachability view with hysteresis.
//
//            success x success_threshold
//   Unknown ──────────────────────────────▶ Healthy
//      │                                    │   ▲
//      │ failure                    failure │   │ success x success_threshold
//      ▼                                    ▼   │
//   Degraded ◀──────────────────────────────    │
//      │                                        │
//      │ failure x fail_threshold               │
//      ▼                                        │
//   Unhealthy ──────────────────────────────────┘
//
// A single failure never moves a provider straight from Healthy to
// Unhealthy. Probes and real call outcomes feed the same update.

#include "semroute/config/defaults.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace semroute {

enum class HealthStatus : std::uint8_t {
    Unknown,    ///< Never observed
    Healthy,
    Degraded,   ///< Recent failure, or stale Healthy
    Unhealthy   ///< fail_threshold consecutive failures
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Unknown:   return "Unknown";
        case HealthStatus::Healthy:   return "Healthy";
        case HealthStatus::Degraded:  return "Degraded";
        case HealthStatus::Unhealthy: return "Unhealthy";
    }
    return "Unknown";
}

/// Where an observation came from
enum class ObservationSource : std::uint8_t {
    Probe,
    Call
};

// ─────────────────────────────────────────────────────────────────────────────
// Health Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct HealthConfig {
    std::chrono::milliseconds probe_interval{defaults::kProbeInterval};
    std::chrono::milliseconds probe_timeout{defaults::kProbeTimeout};
    double probe_jitter{defaults::kProbeJitter};

    std::size_t fail_threshold{defaults::kFailThreshold};
    std::size_t success_threshold{defaults::kSuccessThreshold};

    double latency_ewma_alpha{defaults::kLatencyEwmaAlpha};

    std::size_t stale_after_intervals{defaults::kStaleAfterIntervals};
    std::chrono::milliseconds watchdog_interval{defaults::kWatchdogInterval};
    std::chrono::milliseconds probe_respawn_delay{defaults::kProbeRespawnDelay};

    /// Age after which a record is considered stale
    [[nodiscard]] std::chrono::milliseconds stale_after() const noexcept {
        return probe_interval * static_cast<std::int64_t>(stale_after_intervals);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Health Record (snapshot)
// ─────────────────────────────────────────────────────────────────────────────

struct HealthRecord {
    using Clock = std::chrono::steady_clock;

    HealthStatus status{HealthStatus::Unknown};
    std::size_t consecutive_successes{0};
    std::size_t consecutive_failures{0};

    /// Smoothed latency in seconds; empty until the first success
    std::optional<double> latency_ewma_seconds;

    /// Last probe or call observation. Empty until first observed.
    std::optional<Clock::time_point> last_probe_at;

    /// Most recent failure reason, kept for diagnostics
    std::optional<std::string> last_error;

    ObservationSource last_source{ObservationSource::Probe};
    std::uint64_t total_observations{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// Health Tracker
// ─────────────────────────────────────────────────────────────────────────────
// Owns one HealthRecord behind its own mutex. Every observe() call counts as
// exactly one observation.

class HealthTracker {
public:
    using Clock = HealthRecord::Clock;

    explicit HealthTracker(HealthConfig config);

    HealthTracker(const HealthTracker&) = delete;
    HealthTracker& operator=(const HealthTracker&) = delete;

    /// Apply a successful observation and return the resulting status
    HealthStatus observe_success(
        ObservationSource source,
        std::chrono::microseconds latency,
        Clock::time_point now = Clock::now()
    );

    /// Apply a failed observation and return the resulting status
    HealthStatus observe_failure(
        ObservationSource source,
        std::string reason,
        Clock::time_point now = Clock::now()
    );

    /// Drop one notch if nothing was observed within stale_after().
    /// Returns the new status when a demotion happened.
    std::optional<HealthStatus> degrade_if_stale(Clock::time_point now = Clock::now());

    [[nodiscard]] HealthRecord snapshot() const;

    [[nodiscard]] HealthStatus status() const;

private:
    HealthConfig config_;

    mutable std::mutex mutex_;
    HealthRecord record_;

    // Start of the current staleness window (last observation or last demotion)
    std::optional<Clock::time_point> stale_window_start_;
};

}  // namespace semroute
