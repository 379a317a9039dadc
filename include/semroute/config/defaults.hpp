#ifndef SEMROUTE_CONFIG_DEFAULTS_HPP
#define SEMROUTE_CONFIG_DEFAULTS_HPP

// ─────────────────────────────────────────────────────────────────────────────
// Engine Defaults
// ─────────────────────────────────────────────────────────────────────────────
// Every tunable used by the engine. Config structs use these as default
// member initializers; nothing else in the tree hardcodes a threshold,
// timeout or weight.

#include <chrono>
#include <cstddef>

namespace semroute::defaults {

using namespace std::chrono_literals;

// ─────────────────────────────────────────────────────────────────────────────
// Health Monitor
// ─────────────────────────────────────────────────────────────────────────────

// Mean delay between two probes of the same provider.
inline constexpr std::chrono::milliseconds kProbeInterval{10s};

// Probe budget. Must stay below kProbeInterval.
inline constexpr std::chrono::milliseconds kProbeTimeout{2s};

// Each sleep is drawn uniformly from interval * [1 - jitter, 1 + jitter].
inline constexpr double kProbeJitter{0.2};

// Consecutive failures before a provider is marked Unhealthy.
inline constexpr std::size_t kFailThreshold{3};

// Consecutive successes before a provider is marked Healthy.
inline constexpr std::size_t kSuccessThreshold{2};

// Weight of the newest latency sample in the EWMA.
inline constexpr double kLatencyEwmaAlpha{0.3};

// A record with no observation for this many probe intervals loses one notch.
inline constexpr std::size_t kStaleAfterIntervals{3};

// How often the staleness watchdog scans all records.
inline constexpr std::chrono::milliseconds kWatchdogInterval{5s};

// Delay before a crashed probe task is spawned again.
inline constexpr std::chrono::milliseconds kProbeRespawnDelay{1s};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker
// ─────────────────────────────────────────────────────────────────────────────

// Consecutive real-call failures that open a closed circuit.
inline constexpr std::size_t kOpenThreshold{5};

// Cooldown after the first opening; doubles on every failed trial.
inline constexpr std::chrono::milliseconds kBaseCooldown{5s};

// Upper bound for the doubled cooldown.
inline constexpr std::chrono::milliseconds kMaxCooldown{5min};

// ─────────────────────────────────────────────────────────────────────────────
// Router
// ─────────────────────────────────────────────────────────────────────────────
// The four weights must sum to 1.

inline constexpr double kQualityWeight{0.6};
inline constexpr double kLatencyWeight{0.3};
inline constexpr double kLoadWeight{0.1};
inline constexpr double kPreferenceWeight{0.0};

// Tolerance used when checking the weight sum.
inline constexpr double kWeightSumTolerance{1e-6};

// Subtracted from declared quality according to observed health.
inline constexpr double kUnknownQualityPenalty{0.10};
inline constexpr double kDegradedQualityPenalty{0.25};
inline constexpr double kUnhealthyQualityPenalty{0.50};

// Subtracted from declared quality once a provider exceeds its budget.
inline constexpr double kOverBudgetPenalty{0.30};

// Latency (seconds) assumed for providers that were never observed.
inline constexpr double kColdLatencyEstimateSeconds{1.0};

// ─────────────────────────────────────────────────────────────────────────────
// Failover Coordinator
// ─────────────────────────────────────────────────────────────────────────────

// Dispatched attempts per request. Circuit rejections do not count.
inline constexpr std::size_t kMaxAttempts{3};

// Upper bound for one dispatched attempt.
inline constexpr std::chrono::milliseconds kAttemptTimeout{10s};

// Total budget of execute() when the caller gives no deadline.
inline constexpr std::chrono::milliseconds kRequestDeadline{30s};

// No attempt is started with less remaining budget than this.
inline constexpr std::chrono::milliseconds kMinAttemptBudget{10ms};

}  // namespace semroute::defaults

#endif  // SEMROUTE_CONFIG_DEFAULTS_HPP
