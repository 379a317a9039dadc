#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Router
// ═══════════════════════════════════════════════════════════════════════════
// Ranks the providers of one capability for one request. Reads registry and
// state store, never mutates either and never calls a provider.
//
//   1. snapshot every provider (per-field locks only, released before scoring)
//   2. drop providers whose breaker rejects everyone right now
//   3. score = w_quality    * max(0, quality - penalties)
//            + w_latency    * 1 / (1 + ewma_latency_seconds)
//            + w_load       * 1 / (1 + in_flight)
//            + w_preference * weight
//   4. sort by score descending, provider name ascending on ties
//
// Penalties on the quality term depend on health status (Unknown < Degraded
// < Unhealthy) plus an extra penalty once a provider has exceeded its budget.
// A provider with no latency observation borrows the best EWMA among the
// eligible candidates, so a cold provider is neither favoured nor punished on
// latency. The cold estimate only applies when no candidate has an EWMA.

#include "semroute/config/defaults.hpp"
#include "semroute/core/errors.hpp"
#include "semroute/health/health_record.hpp"
#include "semroute/registry/provider_registry.hpp"
#include "semroute/resilience/circuit_breaker.hpp"
#include "semroute/state/provider_state_store.hpp"

#include <chrono>
#include <optional>
#include <vector>

namespace semroute {

// ─────────────────────────────────────────────────────────────────────────────
// Router Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct RouterConfig {
    // Blend weights; must be non-negative and sum to 1
    double quality_weight{defaults::kQualityWeight};
    double latency_weight{defaults::kLatencyWeight};
    double load_weight{defaults::kLoadWeight};
    double preference_weight{defaults::kPreferenceWeight};

    // Subtracted from declared quality
    double unknown_quality_penalty{defaults::kUnknownQualityPenalty};
    double degraded_quality_penalty{defaults::kDegradedQualityPenalty};
    double unhealthy_quality_penalty{defaults::kUnhealthyQualityPenalty};
    double over_budget_penalty{defaults::kOverBudgetPenalty};

    /// Latency assumed for a provider with no successful observation yet when
    /// no other candidate has one either
    double cold_latency_estimate_seconds{defaults::kColdLatencyEstimateSeconds};

    [[nodiscard]] double weight_sum() const noexcept {
        return quality_weight + latency_weight + load_weight + preference_weight;
    }

    [[nodiscard]] double health_penalty(HealthStatus status) const noexcept;
};

// ─────────────────────────────────────────────────────────────────────────────
// Ranking Output
// ─────────────────────────────────────────────────────────────────────────────

/// Weighted contribution of each signal; terms already include their weight
struct ScoreBreakdown {
    double quality_term{0.0};
    double latency_term{0.0};
    double load_term{0.0};
    double preference_term{0.0};

    /// Total subtracted from declared quality before weighting
    double quality_penalty{0.0};

    /// Latency (seconds) the latency term was computed from
    double latency_seconds{0.0};

    double total{0.0};
};

struct RankedCandidate {
    ProviderId provider;
    double score{0.0};
    ScoreBreakdown breakdown;
    HealthStatus health{HealthStatus::Unknown};
    CircuitState circuit{CircuitState::Closed};
};

// ─────────────────────────────────────────────────────────────────────────────
// Router
// ─────────────────────────────────────────────────────────────────────────────

class Router {
public:
    using Clock = std::chrono::steady_clock;

    Router(const ProviderRegistry& registry, ProviderStateStore& store, RouterConfig config = {});

    /// Ranked candidates for a capability. UnknownCapability when nothing is
    /// registered for it; an empty list when every breaker rejects.
    [[nodiscard]] RegistryResult<std::vector<RankedCandidate>> rank(
        Capability capability,
        Clock::time_point now = Clock::now()
    ) const;

    /// Same as above with per-request weights in place of the router's own
    [[nodiscard]] RegistryResult<std::vector<RankedCandidate>> rank(
        Capability capability,
        const RouterConfig& config,
        Clock::time_point now = Clock::now()
    ) const;

    [[nodiscard]] const RouterConfig& config() const noexcept { return config_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Pure scoring (no registry, no store)
    // ─────────────────────────────────────────────────────────────────────────

    /// `neutral_latency_seconds` stands in for a missing EWMA; without it the
    /// configured cold estimate is used.
    [[nodiscard]] static ScoreBreakdown score(
        const ProviderSnapshot& snapshot,
        const RouterConfig& config,
        std::optional<double> neutral_latency_seconds = std::nullopt
    );

    /// Filter and order already-taken snapshots. Identical inputs always give
    /// identical output.
    [[nodiscard]] static std::vector<RankedCandidate> rank_snapshots(
        const std::vector<ProviderSnapshot>& snapshots,
        const RouterConfig& config,
        Clock::time_point now
    );

private:
    const ProviderRegistry& registry_;
    ProviderStateStore& store_;
    RouterConfig config_;
};

}  // namespace semroute
