#include "semroute/routing/router.hpp"
#include "semroute/log/logger.hpp"

#include <algorithm>
#include <format>

namespace semroute {

double RouterConfig::health_penalty(HealthStatus status) const noexcept {
    switch (status) {
        case HealthStatus::Healthy:   return 0.0;
        case HealthStatus::Unknown:   return unknown_quality_penalty;
        case HealthStatus::Degraded:  return degraded_quality_penalty;
        case HealthStatus::Unhealthy: return unhealthy_quality_penalty;
    }
    return unknown_quality_penalty;
}

Router::Router(const ProviderRegistry& registry, ProviderStateStore& store, RouterConfig config)
    : registry_(registry)
    , store_(store)
    , config_(std::move(config))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Scoring
// ─────────────────────────────────────────────────────────────────────────────

ScoreBreakdown Router::score(
    const ProviderSnapshot& snapshot,
    const RouterConfig& config,
    std::optional<double> neutral_latency_seconds
) {
    ScoreBreakdown out;

    out.quality_penalty = config.health_penalty(snapshot.health.status);
    if (snapshot.over_budget) {
        out.quality_penalty += config.over_budget_penalty;
    }
    const double quality = std::max(0.0, snapshot.descriptor.quality - out.quality_penalty);
    out.quality_term = config.quality_weight * quality;

    out.latency_seconds = snapshot.health.latency_ewma_seconds.value_or(
        neutral_latency_seconds.value_or(config.cold_latency_estimate_seconds));
    out.latency_term = config.latency_weight * (1.0 / (1.0 + out.latency_seconds));

    out.load_term = config.load_weight * (1.0 / (1.0 + static_cast<double>(snapshot.in_flight)));

    out.preference_term = config.preference_weight * snapshot.descriptor.weight;

    out.total = out.quality_term + out.latency_term + out.load_term + out.preference_term;
    return out;
}

std::vector<RankedCandidate> Router::rank_snapshots(
    const std::vector<ProviderSnapshot>& snapshots,
    const RouterConfig& config,
    Clock::time_point now
) {
    std::vector<const ProviderSnapshot*> eligible;
    eligible.reserve(snapshots.size());
    std::optional<double> best_latency;

    for (const auto& snapshot : snapshots) {
        if (snapshot.circuit.rejects_all(now)) {
            SEMROUTE_LOG_TRACE("router", std::format(
                "{} filtered: circuit {}",
                snapshot.descriptor.id.to_string(),
                to_string(snapshot.circuit.state)
            ));
            continue;
        }
        eligible.push_back(&snapshot);

        const auto& latency = snapshot.health.latency_ewma_seconds;
        if (latency && (!best_latency || *latency < *best_latency)) {
            best_latency = latency;
        }
    }

    std::vector<RankedCandidate> ranked;
    ranked.reserve(eligible.size());

    for (const auto* candidate : eligible) {
        const auto& snapshot = *candidate;
        const auto breakdown = score(snapshot, config, best_latency);
        ranked.push_back(RankedCandidate{
            .provider = snapshot.descriptor.id,
            .score = breakdown.total,
            .breakdown = breakdown,
            .health = snapshot.health.status,
            .circuit = snapshot.circuit.state,
        });
    }

    std::sort(ranked.begin(), ranked.end(), [](const RankedCandidate& a, const RankedCandidate& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.provider.name < b.provider.name;
    });

    return ranked;
}

// ─────────────────────────────────────────────────────────────────────────────
// Ranking
// ─────────────────────────────────────────────────────────────────────────────

RegistryResult<std::vector<RankedCandidate>> Router::rank(
    Capability capability,
    Clock::time_point now
) const {
    return rank(capability, config_, now);
}

RegistryResult<std::vector<RankedCandidate>> Router::rank(
    Capability capability,
    const RouterConfig& config,
    Clock::time_point now
) const {
    auto providers = registry_.providers(capability);
    if (!providers) {
        return tl::unexpected(providers.error());
    }

    std::vector<ProviderSnapshot> snapshots;
    snapshots.reserve(providers->size());
    for (const auto& provider : *providers) {
        snapshots.push_back(store_.snapshot(provider->descriptor));
    }

    auto ranked = rank_snapshots(snapshots, config, now);

    if (get_logger().should_log(LogLevel::Trace)) {
        for (const auto& candidate : ranked) {
            get_logger().write_fmt(
                LogLevel::Trace, "router",
                "{} score={:.4f} (q={:.4f} l={:.4f} load={:.4f} p={:.4f})",
                candidate.provider.to_string(),
                candidate.score,
                candidate.breakdown.quality_term,
                candidate.breakdown.latency_term,
                candidate.breakdown.load_term,
                candidate.breakdown.preference_term
            );
        }
    }

    return ranked;
}

}  // namespace semroute
