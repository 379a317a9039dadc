// ─────────────────────────────────────────────────────────────────────────────
// Router Tests
// ─────────────────────────────────────────────────────────────────────────────
// Scoring, filtering and ordering of candidates.

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "semroute/routing/router.hpp"
#include "mocks/mock_backend.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace semroute;
using namespace semroute::testing;
using namespace std::chrono_literals;
using Catch::Approx;

namespace {

using Clock = Router::Clock;

ProviderSnapshot snapshot_of(
    const std::string& name,
    double quality,
    HealthStatus status,
    std::optional<double> latency_seconds,
    std::uint32_t in_flight = 0
) {
    ProviderSnapshot snap;
    snap.descriptor.id = ProviderId{Capability::Embedding, name};
    snap.descriptor.quality = quality;
    snap.health.status = status;
    snap.health.latency_ewma_seconds = latency_seconds;
    snap.in_flight = in_flight;
    return snap;
}

std::vector<std::string> names(const std::vector<RankedCandidate>& ranked) {
    std::vector<std::string> out;
    for (const auto& candidate : ranked) {
        out.push_back(candidate.provider.name);
    }
    return out;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Scoring
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Router score blends weighted terms", "[router]") {
    const RouterConfig config;
    const auto breakdown = Router::score(
        snapshot_of("a", 0.9, HealthStatus::Healthy, 0.050), config);

    REQUIRE(breakdown.quality_term == Approx(0.6 * 0.9));
    REQUIRE(breakdown.latency_term == Approx(0.3 / 1.05));
    REQUIRE(breakdown.load_term == Approx(0.1));
    REQUIRE(breakdown.preference_term == Approx(0.0));
    REQUIRE(breakdown.quality_penalty == Approx(0.0));
    REQUIRE(breakdown.total == Approx(0.54 + 0.3 / 1.05 + 0.1));
}

TEST_CASE("Router penalties never push quality below zero", "[router]") {
    RouterConfig config;
    const auto breakdown = Router::score(
        snapshot_of("weak", 0.2, HealthStatus::Unhealthy, 0.1), config);

    REQUIRE(breakdown.quality_penalty == Approx(config.unhealthy_quality_penalty));
    REQUIRE(breakdown.quality_term == Approx(0.0));
}

TEST_CASE("Router unknown latency uses the cold estimate", "[router]") {
    RouterConfig config;
    config.cold_latency_estimate_seconds = 1.0;
    const auto breakdown = Router::score(
        snapshot_of("cold", 0.5, HealthStatus::Unknown, std::nullopt), config);

    REQUIRE(breakdown.latency_seconds == Approx(1.0));
    REQUIRE(breakdown.latency_term == Approx(0.3 * 0.5));
}

// ═══════════════════════════════════════════════════════════════════════════
// Ranking
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Router filters open circuits and ranks by blended score", "[router]") {
    const auto now = Clock::now();

    auto a = snapshot_of("A", 0.9, HealthStatus::Healthy, 0.050);
    auto b = snapshot_of("B", 0.7, HealthStatus::Healthy, 0.010);
    auto c = snapshot_of("C", 0.9, HealthStatus::Healthy, 0.010);
    c.circuit.state = CircuitState::Open;
    c.circuit.opened_at = now;
    c.circuit.cooldown = 5s;

    const auto ranked = Router::rank_snapshots({c, b, a}, RouterConfig{}, now);

    REQUIRE(names(ranked) == std::vector<std::string>{"A", "B"});
    REQUIRE(ranked[0].score > ranked[1].score);
}

TEST_CASE("Router ranking is deterministic", "[router]") {
    const auto now = Clock::now();
    std::vector<ProviderSnapshot> snaps{
        snapshot_of("delta", 0.6, HealthStatus::Healthy, 0.2, 3),
        snapshot_of("alpha", 0.8, HealthStatus::Degraded, 0.1, 0),
        snapshot_of("gamma", 0.7, HealthStatus::Unknown, std::nullopt, 1),
        snapshot_of("beta", 0.9, HealthStatus::Unhealthy, 0.5, 2),
    };

    const auto first = Router::rank_snapshots(snaps, RouterConfig{}, now);
    std::reverse(snaps.begin(), snaps.end());
    const auto second = Router::rank_snapshots(snaps, RouterConfig{}, now);

    REQUIRE(names(first) == names(second));
    for (std::size_t i = 0; i < first.size(); ++i) {
        REQUIRE(first[i].score == second[i].score);
    }
}

TEST_CASE("Router breaks score ties by provider name", "[router]") {
    const auto now = Clock::now();
    const auto ranked = Router::rank_snapshots({
        snapshot_of("zeta", 0.8, HealthStatus::Healthy, 0.1),
        snapshot_of("alpha", 0.8, HealthStatus::Healthy, 0.1),
        snapshot_of("mu", 0.8, HealthStatus::Healthy, 0.1),
    }, RouterConfig{}, now);

    REQUIRE(names(ranked) == std::vector<std::string>{"alpha", "mu", "zeta"});
}

TEST_CASE("Router places Unknown between Healthy and Degraded", "[router]") {
    const auto now = Clock::now();
    // Same declared quality and latency isolates the penalty
    const auto ranked = Router::rank_snapshots({
        snapshot_of("degraded", 0.8, HealthStatus::Degraded, 1.0),
        snapshot_of("unknown", 0.8, HealthStatus::Unknown, std::nullopt),
        snapshot_of("healthy", 0.8, HealthStatus::Healthy, 1.0),
    }, RouterConfig{}, now);

    REQUIRE(names(ranked) == std::vector<std::string>{"healthy", "unknown", "degraded"});
}

TEST_CASE("Router cold provider borrows the best observed latency", "[router]") {
    const auto now = Clock::now();
    const auto ranked = Router::rank_snapshots({
        snapshot_of("degraded", 0.8, HealthStatus::Degraded, 0.010),
        snapshot_of("unknown", 0.8, HealthStatus::Unknown, std::nullopt),
        snapshot_of("healthy", 0.8, HealthStatus::Healthy, 0.050),
    }, RouterConfig{}, now);

    REQUIRE(names(ranked) == std::vector<std::string>{"healthy", "unknown", "degraded"});
    REQUIRE(ranked[1].breakdown.latency_seconds == Approx(0.010));
    REQUIRE(ranked[1].breakdown.latency_term == Approx(ranked[2].breakdown.latency_term));
}

TEST_CASE("Router ignores filtered providers when borrowing latency", "[router]") {
    const auto now = Clock::now();
    auto open = snapshot_of("open", 0.8, HealthStatus::Healthy, 0.001);
    open.circuit.state = CircuitState::Open;
    open.circuit.opened_at = now;
    open.circuit.cooldown = 5s;

    const auto ranked = Router::rank_snapshots({
        open,
        snapshot_of("cold", 0.8, HealthStatus::Unknown, std::nullopt),
        snapshot_of("warm", 0.8, HealthStatus::Healthy, 0.200),
    }, RouterConfig{}, now);

    REQUIRE(names(ranked) == std::vector<std::string>{"warm", "cold"});
    REQUIRE(ranked[1].breakdown.latency_seconds == Approx(0.200));
}

TEST_CASE("Router falls back to the cold estimate when nothing is observed", "[router]") {
    const auto now = Clock::now();
    RouterConfig config;
    config.cold_latency_estimate_seconds = 0.5;

    const auto ranked = Router::rank_snapshots({
        snapshot_of("a", 0.8, HealthStatus::Unknown, std::nullopt),
        snapshot_of("b", 0.8, HealthStatus::Unknown, std::nullopt),
    }, config, now);

    REQUIRE(ranked.size() == 2);
    REQUIRE(ranked[0].breakdown.latency_seconds == Approx(0.5));
    REQUIRE(ranked[1].breakdown.latency_seconds == Approx(0.5));
}

TEST_CASE("Router keeps unhealthy providers as last resort", "[router]") {
    const auto now = Clock::now();
    const auto ranked = Router::rank_snapshots({
        snapshot_of("sick", 0.9, HealthStatus::Unhealthy, 0.1),
        snapshot_of("fine", 0.9, HealthStatus::Healthy, 0.1),
    }, RouterConfig{}, now);

    REQUIRE(names(ranked) == std::vector<std::string>{"fine", "sick"});
}

TEST_CASE("Router prefers less loaded providers", "[router]") {
    const auto now = Clock::now();
    const auto ranked = Router::rank_snapshots({
        snapshot_of("busy", 0.8, HealthStatus::Healthy, 0.1, 9),
        snapshot_of("idle", 0.8, HealthStatus::Healthy, 0.1, 0),
    }, RouterConfig{}, now);

    REQUIRE(names(ranked) == std::vector<std::string>{"idle", "busy"});
    REQUIRE(ranked[1].breakdown.load_term == Approx(0.1 / 10.0));
}

TEST_CASE("Router penalizes providers over budget", "[router]") {
    const auto now = Clock::now();
    auto spender = snapshot_of("spender", 0.9, HealthStatus::Healthy, 0.1);
    spender.over_budget = true;

    const auto ranked = Router::rank_snapshots({
        spender,
        snapshot_of("thrifty", 0.7, HealthStatus::Healthy, 0.1),
    }, RouterConfig{}, now);

    REQUIRE(names(ranked) == std::vector<std::string>{"thrifty", "spender"});
}

TEST_CASE("Router circuit eligibility", "[router]") {
    const auto now = Clock::now();

    auto cooled = snapshot_of("cooled", 0.8, HealthStatus::Healthy, 0.1);
    cooled.circuit.state = CircuitState::Open;
    cooled.circuit.opened_at = now - 10s;
    cooled.circuit.cooldown = 5s;

    auto trial_free = snapshot_of("trial_free", 0.8, HealthStatus::Healthy, 0.1);
    trial_free.circuit.state = CircuitState::HalfOpen;

    auto trial_taken = snapshot_of("trial_taken", 0.8, HealthStatus::Healthy, 0.1);
    trial_taken.circuit.state = CircuitState::HalfOpen;
    trial_taken.circuit.half_open_probe_in_flight = true;

    const auto ranked = Router::rank_snapshots({cooled, trial_free, trial_taken}, RouterConfig{}, now);

    REQUIRE(names(ranked) == std::vector<std::string>{"cooled", "trial_free"});
}

// ═══════════════════════════════════════════════════════════════════════════
// Registry-backed ranking
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Router rank reads registry and state store", "[router]") {
    ProviderRegistry registry;
    ProviderStateStore store(HealthConfig{}, CircuitBreakerConfig{.open_threshold = 1});
    Router router(registry, store);

    auto backend = std::make_shared<MockBackend>();
    for (const auto* name : {"one", "two", "three"}) {
        REQUIRE(registry.register_provider(
            ProviderDescriptor{.id = {Capability::Embedding, name}, .quality = 0.5}, backend));
    }

    SECTION("unregistered capability") {
        const auto ranked = router.rank(Capability::VectorStore);
        REQUIRE_FALSE(ranked.has_value());
        REQUIRE(ranked.error().code == RegistryError::Code::UnknownCapability);
    }

    SECTION("open circuit is filtered") {
        auto state = store.state_for(*registry.list(Capability::Embedding).begin());
        state->circuit.record_failure(state->circuit.try_acquire());
        REQUIRE(state->circuit.state() == CircuitState::Open);

        const auto ranked = router.rank(Capability::Embedding);
        REQUIRE(ranked.has_value());
        REQUIRE(names(*ranked) == std::vector<std::string>{"three", "two"});
    }

    SECTION("per-request config overrides the router's weights") {
        const auto listed = registry.list(Capability::Embedding);
        store.state_for(listed[0])->health.observe_success(ObservationSource::Call, 900ms);
        store.state_for(listed[1])->health.observe_success(ObservationSource::Call, 10ms);

        RouterConfig latency_only;
        latency_only.quality_weight = 0.0;
        latency_only.latency_weight = 1.0;
        latency_only.load_weight = 0.0;
        latency_only.preference_weight = 0.0;

        const auto ranked = router.rank(Capability::Embedding, latency_only);
        REQUIRE(ranked.has_value());
        REQUIRE(ranked->size() == 3);
        REQUIRE(ranked->back().provider == listed[0].id);
        REQUIRE(ranked->front().breakdown.quality_term == Approx(0.0));
        REQUIRE(router.config().quality_weight == Approx(RouterConfig{}.quality_weight));
    }

    SECTION("rank does not mutate state") {
        const auto before = store.snapshot(registry.list(Capability::Embedding)[0]);
        (void)router.rank(Capability::Embedding);
        (void)router.rank(Capability::Embedding);
        const auto after = store.snapshot(registry.list(Capability::Embedding)[0]);

        REQUIRE(before.health.total_observations == after.health.total_observations);
        REQUIRE(before.in_flight == after.in_flight);
        REQUIRE(store.find(ProviderId{Capability::Embedding, "one"})->circuit.stats().admitted_requests == 0);
    }
}
