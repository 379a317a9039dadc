#ifndef SEMROUTE_CONFIG_ENGINE_CONFIG_HPP
#define SEMROUTE_CONFIG_ENGINE_CONFIG_HPP

#include "semroute/core/errors.hpp"
#include "semroute/health/health_record.hpp"
#include "semroute/registry/provider_registry.hpp"
#include "semroute/resilience/circuit_breaker.hpp"
#include "semroute/routing/failover_coordinator.hpp"
#include "semroute/routing/router.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <vector>

namespace semroute {

// ─────────────────────────────────────────────────────────────────────────────
// Engine Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Every global tunable of the engine. Defaults come from config/defaults.hpp.
//
// JSON layout (all keys optional, durations in milliseconds):
//
//   {
//     "health":   { "probe_interval_ms": 10000, "probe_timeout_ms": 2000,
//                   "probe_jitter": 0.2, "fail_threshold": 3,
//                   "success_threshold": 2, "latency_ewma_alpha": 0.3,
//                   "stale_after_intervals": 3, "watchdog_interval_ms": 5000,
//                   "probe_respawn_delay_ms": 1000 },
//     "circuit":  { "open_threshold": 5, "base_cooldown_ms": 5000,
//                   "max_cooldown_ms": 300000 },
//     "router":   { "quality_weight": 0.6, "latency_weight": 0.3,
//                   "load_weight": 0.1, "preference_weight": 0.0, ... },
//     "failover": { "max_attempts": 3, "attempt_timeout_ms": 10000,
//                   "request_deadline_ms": 30000, "min_attempt_budget_ms": 10 }
//   }

struct EngineConfig {
    HealthConfig health;
    CircuitBreakerConfig circuit;
    RouterConfig router;
    FailoverConfig failover;

    /// Parse a configuration document. Missing keys keep their defaults;
    /// a key of the wrong JSON type is a ParseError. Does not validate ranges.
    [[nodiscard]] static ConfigResult<EngineConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;

    /// Check every value against its allowed range
    [[nodiscard]] ConfigResult<void> validate() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-style configuration
    // ─────────────────────────────────────────────────────────────────────────

    EngineConfig& with_health(HealthConfig config);
    EngineConfig& with_circuit_breaker(CircuitBreakerConfig config);
    EngineConfig& with_router(RouterConfig config);
    EngineConfig& with_failover(FailoverConfig config);

    EngineConfig& with_probe_interval(std::chrono::milliseconds interval, std::chrono::milliseconds timeout);
    EngineConfig& with_thresholds(std::size_t fail_threshold, std::size_t success_threshold);
    EngineConfig& with_cooldown(std::chrono::milliseconds base, std::chrono::milliseconds max);
    EngineConfig& with_router_weights(double quality, double latency, double load, double preference = 0.0);
    EngineConfig& with_max_attempts(std::size_t attempts);
    EngineConfig& with_attempt_timeout(std::chrono::milliseconds timeout);
    EngineConfig& with_request_deadline(std::chrono::milliseconds deadline);
};

// ─────────────────────────────────────────────────────────────────────────────
// Provider Catalog
// ─────────────────────────────────────────────────────────────────────────────
// Parses an array of provider entries:
//
//   [ { "name": "openai", "capability": "embedding", "weight": 1.0,
//       "quality": 0.9, "cost_per_unit": 0.00002, "cost_unit": "token",
//       "budget": 50.0 }, ... ]
//
// "name" and "capability" are required. Every entry is range-checked the
// same way register_provider() does.

[[nodiscard]] ConfigResult<std::vector<ProviderDescriptor>> load_provider_descriptors(
    const nlohmann::json& catalog
);

}  // namespace semroute

#endif  // SEMROUTE_CONFIG_ENGINE_CONFIG_HPP
