#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Provider State Store
// ═══════════════════════════════════════════════════════════════════════════
// Mutable per-provider state: health record, circuit breaker, in-flight
// counter and usage. Owned by the engine and handed to each component at
// construction.
//
// Entries are created lazily on first reference and live as long as the
// store. Each entry carries its own locks and atomics, so two requests
// touching different providers never contend. Lookup uses double-checked
// locking on a shared_mutex: shared for the hot path, unique only to insert.

#include "semroute/health/health_record.hpp"
#include "semroute/registry/provider_registry.hpp"
#include "semroute/resilience/circuit_breaker.hpp"
#include "semroute/state/load_counter.hpp"
#include "semroute/state/usage_tracker.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace semroute {

struct ProviderState {
    ProviderState(
        ProviderId provider_id,
        const HealthConfig& health_config,
        const CircuitBreakerConfig& circuit_config,
        double cost_per_unit,
        std::optional<double> budget
    )
        : id(std::move(provider_id))
        , health(health_config)
        , circuit(circuit_config)
        , usage(cost_per_unit, budget)
    {}

    const ProviderId id;
    HealthTracker health;
    CircuitBreaker circuit;
    LoadCounter load;
    UsageTracker usage;
};

using ProviderStatePtr = std::shared_ptr<ProviderState>;

/// Point-in-time copy of everything the router scores on
struct ProviderSnapshot {
    ProviderDescriptor descriptor;
    HealthRecord health;
    CircuitSnapshot circuit;
    std::uint32_t in_flight{0};
    bool over_budget{false};
};

class ProviderStateStore {
public:
    using CircuitListener = std::function<void(const ProviderId&, CircuitState, CircuitState)>;

    ProviderStateStore(HealthConfig health_config, CircuitBreakerConfig circuit_config);

    ProviderStateStore(const ProviderStateStore&) = delete;
    ProviderStateStore& operator=(const ProviderStateStore&) = delete;

    /// Get or create the state entry for a provider
    [[nodiscard]] ProviderStatePtr state_for(const ProviderDescriptor& descriptor);

    /// Existing entry, or nullptr if the provider was never referenced
    [[nodiscard]] ProviderStatePtr find(const ProviderId& id) const;

    /// Copy the scoring inputs of one provider. Locks are held only while
    /// copying each field.
    [[nodiscard]] ProviderSnapshot snapshot(const ProviderDescriptor& descriptor);

    /// Observe circuit transitions of every provider, current and future
    void on_circuit_change(CircuitListener listener);

    [[nodiscard]] std::vector<ProviderStatePtr> entries() const;

    [[nodiscard]] const HealthConfig& health_config() const noexcept { return health_config_; }
    [[nodiscard]] const CircuitBreakerConfig& circuit_config() const noexcept { return circuit_config_; }

private:
    void notify_circuit_change(const ProviderId& id, CircuitState old_state, CircuitState new_state);

    const HealthConfig health_config_;
    const CircuitBreakerConfig circuit_config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ProviderId, ProviderStatePtr, ProviderIdHash> states_;

    std::mutex listeners_mutex_;
    std::vector<CircuitListener> listeners_;
};

}  // namespace semroute
