#include "semroute/state/provider_state_store.hpp"
#include "semroute/log/logger.hpp"

#include <format>

namespace semroute {

ProviderStateStore::ProviderStateStore(
    HealthConfig health_config,
    CircuitBreakerConfig circuit_config
)
    : health_config_(std::move(health_config))
    , circuit_config_(std::move(circuit_config))
{}

ProviderStatePtr ProviderStateStore::state_for(const ProviderDescriptor& descriptor) {
    const auto& id = descriptor.id;

    // Fast path: already created
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto it = states_.find(id);
        if (it != states_.end()) {
            return it->second;
        }
    }

    auto created = std::make_shared<ProviderState>(
        id,
        health_config_,
        circuit_config_,
        descriptor.cost_per_unit,
        descriptor.budget
    );

    // The store outlives every entry, so capturing `this` is safe
    created->circuit.on_state_change([this, id](CircuitState old_state, CircuitState new_state) {
        notify_circuit_change(id, old_state, new_state);
    });

    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Either ours or the racing creator's
    return states_.try_emplace(id, std::move(created)).first->second;
}

ProviderStatePtr ProviderStateStore::find(const ProviderId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = states_.find(id);
    if (it == states_.end()) {
        return nullptr;
    }
    return it->second;
}

ProviderSnapshot ProviderStateStore::snapshot(const ProviderDescriptor& descriptor) {
    const auto state = state_for(descriptor);
    return ProviderSnapshot{
        .descriptor = descriptor,
        .health = state->health.snapshot(),
        .circuit = state->circuit.snapshot(),
        .in_flight = state->load.in_flight(),
        .over_budget = state->usage.over_budget()
    };
}

void ProviderStateStore::on_circuit_change(CircuitListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

std::vector<ProviderStatePtr> ProviderStateStore::entries() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ProviderStatePtr> out;
    out.reserve(states_.size());
    for (const auto& [id, state] : states_) {
        out.push_back(state);
    }
    return out;
}

void ProviderStateStore::notify_circuit_change(
    const ProviderId& id,
    CircuitState old_state,
    CircuitState new_state
) {
    if (new_state == CircuitState::Open) {
        SEMROUTE_LOG_WARN("circuit", std::format(
            "{}: {} -> {}", id.to_string(), to_string(old_state), to_string(new_state)));
    } else {
        SEMROUTE_LOG_INFO("circuit", std::format(
            "{}: {} -> {}", id.to_string(), to_string(old_state), to_string(new_state)));
    }

    std::vector<CircuitListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(id, old_state, new_state);
    }
}

}  // namespace semroute
