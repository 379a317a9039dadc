#include "semroute/engine/routing_engine.hpp"
#include "semroute/log/logger.hpp"

#include <format>
#include <stdexcept>

namespace semroute {
namespace {

EngineConfig validated(EngineConfig config) {
    if (auto valid = config.validate(); !valid) {
        throw std::invalid_argument("Invalid engine configuration: " + valid.error().message);
    }
    return config;
}

}  // namespace

RoutingEngine::RoutingEngine(
    asio::any_io_executor executor,
    EngineConfig config,
    std::shared_ptr<IRoutingObserver> observer
)
    : config_(validated(std::move(config)))
    , store_(config_.health, config_.circuit)
    , monitor_(std::move(executor), registry_, store_, config_.health)
    , router_(registry_, store_, config_.router)
    , coordinator_(registry_, store_, router_, monitor_, config_.failover, std::move(observer))
{}

RoutingEngine::~RoutingEngine() = default;

// ─────────────────────────────────────────────────────────────────────────────
// Setup & Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

RegistryResult<void> RoutingEngine::register_provider(
    ProviderDescriptor descriptor,
    std::shared_ptr<IBackendClient> client
) {
    const auto id = descriptor.id;
    auto added = registry_.register_provider(std::move(descriptor), std::move(client));
    if (!added) {
        SEMROUTE_LOG_ERROR("engine", std::format("Registration failed: {}", added.error().message));
        return added;
    }

    auto provider = registry_.find(id);
    (void)store_.state_for(provider->descriptor);
    monitor_.watch(std::move(provider));
    return added;
}

void RoutingEngine::start() {
    SEMROUTE_LOG_INFO("engine", std::format("Starting with {} providers", registry_.size()));
    monitor_.start();
}

void RoutingEngine::stop() {
    SEMROUTE_LOG_INFO("engine", "Stopping");
    monitor_.stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<RoutingResult<RoutedResponse>> RoutingEngine::execute(
    Capability capability,
    BackendRequest request
) {
    return coordinator_.execute(capability, std::move(request));
}

asio::awaitable<RoutingResult<RoutedResponse>> RoutingEngine::execute(
    Capability capability,
    BackendRequest request,
    Clock::time_point deadline
) {
    return coordinator_.execute(capability, std::move(request), deadline);
}

asio::awaitable<RoutingResult<RoutedResponse>> RoutingEngine::execute(
    Capability capability,
    BackendRequest request,
    Clock::time_point deadline,
    RouterConfig weights
) {
    return coordinator_.execute(capability, std::move(request), deadline, std::move(weights));
}

RegistryResult<std::vector<RankedCandidate>> RoutingEngine::rank(Capability capability) const {
    return router_.rank(capability);
}

std::optional<HealthStatus> RoutingEngine::record_call_outcome(
    const ProviderId& provider,
    bool success,
    std::chrono::microseconds latency,
    std::string error
) {
    return monitor_.record_call_outcome(provider, success, latency, std::move(error));
}

// ─────────────────────────────────────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────────────────────────────────────

EngineStatus RoutingEngine::status() const {
    EngineStatus out;
    out.running = monitor_.is_running();

    for (const auto& provider : registry_.all()) {
        auto state = store_.state_for(provider->descriptor);

        ProviderStatus entry;
        entry.descriptor = provider->descriptor;
        entry.health = state->health.snapshot();
        entry.circuit = state->circuit.snapshot();
        entry.circuit_stats = state->circuit.stats();
        entry.in_flight = state->load.in_flight();
        entry.usage = state->usage.snapshot();

        out.total_cost += entry.usage.total_cost;
        out.providers.push_back(std::move(entry));
    }

    return out;
}

nlohmann::json EngineStatus::to_json() const {
    auto list = nlohmann::json::array();

    for (const auto& p : providers) {
        nlohmann::json health{
            {"status", std::string(to_string(p.health.status))},
            {"consecutive_successes", p.health.consecutive_successes},
            {"consecutive_failures", p.health.consecutive_failures},
            {"observations", p.health.total_observations},
        };
        health["latency_ewma_ms"] = p.health.latency_ewma_seconds
            ? nlohmann::json(*p.health.latency_ewma_seconds * 1000.0)
            : nlohmann::json(nullptr);
        health["last_error"] = p.health.last_error
            ? nlohmann::json(*p.health.last_error)
            : nlohmann::json(nullptr);

        nlohmann::json usage{
            {"dispatched", p.usage.dispatched},
            {"succeeded", p.usage.succeeded},
            {"failed", p.usage.failed},
            {"circuit_rejections", p.usage.circuit_rejections},
            {"units", p.usage.units},
            {"total_cost", p.usage.total_cost},
            {"over_budget", p.usage.over_budget()},
        };
        usage["budget"] = p.usage.budget ? nlohmann::json(*p.usage.budget) : nlohmann::json(nullptr);

        list.push_back({
            {"name", p.descriptor.id.name},
            {"capability", std::string(to_string(p.descriptor.id.capability))},
            {"weight", p.descriptor.weight},
            {"quality", p.descriptor.quality},
            {"cost_per_unit", p.descriptor.cost_per_unit},
            {"cost_unit", p.descriptor.cost_unit},
            {"health", std::move(health)},
            {"circuit", {
                {"state", std::string(to_string(p.circuit.state))},
                {"failure_count", p.circuit.failure_count},
                {"consecutive_opens", p.circuit.consecutive_opens},
                {"cooldown_ms", p.circuit.cooldown.count()},
                {"rejected", p.circuit_stats.rejected_requests},
            }},
            {"in_flight", p.in_flight},
            {"usage", std::move(usage)},
        });
    }

    return nlohmann::json{
        {"running", running},
        {"total_cost", total_cost},
        {"providers", std::move(list)},
    };
}

}  // namespace semroute
