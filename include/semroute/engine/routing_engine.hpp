#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Routing Engine
// ═══════════════════════════════════════════════════════════════════════════
// Facade owning every engine component:
//
//   ProviderRegistry ─┐
//   ProviderStateStore├─▶ Router ─▶ FailoverCoordinator ─▶ execute()
//   HealthMonitor ────┘
//
// Construct once at startup, register providers, start(), then call
// execute() from any coroutine on the executor. Registration errors are
// meant to abort startup.
//
// Usage:
//   asio::io_context io;
//   RoutingEngine engine(io.get_executor(), EngineConfig{}.with_max_attempts(3));
//   engine.register_provider(openai_descriptor, openai_client).value();
//   engine.start();
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto result = co_await engine.execute(Capability::Embedding, request);
//       ...
//   }, asio::detached);
//
// Note: stop() only requests cancellation. Let the executor drain (or stop
// it) before destroying the engine.

#include "semroute/backend/backend_client.hpp"
#include "semroute/config/engine_config.hpp"
#include "semroute/health/health_monitor.hpp"
#include "semroute/registry/provider_registry.hpp"
#include "semroute/routing/failover_coordinator.hpp"
#include "semroute/routing/router.hpp"
#include "semroute/routing/routing_observer.hpp"
#include "semroute/state/provider_state_store.hpp"
#include "semroute/state/usage_tracker.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace semroute {

// ─────────────────────────────────────────────────────────────────────────────
// Status Snapshot
// ─────────────────────────────────────────────────────────────────────────────

struct ProviderStatus {
    ProviderDescriptor descriptor;
    HealthRecord health;
    CircuitSnapshot circuit;
    CircuitBreakerStats circuit_stats;
    std::uint32_t in_flight{0};
    ProviderUsage usage;
};

struct EngineStatus {
    bool running{false};
    std::vector<ProviderStatus> providers;
    double total_cost{0.0};

    /// Admin-friendly rendering; durations in milliseconds
    [[nodiscard]] nlohmann::json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Routing Engine
// ─────────────────────────────────────────────────────────────────────────────

class RoutingEngine {
public:
    using Clock = std::chrono::steady_clock;

    /// Throws std::invalid_argument if `config` fails validation
    explicit RoutingEngine(
        asio::any_io_executor executor,
        EngineConfig config = {},
        std::shared_ptr<IRoutingObserver> observer = nullptr
    );

    ~RoutingEngine();

    RoutingEngine(const RoutingEngine&) = delete;
    RoutingEngine& operator=(const RoutingEngine&) = delete;
    RoutingEngine(RoutingEngine&&) = delete;
    RoutingEngine& operator=(RoutingEngine&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Setup & Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] RegistryResult<void> register_provider(
        ProviderDescriptor descriptor,
        std::shared_ptr<IBackendClient> client
    );

    /// Start background probing of every registered provider
    void start();

    /// Cancel probe tasks and the staleness watchdog
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return monitor_.is_running(); }

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    /// Route with the configured request_deadline
    [[nodiscard]] asio::awaitable<RoutingResult<RoutedResponse>> execute(
        Capability capability,
        BackendRequest request
    );

    [[nodiscard]] asio::awaitable<RoutingResult<RoutedResponse>> execute(
        Capability capability,
        BackendRequest request,
        Clock::time_point deadline
    );

    /// Route with per-request scoring weights
    [[nodiscard]] asio::awaitable<RoutingResult<RoutedResponse>> execute(
        Capability capability,
        BackendRequest request,
        Clock::time_point deadline,
        RouterConfig weights
    );

    /// Current ranking without dispatching anything
    [[nodiscard]] RegistryResult<std::vector<RankedCandidate>> rank(Capability capability) const;

    /// Feed an outcome observed outside execute() into health tracking
    std::optional<HealthStatus> record_call_outcome(
        const ProviderId& provider,
        bool success,
        std::chrono::microseconds latency,
        std::string error = {}
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] EngineStatus status() const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const ProviderRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] ProviderStateStore& state_store() noexcept { return store_; }
    [[nodiscard]] HealthMonitor& health_monitor() noexcept { return monitor_; }

private:
    EngineConfig config_;
    ProviderRegistry registry_;
    mutable ProviderStateStore store_;
    HealthMonitor monitor_;
    Router router_;
    FailoverCoordinator coordinator_;
};

}  // namespace semroute
