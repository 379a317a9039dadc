#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Failover Coordinator
// ═══════════════════════════════════════════════════════════════════════════
// Single entry point for requests. Walks the router's ranking in order under
// a global deadline:
//
//   for candidate in rank(capability):
//       stop if max_attempts dispatched or remaining < min_attempt_budget
//       breaker rejects      -> log CircuitOpen (not an attempt), next
//       call with timeout = min(attempt_timeout, remaining)
//       success              -> report to health + breaker, return
//       failure / timeout    -> report to health + breaker, log, next
//       caller cancelled     -> release breaker ticket, return Cancelled
//
// Backend failures never escape on their own: exhaustion returns one
// AllProvidersFailed carrying every attempt and its cause. No lock is held
// across the dispatch suspension.
//
// Usage:
//   FailoverCoordinator coordinator(registry, store, router, monitor, config);
//   auto result = co_await coordinator.execute(Capability::Embedding, request);
//   if (!result) {
//       log(result.error().describe());
//   }

#include "semroute/backend/backend_client.hpp"
#include "semroute/config/defaults.hpp"
#include "semroute/core/errors.hpp"
#include "semroute/health/health_monitor.hpp"
#include "semroute/registry/provider_registry.hpp"
#include "semroute/routing/router.hpp"
#include "semroute/routing/routing_observer.hpp"
#include "semroute/state/provider_state_store.hpp"

#include <asio/awaitable.hpp>

#include <chrono>
#include <memory>
#include <vector>

namespace semroute {

struct FailoverConfig {
    /// Maximum number of dispatched attempts per request
    std::size_t max_attempts{defaults::kMaxAttempts};

    /// Upper bound of one attempt; shortened to what is left of the deadline
    std::chrono::milliseconds attempt_timeout{defaults::kAttemptTimeout};

    /// Deadline used by execute() overloads that take none
    std::chrono::milliseconds request_deadline{defaults::kRequestDeadline};

    /// No attempt is started with less than this left
    std::chrono::milliseconds min_attempt_budget{defaults::kMinAttemptBudget};
};

/// Successful execute(): the answer plus how it was obtained
struct RoutedResponse {
    ProviderId provider;
    BackendResponse response;

    /// Every attempt in order; the last one is the success
    std::vector<AttemptRecord> attempts;

    ScoreBreakdown score;
    double cost{0.0};
};

class FailoverCoordinator {
public:
    using Clock = std::chrono::steady_clock;

    FailoverCoordinator(
        const ProviderRegistry& registry,
        ProviderStateStore& store,
        const Router& router,
        HealthMonitor& health,
        FailoverConfig config = {},
        std::shared_ptr<IRoutingObserver> observer = nullptr
    );

    [[nodiscard]] asio::awaitable<RoutingResult<RoutedResponse>> execute(
        Capability capability,
        BackendRequest request,
        Clock::time_point deadline
    );

    /// Uses now + request_deadline
    [[nodiscard]] asio::awaitable<RoutingResult<RoutedResponse>> execute(
        Capability capability,
        BackendRequest request
    );

    /// Ranks with `weights` instead of the router's configuration for this
    /// request only (e.g. a cost-sensitive caller raising preference_weight)
    [[nodiscard]] asio::awaitable<RoutingResult<RoutedResponse>> execute(
        Capability capability,
        BackendRequest request,
        Clock::time_point deadline,
        RouterConfig weights
    );

    [[nodiscard]] const FailoverConfig& config() const noexcept { return config_; }

private:
    struct AttemptResult {
        AttemptRecord record;
        std::optional<BackendResponse> response;
        double cost{0.0};
    };

    /// One dispatch against an admitted provider, bounded by `budget`
    asio::awaitable<AttemptResult> attempt(
        const RegisteredProvider& provider,
        ProviderState& state,
        Admission ticket,
        const BackendRequest& request,
        std::chrono::milliseconds budget
    );

    void report(RoutingReport summary);

    const ProviderRegistry& registry_;
    ProviderStateStore& store_;
    const Router& router_;
    HealthMonitor& health_;
    FailoverConfig config_;
    std::shared_ptr<IRoutingObserver> observer_;
};

}  // namespace semroute
