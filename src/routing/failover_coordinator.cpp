#include "semroute/routing/failover_coordinator.hpp"
#include "semroute/backend/backend_guard.hpp"
#include "semroute/log/logger.hpp"
#include "semroute/state/load_counter.hpp"

#include <asio/cancellation_state.hpp>
#include <asio/error.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <format>
#include <optional>
#include <variant>

namespace semroute {

using namespace asio::experimental::awaitable_operators;

namespace {

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

}  // namespace

FailoverCoordinator::FailoverCoordinator(
    const ProviderRegistry& registry,
    ProviderStateStore& store,
    const Router& router,
    HealthMonitor& health,
    FailoverConfig config,
    std::shared_ptr<IRoutingObserver> observer
)
    : registry_(registry)
    , store_(store)
    , router_(router)
    , health_(health)
    , config_(std::move(config))
    , observer_(std::move(observer))
{}

// ═══════════════════════════════════════════════════════════════════════════
// Request Execution
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<RoutingResult<RoutedResponse>> FailoverCoordinator::execute(
    Capability capability,
    BackendRequest request
) {
    co_return co_await execute(capability, std::move(request), Clock::now() + config_.request_deadline);
}

asio::awaitable<RoutingResult<RoutedResponse>> FailoverCoordinator::execute(
    Capability capability,
    BackendRequest request,
    Clock::time_point deadline
) {
    co_return co_await execute(capability, std::move(request), deadline, router_.config());
}

asio::awaitable<RoutingResult<RoutedResponse>> FailoverCoordinator::execute(
    Capability capability,
    BackendRequest request,
    Clock::time_point deadline,
    RouterConfig weights
) {
    const auto started = Clock::now();

    RoutingReport summary;
    summary.capability = capability;

    auto ranked = router_.rank(capability, weights, started);
    if (!ranked) {
        auto error = RoutingError::unknown_capability(capability);
        SEMROUTE_LOG_WARN("failover", error.message);
        summary.error = error.code;
        summary.elapsed = since(started);
        report(std::move(summary));
        co_return tl::unexpected(std::move(error));
    }
    summary.ranking = *ranked;

    std::vector<AttemptRecord> attempts;

    // Every breaker is rejecting: say so per provider rather than returning an empty log
    if (ranked->empty()) {
        for (const auto& descriptor : registry_.list(capability)) {
            store_.state_for(descriptor)->usage.record_rejection();
            attempts.push_back(AttemptRecord{
                .provider = descriptor.id,
                .outcome = AttemptOutcome::CircuitOpen,
                .dispatched = false,
            });
        }
    }

    std::size_t dispatched = 0;
    std::size_t untried = 0;

    for (std::size_t i = 0; i < ranked->size(); ++i) {
        const auto& candidate = (*ranked)[i];

        if (dispatched >= config_.max_attempts) {
            untried = ranked->size() - i;
            break;
        }

        const auto now = Clock::now();
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining < config_.min_attempt_budget) {
            untried = ranked->size() - i;
            SEMROUTE_LOG_DEBUG("failover", std::format(
                "Deadline reached, {} candidates left untried", untried));
            break;
        }

        auto provider = registry_.find(candidate.provider);
        if (!provider) {
            continue;  // Registry never removes; only reachable with a foreign ranking
        }
        auto state = store_.state_for(provider->descriptor);

        const auto ticket = state->circuit.try_acquire(now);
        if (ticket == Admission::Rejected) {
            state->usage.record_rejection();
            attempts.push_back(AttemptRecord{
                .provider = candidate.provider,
                .outcome = AttemptOutcome::CircuitOpen,
                .dispatched = false,
            });
            SEMROUTE_LOG_DEBUG("failover", std::format(
                "{} skipped: circuit open", candidate.provider.to_string()));
            continue;
        }

        ++dispatched;
        auto result = co_await attempt(
            *provider, *state, ticket, request, std::min(config_.attempt_timeout, remaining));
        attempts.push_back(result.record);

        if (result.response) {
            summary.chosen = candidate.provider;
            summary.winning_score = candidate.breakdown;
            summary.attempts = attempts;
            summary.cost = result.cost;
            summary.elapsed = since(started);
            report(std::move(summary));

            co_return RoutedResponse{
                .provider = candidate.provider,
                .response = std::move(*result.response),
                .attempts = std::move(attempts),
                .score = candidate.breakdown,
                .cost = result.cost,
            };
        }

        if (result.record.outcome == AttemptOutcome::Cancelled) {
            SEMROUTE_LOG_INFO("failover", std::format(
                "Request cancelled during attempt on {}", candidate.provider.to_string()));
            auto error = RoutingError::cancelled(capability, std::move(attempts));
            summary.attempts = error.attempts;
            summary.error = error.code;
            summary.elapsed = since(started);
            report(std::move(summary));
            co_return tl::unexpected(std::move(error));
        }
    }

    auto error = RoutingError::all_providers_failed(capability, std::move(attempts));
    if (untried > 0) {
        error.message += std::format(
            "; stopped with {} candidates untried ({} of {} attempts used)",
            untried, dispatched, config_.max_attempts);
    }
    SEMROUTE_LOG_WARN("failover", error.describe());

    summary.attempts = error.attempts;
    summary.error = error.code;
    summary.elapsed = since(started);
    report(std::move(summary));

    co_return tl::unexpected(std::move(error));
}

// ═══════════════════════════════════════════════════════════════════════════
// Single Attempt
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<FailoverCoordinator::AttemptResult> FailoverCoordinator::attempt(
    const RegisteredProvider& provider,
    ProviderState& state,
    Admission ticket,
    const BackendRequest& request,
    std::chrono::milliseconds budget
) {
    const auto& id = provider.descriptor.id;

    AttemptResult out;
    out.record.provider = id;

    const auto started = Clock::now();
    bool caller_cancelled = false;
    // Empty when the caller's cancellation interrupted the race
    std::optional<std::variant<BackendResult<BackendResponse>, std::monostate>> raced;

    {
        LoadGuard load(state.load);
        state.usage.record_dispatch();

        asio::steady_timer timeout(co_await asio::this_coro::executor);
        timeout.expires_after(budget);

        try {
            raced = co_await (
                guarded_call(provider.client, request) || timeout.async_wait(asio::use_awaitable)
            );
        } catch (const asio::system_error& e) {
            if (e.code() != asio::error::operation_aborted) {
                throw;
            }
            caller_cancelled = true;
        }
    }

    const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - started);
    out.record.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(latency);

    if (!caller_cancelled) {
        const auto cs = co_await asio::this_coro::cancellation_state;
        caller_cancelled = cs.cancelled() != asio::cancellation_type::none;
    }

    // An answer that beat the cancellation is still an answer
    if (raced && raced->index() == 0 && std::get<0>(*raced).has_value()) {
        auto& response = *std::get<0>(*raced);

        health_.record_call_outcome(id, true, latency);
        state.circuit.record_success(ticket);
        out.cost = state.usage.record_success(response.units);

        out.record.outcome = AttemptOutcome::Succeeded;
        out.response = std::move(response);
        co_return out;
    }

    if (caller_cancelled || !raced) {
        // Not evidence about the provider: no health or breaker update
        state.circuit.release(ticket);
        out.record.outcome = AttemptOutcome::Cancelled;
        out.record.backend_error = BackendError::cancelled();
        co_return out;
    }

    const bool timed_out = raced->index() == 1;
    BackendError error = timed_out
        ? BackendError::timeout(std::format("No response within {}ms", budget.count()))
        : std::get<0>(*raced).error();

    out.record.outcome = timed_out ? AttemptOutcome::TimedOut : AttemptOutcome::Failed;

    health_.record_call_outcome(
        id, false, latency, std::format("{}: {}", to_string(error.code), error.message));
    state.circuit.record_failure(ticket);
    state.usage.record_failure();

    SEMROUTE_LOG_DEBUG("failover", std::format(
        "{} attempt {} after {}ms: {}",
        id.to_string(),
        to_string(out.record.outcome),
        out.record.elapsed.count(),
        error.message
    ));

    out.record.backend_error = std::move(error);
    co_return out;
}

void FailoverCoordinator::report(RoutingReport summary) {
    if (observer_) {
        observer_->on_request_complete(summary);
    }
}

}  // namespace semroute
