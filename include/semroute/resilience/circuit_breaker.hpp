#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker
// ═══════════════════════════════════════════════════════════════════════════
// Per-provider failure tracking. Only real call outcomes move the state;
// health probes never do.
//
// State Machine:
//
//   ┌─────────┐  open_threshold      ┌────────┐
//   │ CLOSED  │ ─────────────────────▶│  OPEN  │◀──────────────┐
//   └────▲────┘   consecutive         └────┬───┘               │
//        │        failures                 │ cooldown elapsed  │ trial failed
//        │                                 ▼                   │ (cooldown x2)
//        │                           ┌──────────┐              │
//        └───────────────────────────│HALF_OPEN │──────────────┘
//              trial succeeded       └──────────┘
//
//   cooldown = min(base_cooldown * 2^consecutive_opens, max_cooldown)
//
// Exactly one caller wins the HalfOpen trial slot (compare-and-swap on the
// in-flight flag). Everyone else is rejected immediately, as if still Open.
//
// Usage:
//   const auto ticket = breaker.try_acquire();
//   if (ticket == Admission::Rejected) {
//       // skip this provider
//   }
//   auto result = co_await client.async_call(request);
//   if (result) {
//       breaker.record_success(ticket);
//   } else {
//       breaker.record_failure(ticket);
//   }

#include "semroute/config/defaults.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace semroute {

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker State
// ─────────────────────────────────────────────────────────────────────────────

enum class CircuitState : std::uint8_t {
    Closed,    ///< Normal operation, requests pass through
    Open,      ///< Circuit tripped, requests rejected until cooldown elapses
    HalfOpen   ///< One trial request in flight or allowed
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:   return "Closed";
        case CircuitState::Open:     return "Open";
        case CircuitState::HalfOpen: return "HalfOpen";
        default:                     return "Unknown";
    }
}

/// Result of asking the breaker for permission. Passed back with the outcome.
enum class Admission : std::uint8_t {
    Rejected,  ///< Do not dispatch
    Normal,    ///< Admitted while Closed
    Trial      ///< Holder of the HalfOpen trial slot
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitBreakerConfig {
    /// Number of consecutive failures before opening the circuit
    std::size_t open_threshold{defaults::kOpenThreshold};

    /// Cooldown after the first opening
    std::chrono::milliseconds base_cooldown{defaults::kBaseCooldown};

    /// Cap for the doubled cooldown
    std::chrono::milliseconds max_cooldown{defaults::kMaxCooldown};
};

// ─────────────────────────────────────────────────────────────────────────────
// Snapshot and Statistics
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitSnapshot {
    using Clock = std::chrono::steady_clock;

    CircuitState state{CircuitState::Closed};
    std::size_t failure_count{0};
    std::size_t consecutive_opens{0};
    std::chrono::milliseconds cooldown{0};
    std::optional<Clock::time_point> opened_at;
    bool half_open_probe_in_flight{false};

    /// True while the breaker would reject every caller: Open and still
    /// cooling down, or HalfOpen with the trial slot taken.
    [[nodiscard]] bool rejects_all(Clock::time_point now) const noexcept;
};

struct CircuitBreakerStats {
    std::size_t admitted_requests{0};
    std::size_t rejected_requests{0};  ///< Requests rejected due to open circuit
    std::size_t successful_requests{0};
    std::size_t failed_requests{0};
    std::size_t state_transitions{0};
    CircuitState current_state{CircuitState::Closed};
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker
// ─────────────────────────────────────────────────────────────────────────────

class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    /// Callback for state changes
    using StateChangeCallback = std::function<void(CircuitState old_state, CircuitState new_state)>;

    CircuitBreaker() = default;

    explicit CircuitBreaker(CircuitBreakerConfig config);

    // Non-copyable, non-movable (due to mutex)
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    ~CircuitBreaker() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Core Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Ask permission to dispatch. Open circuits whose cooldown elapsed move
    /// to HalfOpen here, and the caller competes for the single trial slot.
    [[nodiscard]] Admission try_acquire(Clock::time_point now = Clock::now());

    /// Record a successful call made under `ticket`
    void record_success(Admission ticket);

    /// Record a failed call made under `ticket`
    void record_failure(Admission ticket, Clock::time_point now = Clock::now());

    /// Give back a ticket without an outcome (caller cancelled the attempt).
    /// Frees the trial slot; no transition.
    void release(Admission ticket);

    // ─────────────────────────────────────────────────────────────────────────
    // State Queries
    // ─────────────────────────────────────────────────────────────────────────

    /// Lock-free read of the current state
    [[nodiscard]] CircuitState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] CircuitSnapshot snapshot() const;

    [[nodiscard]] CircuitBreakerStats stats() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    /// base_cooldown * 2^consecutive_opens, capped at max_cooldown
    [[nodiscard]] static std::chrono::milliseconds cooldown_for(
        const CircuitBreakerConfig& config,
        std::size_t consecutive_opens
    ) noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Callbacks
    // ─────────────────────────────────────────────────────────────────────────

    /// Register callback for state changes. Fired outside the lock.
    void on_state_change(StateChangeCallback callback);

private:
    struct Transition {
        CircuitState old_state;
        CircuitState new_state;
    };

    // Caller must hold mutex
    Transition transition_to(CircuitState next);
    Transition open_circuit(Clock::time_point now);

    void fire(const std::optional<Transition>& transition);

    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    std::atomic<CircuitState> state_{CircuitState::Closed};
    std::atomic<bool> half_open_probe_in_flight_{false};
    std::size_t failure_count_{0};
    std::size_t consecutive_opens_{0};
    std::chrono::milliseconds cooldown_{0};
    std::optional<Clock::time_point> opened_at_;

    // Statistics
    std::atomic<std::size_t> admitted_requests_{0};
    std::atomic<std::size_t> rejected_requests_{0};
    std::atomic<std::size_t> successful_requests_{0};
    std::atomic<std::size_t> failed_requests_{0};
    std::atomic<std::size_t> state_transitions_{0};

    // Callbacks
    std::vector<StateChangeCallback> state_change_callbacks_;
};

}  // namespace semroute
