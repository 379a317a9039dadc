#include "semroute/resilience/circuit_breaker.hpp"

#include <algorithm>

namespace semroute {

// ─────────────────────────────────────────────────────────────────────────────
// Snapshot
// ─────────────────────────────────────────────────────────────────────────────

bool CircuitSnapshot::rejects_all(Clock::time_point now) const noexcept {
    switch (state) {
        case CircuitState::Closed:
            return false;
        case CircuitState::Open:
            if (opened_at.has_value() == false) {
                return true;
            }
            return now < (*opened_at + cooldown);
        case CircuitState::HalfOpen:
            return half_open_probe_in_flight;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config))
{}

std::chrono::milliseconds CircuitBreaker::cooldown_for(
    const CircuitBreakerConfig& config,
    std::size_t consecutive_opens
) noexcept {
    auto cooldown = config.base_cooldown;
    for (std::size_t i = 0; i < consecutive_opens; ++i) {
        if (cooldown >= config.max_cooldown) {
            break;
        }
        cooldown *= 2;
    }
    return std::min(cooldown, config.max_cooldown);
}

// ─────────────────────────────────────────────────────────────────────────────
// Core Operations
// ─────────────────────────────────────────────────────────────────────────────

Admission CircuitBreaker::try_acquire(Clock::time_point now) {
    std::optional<Transition> transition;
    Admission result = Admission::Rejected;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        switch (state_.load(std::memory_order_relaxed)) {
            case CircuitState::Closed:
                result = Admission::Normal;
                break;

            case CircuitState::Open: {
                const bool cooled_down = opened_at_.has_value()
                    && now >= (*opened_at_ + cooldown_);
                if (cooled_down == false) {
                    break;
                }
                transition = transition_to(CircuitState::HalfOpen);
                [[fallthrough]];
            }

            case CircuitState::HalfOpen: {
                // Losers of the race behave exactly as if the circuit were Open
                bool expected = false;
                const bool claimed = half_open_probe_in_flight_.compare_exchange_strong(
                    expected, true, std::memory_order_acq_rel
                );
                if (claimed) {
                    result = Admission::Trial;
                }
                break;
            }
        }
    }

    if (result == Admission::Rejected) {
        rejected_requests_.fetch_add(1, std::memory_order_relaxed);
    } else {
        admitted_requests_.fetch_add(1, std::memory_order_relaxed);
    }

    fire(transition);
    return result;
}

void CircuitBreaker::record_success(Admission ticket) {
    if (ticket == Admission::Rejected) {
        return;
    }
    successful_requests_.fetch_add(1, std::memory_order_relaxed);

    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto current = state_.load(std::memory_order_relaxed);
        if (ticket == Admission::Trial) {
            half_open_probe_in_flight_.store(false, std::memory_order_release);
            if (current == CircuitState::HalfOpen) {
                failure_count_ = 0;
                consecutive_opens_ = 0;
                opened_at_.reset();
                cooldown_ = std::chrono::milliseconds{0};
                transition = transition_to(CircuitState::Closed);
            }
        } else if (current == CircuitState::Closed) {
            failure_count_ = 0;
        }
        // Normal tickets finishing after the circuit moved on carry no
        // information about the trial and are ignored.
    }

    fire(transition);
}

void CircuitBreaker::record_failure(Admission ticket, Clock::time_point now) {
    if (ticket == Admission::Rejected) {
        return;
    }
    failed_requests_.fetch_add(1, std::memory_order_relaxed);

    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto current = state_.load(std::memory_order_relaxed);
        if (ticket == Admission::Trial) {
            half_open_probe_in_flight_.store(false, std::memory_order_release);
            if (current == CircuitState::HalfOpen) {
                consecutive_opens_++;
                transition = open_circuit(now);
            }
        } else if (current == CircuitState::Closed) {
            failure_count_++;
            if (failure_count_ >= config_.open_threshold) {
                transition = open_circuit(now);
            }
        }
    }

    fire(transition);
}

void CircuitBreaker::release(Admission ticket) {
    if (ticket != Admission::Trial) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    half_open_probe_in_flight_.store(false, std::memory_order_release);
}

// ─────────────────────────────────────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────────────────────────────────────

CircuitSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CircuitSnapshot{
        .state = state_.load(std::memory_order_relaxed),
        .failure_count = failure_count_,
        .consecutive_opens = consecutive_opens_,
        .cooldown = cooldown_,
        .opened_at = opened_at_,
        .half_open_probe_in_flight = half_open_probe_in_flight_.load(std::memory_order_acquire)
    };
}

CircuitBreakerStats CircuitBreaker::stats() const {
    return CircuitBreakerStats{
        .admitted_requests = admitted_requests_.load(std::memory_order_relaxed),
        .rejected_requests = rejected_requests_.load(std::memory_order_relaxed),
        .successful_requests = successful_requests_.load(std::memory_order_relaxed),
        .failed_requests = failed_requests_.load(std::memory_order_relaxed),
        .state_transitions = state_transitions_.load(std::memory_order_relaxed),
        .current_state = state_.load(std::memory_order_acquire)
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Callbacks
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_change_callbacks_.push_back(std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// Internal Helpers
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreaker::Transition CircuitBreaker::transition_to(CircuitState next) {
    // Caller must hold mutex
    const auto previous = state_.exchange(next, std::memory_order_acq_rel);
    state_transitions_.fetch_add(1, std::memory_order_relaxed);
    return Transition{previous, next};
}

CircuitBreaker::Transition CircuitBreaker::open_circuit(Clock::time_point now) {
    // Caller must hold mutex
    opened_at_ = now;
    cooldown_ = cooldown_for(config_, consecutive_opens_);
    failure_count_ = 0;
    return transition_to(CircuitState::Open);
}

void CircuitBreaker::fire(const std::optional<Transition>& transition) {
    if (transition.has_value() == false) {
        return;
    }

    std::vector<StateChangeCallback> callbacks_to_fire;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_to_fire = state_change_callbacks_;
    }

    // Fire callbacks outside the lock to avoid deadlock
    for (const auto& callback : callbacks_to_fire) {
        callback(transition->old_state, transition->new_state);
    }
}

}  // namespace semroute
