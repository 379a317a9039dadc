#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Load Counter
// ─────────────────────────────────────────────────────────────────────────────
// In-flight request count for one provider. A scoring signal for the router,
// never an admission gate. Never goes below zero.

#include <atomic>
#include <cstdint>

namespace semroute {

class LoadCounter {
public:
    LoadCounter() = default;

    LoadCounter(const LoadCounter&) = delete;
    LoadCounter& operator=(const LoadCounter&) = delete;

    void increment() noexcept {
        in_flight_.fetch_add(1, std::memory_order_acq_rel);
    }

    void decrement() noexcept {
        auto current = in_flight_.load(std::memory_order_acquire);
        while (current > 0) {
            if (in_flight_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel)) {
                return;
            }
        }
    }

    [[nodiscard]] std::uint32_t in_flight() const noexcept {
        return in_flight_.load(std::memory_order_acquire);
    }

private:
    std::atomic<std::uint32_t> in_flight_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// RAII Guard for Load Counter
// ─────────────────────────────────────────────────────────────────────────────
// Increments on construction, decrements on scope exit, including when the
// owning coroutine is destroyed by cancellation.

class LoadGuard {
public:
    explicit LoadGuard(LoadCounter& counter) noexcept
        : counter_(counter)
    {
        counter_.increment();
    }

    ~LoadGuard() {
        counter_.decrement();
    }

    // Non-copyable, non-movable
    LoadGuard(const LoadGuard&) = delete;
    LoadGuard& operator=(const LoadGuard&) = delete;
    LoadGuard(LoadGuard&&) = delete;
    LoadGuard& operator=(LoadGuard&&) = delete;

private:
    LoadCounter& counter_;
};

}  // namespace semroute
