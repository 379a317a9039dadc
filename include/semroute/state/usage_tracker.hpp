#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Usage Tracker
// ─────────────────────────────────────────────────────────────────────────────
// Per-provider call accounting and accumulated cost. An optional budget turns
// overspending into a router penalty; it never blocks a request.

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>

namespace semroute {

struct ProviderUsage {
    std::uint64_t dispatched{0};
    std::uint64_t succeeded{0};
    std::uint64_t failed{0};
    std::uint64_t circuit_rejections{0};
    std::uint64_t units{0};
    double total_cost{0.0};
    std::optional<double> budget;

    [[nodiscard]] bool over_budget() const noexcept {
        return budget.has_value() && total_cost > *budget;
    }
};

class UsageTracker {
public:
    UsageTracker(double cost_per_unit, std::optional<double> budget);

    UsageTracker(const UsageTracker&) = delete;
    UsageTracker& operator=(const UsageTracker&) = delete;

    void record_dispatch() noexcept {
        dispatched_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_failure() noexcept {
        failed_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_rejection() noexcept {
        circuit_rejections_.fetch_add(1, std::memory_order_relaxed);
    }

    /// Count a success and bill `units`. Returns the cost of this call.
    double record_success(std::uint64_t units);

    [[nodiscard]] bool over_budget() const;

    [[nodiscard]] ProviderUsage snapshot() const;

private:
    const double cost_per_unit_;
    const std::optional<double> budget_;

    std::atomic<std::uint64_t> dispatched_{0};
    std::atomic<std::uint64_t> succeeded_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> circuit_rejections_{0};

    mutable std::mutex cost_mutex_;
    std::uint64_t units_{0};
    double total_cost_{0.0};
};

}  // namespace semroute
