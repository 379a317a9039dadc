#include "semroute/state/usage_tracker.hpp"

namespace semroute {

UsageTracker::UsageTracker(double cost_per_unit, std::optional<double> budget)
    : cost_per_unit_(cost_per_unit)
    , budget_(budget)
{}

double UsageTracker::record_success(std::uint64_t units) {
    succeeded_.fetch_add(1, std::memory_order_relaxed);

    const double cost = static_cast<double>(units) * cost_per_unit_;
    std::lock_guard<std::mutex> lock(cost_mutex_);
    units_ += units;
    total_cost_ += cost;
    return cost;
}

bool UsageTracker::over_budget() const {
    if (budget_.has_value() == false) {
        return false;
    }
    std::lock_guard<std::mutex> lock(cost_mutex_);
    return total_cost_ > *budget_;
}

ProviderUsage UsageTracker::snapshot() const {
    ProviderUsage usage;
    usage.dispatched = dispatched_.load(std::memory_order_relaxed);
    usage.succeeded = succeeded_.load(std::memory_order_relaxed);
    usage.failed = failed_.load(std::memory_order_relaxed);
    usage.circuit_rejections = circuit_rejections_.load(std::memory_order_relaxed);
    usage.budget = budget_;

    std::lock_guard<std::mutex> lock(cost_mutex_);
    usage.units = units_;
    usage.total_cost = total_cost_;
    return usage;
}

}  // namespace semroute
