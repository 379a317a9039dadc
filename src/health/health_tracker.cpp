#include "semroute/health/health_record.hpp"

namespace semroute {

HealthTracker::HealthTracker(HealthConfig config)
    : config_(std::move(config))
{}

HealthStatus HealthTracker::observe_success(
    ObservationSource source,
    std::chrono::microseconds latency,
    Clock::time_point now
) {
    const double sample_seconds = std::chrono::duration<double>(latency).count();

    std::lock_guard<std::mutex> lock(mutex_);

    record_.consecutive_successes++;
    record_.consecutive_failures = 0;
    record_.total_observations++;
    record_.last_source = source;
    record_.last_probe_at = now;
    stale_window_start_ = now;

    if (record_.latency_ewma_seconds.has_value()) {
        const double alpha = config_.latency_ewma_alpha;
        record_.latency_ewma_seconds = alpha * sample_seconds
            + (1.0 - alpha) * *record_.latency_ewma_seconds;
    } else {
        record_.latency_ewma_seconds = sample_seconds;
    }

    const bool promoted = (record_.consecutive_successes >= config_.success_threshold);
    if (promoted) {
        record_.status = HealthStatus::Healthy;
        record_.last_error.reset();
    }
    return record_.status;
}

HealthStatus HealthTracker::observe_failure(
    ObservationSource source,
    std::string reason,
    Clock::time_point now
) {
    std::lock_guard<std::mutex> lock(mutex_);

    record_.consecutive_failures++;
    record_.consecutive_successes = 0;
    record_.total_observations++;
    record_.last_source = source;
    record_.last_probe_at = now;
    record_.last_error = std::move(reason);
    stale_window_start_ = now;

    // Healthy always passes through Degraded, even with fail_threshold == 1
    if (record_.status == HealthStatus::Healthy) {
        record_.status = HealthStatus::Degraded;
    } else if (record_.consecutive_failures >= config_.fail_threshold) {
        record_.status = HealthStatus::Unhealthy;
    } else if (record_.status == HealthStatus::Unknown) {
        record_.status = HealthStatus::Degraded;
    }
    return record_.status;
}

std::optional<HealthStatus> HealthTracker::degrade_if_stale(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Never observed: nothing to go stale
    if (stale_window_start_.has_value() == false) {
        return std::nullopt;
    }

    const bool stale = (now - *stale_window_start_) >= config_.stale_after();
    if (stale == false) {
        return std::nullopt;
    }

    switch (record_.status) {
        case HealthStatus::Healthy:
            record_.status = HealthStatus::Degraded;
            break;
        case HealthStatus::Degraded:
            record_.status = HealthStatus::Unhealthy;
            break;
        case HealthStatus::Unknown:
        case HealthStatus::Unhealthy:
            return std::nullopt;
    }

    // Fresh evidence is required before promotion again
    record_.consecutive_successes = 0;
    stale_window_start_ = now;
    return record_.status;
}

HealthRecord HealthTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
}

HealthStatus HealthTracker::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.status;
}

}  // namespace semroute
