// ─────────────────────────────────────────────────────────────────────────────
// Health Tracker Tests
// ─────────────────────────────────────────────────────────────────────────────
// Hysteresis, EWMA and staleness of a single HealthRecord.

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "semroute/health/health_record.hpp"

#include <chrono>

using namespace semroute;
using namespace std::chrono_literals;
using Catch::Approx;

namespace {

using Clock = HealthTracker::Clock;

HealthConfig test_config() {
    HealthConfig config;
    config.probe_interval = 1s;
    config.fail_threshold = 3;
    config.success_threshold = 2;
    config.latency_ewma_alpha = 0.5;
    config.stale_after_intervals = 3;
    return config;
}

HealthStatus ok(HealthTracker& tracker, std::chrono::microseconds latency = 10ms, Clock::time_point now = Clock::now()) {
    return tracker.observe_success(ObservationSource::Probe, latency, now);
}

HealthStatus fail(HealthTracker& tracker, Clock::time_point now = Clock::now()) {
    return tracker.observe_failure(ObservationSource::Probe, "refused", now);
}

}  // namespace

TEST_CASE("HealthTracker starts Unknown with no observations", "[health]") {
    HealthTracker tracker(test_config());
    const auto record = tracker.snapshot();

    REQUIRE(record.status == HealthStatus::Unknown);
    REQUIRE(record.total_observations == 0);
    REQUIRE_FALSE(record.latency_ewma_seconds.has_value());
    REQUIRE_FALSE(record.last_probe_at.has_value());
}

TEST_CASE("HealthTracker promotes after success_threshold successes", "[health]") {
    HealthTracker tracker(test_config());

    REQUIRE(ok(tracker) == HealthStatus::Unknown);
    REQUIRE(ok(tracker) == HealthStatus::Healthy);
    REQUIRE(tracker.snapshot().consecutive_successes == 2);
}

TEST_CASE("HealthTracker single failure demotes Healthy only to Degraded", "[health]") {
    HealthTracker tracker(test_config());
    ok(tracker);
    ok(tracker);

    REQUIRE(fail(tracker) == HealthStatus::Degraded);
    REQUIRE(fail(tracker) == HealthStatus::Degraded);
    REQUIRE(fail(tracker) == HealthStatus::Unhealthy);

    const auto record = tracker.snapshot();
    REQUIRE(record.consecutive_failures == 3);
    REQUIRE(record.consecutive_successes == 0);
    REQUIRE(record.last_error == "refused");
}

TEST_CASE("HealthTracker with fail_threshold 1 still demotes Healthy to Degraded first", "[health]") {
    auto config = test_config();
    config.fail_threshold = 1;
    config.success_threshold = 1;
    HealthTracker tracker(config);

    REQUIRE(ok(tracker) == HealthStatus::Healthy);
    REQUIRE(fail(tracker) == HealthStatus::Degraded);
    REQUIRE(fail(tracker) == HealthStatus::Unhealthy);
}

TEST_CASE("HealthTracker first failure on Unknown is Degraded", "[health]") {
    HealthTracker tracker(test_config());
    REQUIRE(fail(tracker) == HealthStatus::Degraded);
}

TEST_CASE("HealthTracker needs consecutive successes to recover", "[health]") {
    HealthTracker tracker(test_config());
    fail(tracker);
    fail(tracker);
    fail(tracker);
    REQUIRE(tracker.status() == HealthStatus::Unhealthy);

    // A blip of success does not flap back
    REQUIRE(ok(tracker) == HealthStatus::Unhealthy);
    REQUIRE(fail(tracker) == HealthStatus::Unhealthy);
    REQUIRE(ok(tracker) == HealthStatus::Unhealthy);
    REQUIRE(ok(tracker) == HealthStatus::Healthy);
    REQUIRE_FALSE(tracker.snapshot().last_error.has_value());
}

TEST_CASE("HealthTracker counts each observation exactly once", "[health]") {
    HealthTracker tracker(test_config());

    fail(tracker);
    fail(tracker);
    REQUIRE(tracker.status() == HealthStatus::Degraded);
    REQUIRE(tracker.snapshot().consecutive_failures == 2);
    REQUIRE(tracker.snapshot().total_observations == 2);

    tracker.observe_failure(ObservationSource::Call, "timeout");
    REQUIRE(tracker.status() == HealthStatus::Unhealthy);
    REQUIRE(tracker.snapshot().total_observations == 3);
    REQUIRE(tracker.snapshot().last_source == ObservationSource::Call);
}

TEST_CASE("HealthTracker latency EWMA seeds then smooths", "[health]") {
    HealthTracker tracker(test_config());

    ok(tracker, 100ms);
    REQUIRE(*tracker.snapshot().latency_ewma_seconds == Approx(0.100));

    ok(tracker, 300ms);
    REQUIRE(*tracker.snapshot().latency_ewma_seconds == Approx(0.200));

    // Failures leave the estimate alone
    fail(tracker);
    REQUIRE(*tracker.snapshot().latency_ewma_seconds == Approx(0.200));
}

// ═══════════════════════════════════════════════════════════════════════════
// Staleness
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HealthTracker degrades one notch per stale window", "[health]") {
    HealthTracker tracker(test_config());
    const auto t0 = Clock::now();
    ok(tracker, 10ms, t0);
    ok(tracker, 10ms, t0);
    REQUIRE(tracker.status() == HealthStatus::Healthy);

    REQUIRE_FALSE(tracker.degrade_if_stale(t0 + 2s).has_value());

    auto demoted = tracker.degrade_if_stale(t0 + 3s);
    REQUIRE(demoted == HealthStatus::Degraded);
    REQUIRE(tracker.snapshot().consecutive_successes == 0);

    // Same window: no further demotion
    REQUIRE_FALSE(tracker.degrade_if_stale(t0 + 4s).has_value());

    REQUIRE(tracker.degrade_if_stale(t0 + 6s) == HealthStatus::Unhealthy);
    REQUIRE_FALSE(tracker.degrade_if_stale(t0 + 60s).has_value());
}

TEST_CASE("HealthTracker never-observed records do not go stale", "[health]") {
    HealthTracker tracker(test_config());
    REQUIRE_FALSE(tracker.degrade_if_stale(Clock::now() + 1h).has_value());
    REQUIRE(tracker.status() == HealthStatus::Unknown);
}

TEST_CASE("HealthTracker fresh observation restarts the stale window", "[health]") {
    HealthTracker tracker(test_config());
    const auto t0 = Clock::now();
    ok(tracker, 10ms, t0);
    ok(tracker, 10ms, t0);

    ok(tracker, 10ms, t0 + 2s);
    REQUIRE_FALSE(tracker.degrade_if_stale(t0 + 4s).has_value());
    REQUIRE(tracker.degrade_if_stale(t0 + 5s) == HealthStatus::Degraded);
}
