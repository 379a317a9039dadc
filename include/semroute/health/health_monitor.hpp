#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Health Monitor
// ═══════════════════════════════════════════════════════════════════════════
// Background prober keeping an eventually-accurate reachability view without
// adding latency to user requests.
//
// One task per registered provider:
//
//   loop:
//     sleep(probe_interval * uniform[1 - jitter, 1 + jitter])
//     probe with probe_timeout
//     update HealthRecord
//
// plus one staleness watchdog. All tasks run on a private strand, are
// cancelled together by stop(), and a probe task that dies from an exception
// is spawned again after probe_respawn_delay.
//
// Every start() opens a new generation. Tasks and respawn timers left over
// from an earlier generation exit quietly even if the monitor was restarted
// before they observed their cancellation.
//
// Real call outcomes enter through record_call_outcome() and go through the
// exact same hysteresis as probes.
//
// Usage:
//   HealthMonitor monitor(io.get_executor(), registry, store, config);
//   monitor.start();
//   ...
//   monitor.stop();

#include "semroute/health/health_record.hpp"
#include "semroute/registry/provider_registry.hpp"
#include "semroute/state/provider_state_store.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/cancellation_signal.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

namespace semroute {

class HealthMonitor {
public:
    using Clock = std::chrono::steady_clock;

    HealthMonitor(
        asio::any_io_executor executor,
        const ProviderRegistry& registry,
        ProviderStateStore& store,
        HealthConfig config
    );

    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;
    HealthMonitor(HealthMonitor&&) = delete;
    HealthMonitor& operator=(HealthMonitor&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Spawn one probe task per registered provider and the watchdog
    void start();

    /// Cancel every task. Takes effect once the executor runs the posted
    /// cancellation; tasks finish without being respawned.
    void stop();

    /// Start probing a provider registered after start(). No-op while stopped.
    void watch(RegisteredProviderPtr provider);

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Observations
    // ─────────────────────────────────────────────────────────────────────────

    /// Apply a real call outcome. Returns the new status, or nullopt when the
    /// provider is not registered.
    std::optional<HealthStatus> record_call_outcome(
        const ProviderId& provider,
        bool success,
        std::chrono::microseconds latency,
        std::string error = {}
    );

    /// Probe one provider now (bounded by probe_timeout) and record the result
    [[nodiscard]] asio::awaitable<HealthStatus> probe_once(RegisteredProviderPtr provider);

    /// Demote every record that saw no observation within stale_after().
    /// Returns how many records were demoted.
    std::size_t sweep_stale(Clock::time_point now = Clock::now());

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t active_probe_tasks() const noexcept {
        return active_tasks_.load(std::memory_order_acquire);
    }

    /// Number of probe tasks restarted after crashing
    [[nodiscard]] std::uint64_t respawn_count() const noexcept {
        return respawns_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const HealthConfig& config() const noexcept { return config_; }

private:
    using Generation = std::uint64_t;

    void spawn_probe_task(RegisteredProviderPtr provider, Generation generation);
    void spawn_watchdog(Generation generation);

    asio::awaitable<void> probe_loop(RegisteredProviderPtr provider, Generation generation);
    asio::awaitable<void> watchdog_loop(Generation generation);

    [[nodiscard]] bool is_current(Generation generation) const noexcept {
        return running_.load(std::memory_order_acquire)
            && generation_.load(std::memory_order_acquire) == generation;
    }

    std::chrono::milliseconds jittered_interval();

    asio::strand<asio::any_io_executor> strand_;
    const ProviderRegistry& registry_;
    ProviderStateStore& store_;
    HealthConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<Generation> generation_{0};
    std::atomic<std::size_t> active_tasks_{0};
    std::atomic<std::uint64_t> respawns_{0};

    // Touched only on strand_. Each task's completion handler also holds its
    // signal, so a signal outlives the slot it is bound to.
    std::unordered_map<ProviderId, std::shared_ptr<asio::cancellation_signal>, ProviderIdHash> probe_signals_;
    std::shared_ptr<asio::cancellation_signal> watchdog_signal_;
    std::mt19937 rng_;
};

}  // namespace semroute
