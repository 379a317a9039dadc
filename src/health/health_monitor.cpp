#include "semroute/health/health_monitor.hpp"
#include "semroute/backend/backend_guard.hpp"
#include "semroute/log/logger.hpp"

#include <asio/bind_cancellation_slot.hpp>
#include <asio/co_spawn.hpp>
#include <asio/dispatch.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <format>
#include <variant>

namespace semroute {

using namespace asio::experimental::awaitable_operators;

namespace {

void log_transition(const ProviderId& id, HealthStatus before, HealthStatus after, ObservationSource source) {
    if (before == after) {
        return;
    }
    SEMROUTE_LOG_INFO("health", std::format(
        "{}: {} -> {} ({})",
        id.to_string(),
        to_string(before),
        to_string(after),
        source == ObservationSource::Probe ? "probe" : "call"
    ));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

HealthMonitor::HealthMonitor(
    asio::any_io_executor executor,
    const ProviderRegistry& registry,
    ProviderStateStore& store,
    HealthConfig config
)
    : strand_(asio::make_strand(std::move(executor)))
    , registry_(registry)
    , store_(store)
    , config_(std::move(config))
    , rng_(std::random_device{}())
{}

HealthMonitor::~HealthMonitor() {
    // Note: tasks still queued on the executor reference this object.
    // Call stop() and let the executor drain (or stop it) before destroying.
    running_.store(false, std::memory_order_release);
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

void HealthMonitor::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already running
    }
    const auto generation = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;

    auto providers = registry_.all();
    SEMROUTE_LOG_INFO("health", std::format("Starting {} probe tasks", providers.size()));

    // Posted so a cancellation queued by an earlier stop() reaches the old
    // tasks first
    asio::post(strand_, [this, generation, providers = std::move(providers)]() {
        if (!is_current(generation)) {
            return;
        }
        probe_signals_.clear();
        watchdog_signal_.reset();
        for (const auto& provider : providers) {
            spawn_probe_task(provider, generation);
        }
        spawn_watchdog(generation);
    });
}

void HealthMonitor::stop() {
    if (running_.exchange(false, std::memory_order_acq_rel) == false) {
        return;
    }

    SEMROUTE_LOG_INFO("health", "Stopping probe tasks");

    // Signals must be emitted from the strand the tasks run on
    asio::post(strand_, [this]() {
        for (auto& [id, signal] : probe_signals_) {
            signal->emit(asio::cancellation_type::terminal);
        }
        if (watchdog_signal_) {
            watchdog_signal_->emit(asio::cancellation_type::terminal);
        }
    });
}

void HealthMonitor::watch(RegisteredProviderPtr provider) {
    if (running_.load(std::memory_order_acquire) == false) {
        return;
    }
    const auto generation = generation_.load(std::memory_order_acquire);
    asio::dispatch(strand_, [this, generation, provider = std::move(provider)]() {
        if (is_current(generation) && !probe_signals_.contains(provider->descriptor.id)) {
            spawn_probe_task(provider, generation);
        }
    });
}

void HealthMonitor::spawn_probe_task(RegisteredProviderPtr provider, Generation generation) {
    auto signal = std::make_shared<asio::cancellation_signal>();
    probe_signals_[provider->descriptor.id] = signal;

    active_tasks_.fetch_add(1, std::memory_order_acq_rel);

    asio::co_spawn(
        strand_,
        probe_loop(provider, generation),
        asio::bind_cancellation_slot(signal->slot(), [this, provider, generation, signal](std::exception_ptr error) {
            active_tasks_.fetch_sub(1, std::memory_order_acq_rel);

            if (!error || !is_current(generation)) {
                return;
            }

            const auto id = provider->descriptor.id.to_string();
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                SEMROUTE_LOG_ERROR("health", std::format("Probe task for {} crashed: {}", id, e.what()));
            } catch (...) {
                SEMROUTE_LOG_ERROR("health", std::format("Probe task for {} crashed: unknown exception", id));
            }

            respawns_.fetch_add(1, std::memory_order_relaxed);
            auto timer = std::make_shared<asio::steady_timer>(strand_, config_.probe_respawn_delay);
            timer->async_wait([this, timer, provider, generation](asio::error_code ec) {
                if (ec || !is_current(generation)) {
                    return;
                }
                spawn_probe_task(provider, generation);
            });
        })
    );
}

void HealthMonitor::spawn_watchdog(Generation generation) {
    auto signal = std::make_shared<asio::cancellation_signal>();
    watchdog_signal_ = signal;

    asio::co_spawn(
        strand_,
        watchdog_loop(generation),
        asio::bind_cancellation_slot(signal->slot(), [this, generation, signal](std::exception_ptr error) {
            if (!error || !is_current(generation)) {
                return;
            }
            SEMROUTE_LOG_ERROR("health", "Staleness watchdog stopped unexpectedly, restarting");
            spawn_watchdog(generation);
        })
    );
}

// ═══════════════════════════════════════════════════════════════════════════
// Task Bodies
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> HealthMonitor::probe_loop(RegisteredProviderPtr provider, Generation generation) {
    asio::steady_timer timer(strand_);

    while (is_current(generation)) {
        timer.expires_after(jittered_interval());
        co_await timer.async_wait(asio::use_awaitable);

        co_await probe_once(provider);
    }
}

asio::awaitable<void> HealthMonitor::watchdog_loop(Generation generation) {
    asio::steady_timer timer(strand_);

    while (is_current(generation)) {
        timer.expires_after(config_.watchdog_interval);
        co_await timer.async_wait(asio::use_awaitable);

        sweep_stale(Clock::now());
    }
}

asio::awaitable<HealthStatus> HealthMonitor::probe_once(RegisteredProviderPtr provider) {
    const auto& id = provider->descriptor.id;
    auto state = store_.state_for(provider->descriptor);
    const auto before = state->health.status();

    asio::steady_timer timeout(co_await asio::this_coro::executor);
    timeout.expires_after(config_.probe_timeout);

    const auto started = Clock::now();
    auto outcome = co_await (
        guarded_probe(provider->client) || timeout.async_wait(asio::use_awaitable)
    );
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - started);

    HealthStatus after = before;

    if (outcome.index() == 1) {
        after = state->health.observe_failure(
            ObservationSource::Probe,
            std::format("probe timed out after {}ms", config_.probe_timeout.count())
        );
        SEMROUTE_LOG_DEBUG("health", std::format("{}: probe timed out", id.to_string()));
        log_transition(id, before, after, ObservationSource::Probe);
        co_return after;
    }

    auto& guarded = std::get<0>(outcome);

    if (guarded.crash) {
        state->health.observe_failure(ObservationSource::Probe, guarded.result.error().message);
        std::rethrow_exception(guarded.crash);
    }

    if (guarded.result) {
        after = state->health.observe_success(ObservationSource::Probe, elapsed);
        SEMROUTE_LOG_TRACE("health", std::format(
            "{}: probe ok in {}us", id.to_string(), elapsed.count()));
    } else if (guarded.result.error().code == BackendError::Code::Cancelled) {
        // Monitor is stopping; not evidence about the provider
        co_return before;
    } else {
        const auto& error = guarded.result.error();
        after = state->health.observe_failure(
            ObservationSource::Probe,
            std::format("{}: {}", to_string(error.code), error.message)
        );
        SEMROUTE_LOG_DEBUG("health", std::format(
            "{}: probe failed: {}", id.to_string(), error.message));
    }

    log_transition(id, before, after, ObservationSource::Probe);
    co_return after;
}

// ═══════════════════════════════════════════════════════════════════════════
// Observations
// ═══════════════════════════════════════════════════════════════════════════

std::optional<HealthStatus> HealthMonitor::record_call_outcome(
    const ProviderId& provider,
    bool success,
    std::chrono::microseconds latency,
    std::string error
) {
    const auto entry = registry_.find(provider);
    if (!entry) {
        return std::nullopt;
    }

    auto state = store_.state_for(entry->descriptor);
    const auto before = state->health.status();
    const auto after = success
        ? state->health.observe_success(ObservationSource::Call, latency)
        : state->health.observe_failure(ObservationSource::Call, std::move(error));

    log_transition(provider, before, after, ObservationSource::Call);
    return after;
}

std::size_t HealthMonitor::sweep_stale(Clock::time_point now) {
    std::size_t demoted = 0;
    for (const auto& provider : registry_.all()) {
        auto state = store_.state_for(provider->descriptor);
        const auto before = state->health.status();
        if (auto after = state->health.degrade_if_stale(now)) {
            ++demoted;
            SEMROUTE_LOG_INFO("health", std::format(
                "{}: stale, {} -> {}",
                provider->descriptor.id.to_string(),
                to_string(before),
                to_string(*after)
            ));
        }
    }
    return demoted;
}

std::chrono::milliseconds HealthMonitor::jittered_interval() {
    // Touched only on strand_, so rng_ needs no lock
    const double jitter = config_.probe_jitter;
    if (jitter <= 0.0) {
        return config_.probe_interval;
    }
    std::uniform_real_distribution<double> dist(1.0 - jitter, 1.0 + jitter);
    const double scaled = static_cast<double>(config_.probe_interval.count()) * dist(rng_);
    return std::chrono::milliseconds{static_cast<std::int64_t>(scaled)};
}

}  // namespace semroute
