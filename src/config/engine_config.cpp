#include "semroute/config/engine_config.hpp"
#include "semroute/config/defaults.hpp"

#include <cmath>
#include <format>
#include <string>
#include <string_view>

namespace semroute {
namespace {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Field readers: absent key leaves `out` untouched
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<void> read_section(const Json& root, std::string_view key, const Json*& out) {
    out = nullptr;
    const auto it = root.find(std::string(key));
    if (it == root.end()) {
        return {};
    }
    if (it->is_object() == false) {
        return tl::unexpected(ConfigError::parse_error(std::format("'{}' must be an object", key)));
    }
    out = &*it;
    return {};
}

ConfigResult<void> read_double(const Json& node, std::string_view key, double& out) {
    const auto it = node.find(std::string(key));
    if (it == node.end()) {
        return {};
    }
    if (it->is_number() == false) {
        return tl::unexpected(ConfigError::parse_error(std::format("'{}' must be a number", key)));
    }
    out = it->get<double>();
    return {};
}

ConfigResult<void> read_count(const Json& node, std::string_view key, std::size_t& out) {
    const auto it = node.find(std::string(key));
    if (it == node.end()) {
        return {};
    }
    if (it->is_number_integer() == false) {
        return tl::unexpected(ConfigError::parse_error(std::format("'{}' must be an integer", key)));
    }
    const auto value = it->get<std::int64_t>();
    if (value < 0) {
        return tl::unexpected(ConfigError::invalid_value(std::format("'{}' must not be negative", key)));
    }
    out = static_cast<std::size_t>(value);
    return {};
}

ConfigResult<void> read_ms(const Json& node, std::string_view key, std::chrono::milliseconds& out) {
    const auto it = node.find(std::string(key));
    if (it == node.end()) {
        return {};
    }
    if (it->is_number_integer() == false) {
        return tl::unexpected(ConfigError::parse_error(
            std::format("'{}' must be an integer number of milliseconds", key)));
    }
    out = std::chrono::milliseconds{it->get<std::int64_t>()};
    return {};
}

ConfigResult<void> parse_health(const Json& node, HealthConfig& config) {
    return read_ms(node, "probe_interval_ms", config.probe_interval)
        .and_then([&] { return read_ms(node, "probe_timeout_ms", config.probe_timeout); })
        .and_then([&] { return read_double(node, "probe_jitter", config.probe_jitter); })
        .and_then([&] { return read_count(node, "fail_threshold", config.fail_threshold); })
        .and_then([&] { return read_count(node, "success_threshold", config.success_threshold); })
        .and_then([&] { return read_double(node, "latency_ewma_alpha", config.latency_ewma_alpha); })
        .and_then([&] { return read_count(node, "stale_after_intervals", config.stale_after_intervals); })
        .and_then([&] { return read_ms(node, "watchdog_interval_ms", config.watchdog_interval); })
        .and_then([&] { return read_ms(node, "probe_respawn_delay_ms", config.probe_respawn_delay); });
}

ConfigResult<void> parse_circuit(const Json& node, CircuitBreakerConfig& config) {
    return read_count(node, "open_threshold", config.open_threshold)
        .and_then([&] { return read_ms(node, "base_cooldown_ms", config.base_cooldown); })
        .and_then([&] { return read_ms(node, "max_cooldown_ms", config.max_cooldown); });
}

ConfigResult<void> parse_router(const Json& node, RouterConfig& config) {
    return read_double(node, "quality_weight", config.quality_weight)
        .and_then([&] { return read_double(node, "latency_weight", config.latency_weight); })
        .and_then([&] { return read_double(node, "load_weight", config.load_weight); })
        .and_then([&] { return read_double(node, "preference_weight", config.preference_weight); })
        .and_then([&] { return read_double(node, "unknown_quality_penalty", config.unknown_quality_penalty); })
        .and_then([&] { return read_double(node, "degraded_quality_penalty", config.degraded_quality_penalty); })
        .and_then([&] { return read_double(node, "unhealthy_quality_penalty", config.unhealthy_quality_penalty); })
        .and_then([&] { return read_double(node, "over_budget_penalty", config.over_budget_penalty); })
        .and_then([&] {
            return read_double(node, "cold_latency_estimate_seconds", config.cold_latency_estimate_seconds);
        });
}

ConfigResult<void> parse_failover(const Json& node, FailoverConfig& config) {
    return read_count(node, "max_attempts", config.max_attempts)
        .and_then([&] { return read_ms(node, "attempt_timeout_ms", config.attempt_timeout); })
        .and_then([&] { return read_ms(node, "request_deadline_ms", config.request_deadline); })
        .and_then([&] { return read_ms(node, "min_attempt_budget_ms", config.min_attempt_budget); });
}

tl::unexpected<ConfigError> invalid(std::string msg) {
    return tl::unexpected(ConfigError::invalid_value(std::move(msg)));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// JSON
// ═══════════════════════════════════════════════════════════════════════════

ConfigResult<EngineConfig> EngineConfig::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(ConfigError::parse_error("engine configuration must be an object"));
    }

    EngineConfig config;
    const Json* section = nullptr;

    if (auto r = read_section(j, "health", section); !r) {
        return tl::unexpected(r.error());
    }
    if (section != nullptr) {
        if (auto r = parse_health(*section, config.health); !r) {
            return tl::unexpected(r.error());
        }
    }

    if (auto r = read_section(j, "circuit", section); !r) {
        return tl::unexpected(r.error());
    }
    if (section != nullptr) {
        if (auto r = parse_circuit(*section, config.circuit); !r) {
            return tl::unexpected(r.error());
        }
    }

    if (auto r = read_section(j, "router", section); !r) {
        return tl::unexpected(r.error());
    }
    if (section != nullptr) {
        if (auto r = parse_router(*section, config.router); !r) {
            return tl::unexpected(r.error());
        }
    }

    if (auto r = read_section(j, "failover", section); !r) {
        return tl::unexpected(r.error());
    }
    if (section != nullptr) {
        if (auto r = parse_failover(*section, config.failover); !r) {
            return tl::unexpected(r.error());
        }
    }

    return config;
}

Json EngineConfig::to_json() const {
    return Json{
        {"health", {
            {"probe_interval_ms", health.probe_interval.count()},
            {"probe_timeout_ms", health.probe_timeout.count()},
            {"probe_jitter", health.probe_jitter},
            {"fail_threshold", health.fail_threshold},
            {"success_threshold", health.success_threshold},
            {"latency_ewma_alpha", health.latency_ewma_alpha},
            {"stale_after_intervals", health.stale_after_intervals},
            {"watchdog_interval_ms", health.watchdog_interval.count()},
            {"probe_respawn_delay_ms", health.probe_respawn_delay.count()},
        }},
        {"circuit", {
            {"open_threshold", circuit.open_threshold},
            {"base_cooldown_ms", circuit.base_cooldown.count()},
            {"max_cooldown_ms", circuit.max_cooldown.count()},
        }},
        {"router", {
            {"quality_weight", router.quality_weight},
            {"latency_weight", router.latency_weight},
            {"load_weight", router.load_weight},
            {"preference_weight", router.preference_weight},
            {"unknown_quality_penalty", router.unknown_quality_penalty},
            {"degraded_quality_penalty", router.degraded_quality_penalty},
            {"unhealthy_quality_penalty", router.unhealthy_quality_penalty},
            {"over_budget_penalty", router.over_budget_penalty},
            {"cold_latency_estimate_seconds", router.cold_latency_estimate_seconds},
        }},
        {"failover", {
            {"max_attempts", failover.max_attempts},
            {"attempt_timeout_ms", failover.attempt_timeout.count()},
            {"request_deadline_ms", failover.request_deadline.count()},
            {"min_attempt_budget_ms", failover.min_attempt_budget.count()},
        }},
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════════════

ConfigResult<void> EngineConfig::validate() const {
    using std::chrono::milliseconds;

    // Health
    if (health.probe_interval <= milliseconds::zero()) {
        return invalid("health.probe_interval must be positive");
    }
    if (health.probe_timeout <= milliseconds::zero()) {
        return invalid("health.probe_timeout must be positive");
    }
    if (health.probe_timeout >= health.probe_interval) {
        return invalid("health.probe_timeout must be shorter than health.probe_interval");
    }
    if (health.probe_jitter < 0.0 || health.probe_jitter >= 1.0) {
        return invalid("health.probe_jitter must be in [0, 1)");
    }
    if (health.fail_threshold == 0 || health.success_threshold == 0) {
        return invalid("health thresholds must be at least 1");
    }
    if (health.latency_ewma_alpha <= 0.0 || health.latency_ewma_alpha > 1.0) {
        return invalid("health.latency_ewma_alpha must be in (0, 1]");
    }
    if (health.stale_after_intervals == 0) {
        return invalid("health.stale_after_intervals must be at least 1");
    }
    if (health.watchdog_interval <= milliseconds::zero()) {
        return invalid("health.watchdog_interval must be positive");
    }
    if (health.probe_respawn_delay < milliseconds::zero()) {
        return invalid("health.probe_respawn_delay must not be negative");
    }

    // Circuit breaker
    if (circuit.open_threshold == 0) {
        return invalid("circuit.open_threshold must be at least 1");
    }
    if (circuit.base_cooldown <= milliseconds::zero()) {
        return invalid("circuit.base_cooldown must be positive");
    }
    if (circuit.base_cooldown > circuit.max_cooldown) {
        return invalid("circuit.base_cooldown must not exceed circuit.max_cooldown");
    }

    // Router
    for (const double weight : {router.quality_weight, router.latency_weight,
                                router.load_weight, router.preference_weight}) {
        if (weight < 0.0) {
            return invalid("router weights must not be negative");
        }
    }
    if (std::abs(router.weight_sum() - 1.0) > defaults::kWeightSumTolerance) {
        return invalid(std::format("router weights must sum to 1 (got {})", router.weight_sum()));
    }
    for (const double penalty : {router.unknown_quality_penalty, router.degraded_quality_penalty,
                                 router.unhealthy_quality_penalty, router.over_budget_penalty}) {
        if (penalty < 0.0) {
            return invalid("router penalties must not be negative");
        }
    }
    if (router.cold_latency_estimate_seconds < 0.0) {
        return invalid("router.cold_latency_estimate_seconds must not be negative");
    }

    // Failover
    if (failover.max_attempts == 0) {
        return invalid("failover.max_attempts must be at least 1");
    }
    if (failover.attempt_timeout <= milliseconds::zero()) {
        return invalid("failover.attempt_timeout must be positive");
    }
    if (failover.request_deadline <= milliseconds::zero()) {
        return invalid("failover.request_deadline must be positive");
    }
    if (failover.min_attempt_budget < milliseconds::zero()) {
        return invalid("failover.min_attempt_budget must not be negative");
    }

    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Builders
// ─────────────────────────────────────────────────────────────────────────────

EngineConfig& EngineConfig::with_health(HealthConfig config) {
    health = std::move(config);
    return *this;
}

EngineConfig& EngineConfig::with_circuit_breaker(CircuitBreakerConfig config) {
    circuit = config;
    return *this;
}

EngineConfig& EngineConfig::with_router(RouterConfig config) {
    router = config;
    return *this;
}

EngineConfig& EngineConfig::with_failover(FailoverConfig config) {
    failover = config;
    return *this;
}

EngineConfig& EngineConfig::with_probe_interval(
    std::chrono::milliseconds interval,
    std::chrono::milliseconds timeout
) {
    health.probe_interval = interval;
    health.probe_timeout = timeout;
    return *this;
}

EngineConfig& EngineConfig::with_thresholds(std::size_t fail_threshold, std::size_t success_threshold) {
    health.fail_threshold = fail_threshold;
    health.success_threshold = success_threshold;
    return *this;
}

EngineConfig& EngineConfig::with_cooldown(std::chrono::milliseconds base, std::chrono::milliseconds max) {
    circuit.base_cooldown = base;
    circuit.max_cooldown = max;
    return *this;
}

EngineConfig& EngineConfig::with_router_weights(double quality, double latency, double load, double preference) {
    router.quality_weight = quality;
    router.latency_weight = latency;
    router.load_weight = load;
    router.preference_weight = preference;
    return *this;
}

EngineConfig& EngineConfig::with_max_attempts(std::size_t attempts) {
    failover.max_attempts = attempts;
    return *this;
}

EngineConfig& EngineConfig::with_attempt_timeout(std::chrono::milliseconds timeout) {
    failover.attempt_timeout = timeout;
    return *this;
}

EngineConfig& EngineConfig::with_request_deadline(std::chrono::milliseconds deadline) {
    failover.request_deadline = deadline;
    return *this;
}

// ═══════════════════════════════════════════════════════════════════════════
// Provider Catalog
// ═══════════════════════════════════════════════════════════════════════════

ConfigResult<std::vector<ProviderDescriptor>> load_provider_descriptors(const Json& catalog) {
    if (catalog.is_array() == false) {
        return tl::unexpected(ConfigError::parse_error("provider catalog must be an array"));
    }

    std::vector<ProviderDescriptor> descriptors;
    descriptors.reserve(catalog.size());

    std::size_t index = 0;
    for (const auto& entry : catalog) {
        const auto where = [index](std::string_view what) {
            return std::format("provider #{}: {}", index, what);
        };

        if (entry.is_object() == false) {
            return tl::unexpected(ConfigError::parse_error(where("entry must be an object")));
        }

        const auto name = entry.find("name");
        if (name == entry.end() || name->is_string() == false) {
            return tl::unexpected(ConfigError::parse_error(where("'name' must be a string")));
        }

        const auto capability_node = entry.find("capability");
        if (capability_node == entry.end() || capability_node->is_string() == false) {
            return tl::unexpected(ConfigError::parse_error(where("'capability' must be a string")));
        }
        const auto capability = capability_from_string(capability_node->get<std::string>());
        if (!capability) {
            return tl::unexpected(ConfigError::invalid_value(
                where(std::format("unknown capability '{}'", capability_node->get<std::string>()))));
        }

        ProviderDescriptor descriptor;
        descriptor.id = ProviderId{*capability, name->get<std::string>()};

        auto fields = read_double(entry, "weight", descriptor.weight)
            .and_then([&] { return read_double(entry, "quality", descriptor.quality); })
            .and_then([&] { return read_double(entry, "cost_per_unit", descriptor.cost_per_unit); });
        if (!fields) {
            return tl::unexpected(ConfigError{fields.error().code, where(fields.error().message)});
        }

        if (const auto unit = entry.find("cost_unit"); unit != entry.end()) {
            if (unit->is_string() == false) {
                return tl::unexpected(ConfigError::parse_error(where("'cost_unit' must be a string")));
            }
            descriptor.cost_unit = unit->get<std::string>();
        }

        if (const auto budget = entry.find("budget"); budget != entry.end() && budget->is_null() == false) {
            if (budget->is_number() == false) {
                return tl::unexpected(ConfigError::parse_error(where("'budget' must be a number")));
            }
            descriptor.budget = budget->get<double>();
        }

        if (auto valid = validate_descriptor(descriptor); !valid) {
            return tl::unexpected(ConfigError::invalid_value(where(valid.error().message)));
        }

        descriptors.push_back(std::move(descriptor));
        ++index;
    }

    return descriptors;
}

}  // namespace semroute
