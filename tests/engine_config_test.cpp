// ─────────────────────────────────────────────────────────────────────────────
// Engine Configuration Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "semroute/config/engine_config.hpp"

using namespace semroute;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Defaults and validation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Default configuration is valid", "[config]") {
    EngineConfig config;

    REQUIRE(config.validate());
    REQUIRE(config.health.probe_interval == 10s);
    REQUIRE(config.health.probe_timeout == 2s);
    REQUIRE(config.health.fail_threshold == 3);
    REQUIRE(config.health.success_threshold == 2);
    REQUIRE(config.circuit.open_threshold == 5);
    REQUIRE(config.circuit.base_cooldown == 5s);
    REQUIRE(config.circuit.max_cooldown == 5min);
    REQUIRE(config.failover.max_attempts == 3);
    REQUIRE_THAT(config.router.weight_sum(), WithinAbs(1.0, 1e-9));
}

TEST_CASE("validate() rejects out-of-range values", "[config]") {
    EngineConfig config;

    auto expect_invalid = [](const EngineConfig& c, const std::string& fragment) {
        const auto result = c.validate();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ConfigError::Code::InvalidValue);
        REQUIRE_THAT(result.error().message, ContainsSubstring(fragment));
    };

    SECTION("probe timeout not below interval") {
        config.with_probe_interval(1s, 1s);
        expect_invalid(config, "probe_timeout");
    }
    SECTION("zero thresholds") {
        config.with_thresholds(0, 2);
        expect_invalid(config, "thresholds");
    }
    SECTION("jitter of one") {
        config.health.probe_jitter = 1.0;
        expect_invalid(config, "probe_jitter");
    }
    SECTION("ewma alpha of zero") {
        config.health.latency_ewma_alpha = 0.0;
        expect_invalid(config, "latency_ewma_alpha");
    }
    SECTION("base cooldown above max") {
        config.with_cooldown(10s, 5s);
        expect_invalid(config, "base_cooldown");
    }
    SECTION("zero open threshold") {
        config.circuit.open_threshold = 0;
        expect_invalid(config, "open_threshold");
    }
    SECTION("weights not summing to one") {
        config.with_router_weights(0.5, 0.3, 0.1);
        expect_invalid(config, "sum to 1");
    }
    SECTION("negative weight") {
        config.with_router_weights(1.2, -0.2, 0.0);
        expect_invalid(config, "negative");
    }
    SECTION("negative penalty") {
        config.router.degraded_quality_penalty = -0.1;
        expect_invalid(config, "penalties");
    }
    SECTION("zero attempts") {
        config.with_max_attempts(0);
        expect_invalid(config, "max_attempts");
    }
    SECTION("zero attempt timeout") {
        config.with_attempt_timeout(0ms);
        expect_invalid(config, "attempt_timeout");
    }
    SECTION("zero deadline") {
        config.with_request_deadline(0ms);
        expect_invalid(config, "request_deadline");
    }
}

TEST_CASE("Builders chain", "[config]") {
    auto config = EngineConfig{}
        .with_probe_interval(500ms, 100ms)
        .with_thresholds(2, 1)
        .with_cooldown(1s, 8s)
        .with_router_weights(0.4, 0.4, 0.1, 0.1)
        .with_max_attempts(5)
        .with_attempt_timeout(250ms)
        .with_request_deadline(3s);

    REQUIRE(config.validate());
    REQUIRE(config.health.probe_interval == 500ms);
    REQUIRE(config.health.probe_timeout == 100ms);
    REQUIRE(config.health.fail_threshold == 2);
    REQUIRE(config.health.success_threshold == 1);
    REQUIRE(config.circuit.base_cooldown == 1s);
    REQUIRE(config.circuit.max_cooldown == 8s);
    REQUIRE_THAT(config.router.preference_weight, WithinAbs(0.1, 1e-12));
    REQUIRE(config.failover.max_attempts == 5);
    REQUIRE(config.failover.attempt_timeout == 250ms);
    REQUIRE(config.failover.request_deadline == 3s);
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("from_json keeps defaults for missing keys", "[config][json]") {
    const auto parsed = EngineConfig::from_json(json::object());
    REQUIRE(parsed);
    REQUIRE(parsed->to_json() == EngineConfig{}.to_json());
}

TEST_CASE("from_json applies overrides", "[config][json]") {
    const auto document = json::parse(R"({
        "health":   { "probe_interval_ms": 1000, "probe_timeout_ms": 200, "fail_threshold": 4 },
        "circuit":  { "open_threshold": 2, "base_cooldown_ms": 250 },
        "router":   { "quality_weight": 0.5, "latency_weight": 0.4 },
        "failover": { "max_attempts": 2, "request_deadline_ms": 1500 }
    })");

    const auto parsed = EngineConfig::from_json(document);
    REQUIRE(parsed);
    REQUIRE(parsed->health.probe_interval == 1000ms);
    REQUIRE(parsed->health.probe_timeout == 200ms);
    REQUIRE(parsed->health.fail_threshold == 4);
    REQUIRE(parsed->health.success_threshold == 2);
    REQUIRE(parsed->circuit.open_threshold == 2);
    REQUIRE(parsed->circuit.base_cooldown == 250ms);
    REQUIRE_THAT(parsed->router.quality_weight, WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(parsed->router.latency_weight, WithinAbs(0.4, 1e-12));
    REQUIRE(parsed->failover.max_attempts == 2);
    REQUIRE(parsed->failover.request_deadline == 1500ms);
    REQUIRE(parsed->validate());
}

TEST_CASE("from_json reports malformed documents", "[config][json]") {
    auto expect_error = [](const json& document, ConfigError::Code code, const std::string& fragment) {
        const auto parsed = EngineConfig::from_json(document);
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == code);
        REQUIRE_THAT(parsed.error().message, ContainsSubstring(fragment));
    };

    SECTION("root is not an object") {
        expect_error(json::array(), ConfigError::Code::ParseError, "object");
    }
    SECTION("section is not an object") {
        expect_error(json{{"health", 3}}, ConfigError::Code::ParseError, "'health'");
    }
    SECTION("duration is not an integer") {
        expect_error(json{{"failover", {{"attempt_timeout_ms", "fast"}}}},
                     ConfigError::Code::ParseError, "attempt_timeout_ms");
    }
    SECTION("weight is not a number") {
        expect_error(json{{"router", {{"load_weight", true}}}},
                     ConfigError::Code::ParseError, "load_weight");
    }
    SECTION("negative count") {
        expect_error(json{{"circuit", {{"open_threshold", -1}}}},
                     ConfigError::Code::InvalidValue, "open_threshold");
    }
}

TEST_CASE("to_json output parses back to the same configuration", "[config][json]") {
    auto config = EngineConfig{}
        .with_probe_interval(750ms, 150ms)
        .with_cooldown(2s, 1min)
        .with_max_attempts(4);
    config.router.over_budget_penalty = 0.4;

    const auto parsed = EngineConfig::from_json(json::parse(config.to_json().dump()));
    REQUIRE(parsed);
    REQUIRE(parsed->to_json() == config.to_json());
}

// ═══════════════════════════════════════════════════════════════════════════
// Provider Catalog
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("load_provider_descriptors parses a catalog", "[config][catalog]") {
    const auto catalog = json::parse(R"([
        { "name": "openai", "capability": "embedding", "weight": 2.0, "quality": 0.9,
          "cost_per_unit": 0.00002, "cost_unit": "token", "budget": 50.0 },
        { "name": "milvus", "capability": "vector_store" },
        { "name": "ollama", "capability": "embedding", "budget": null }
    ])");

    const auto descriptors = load_provider_descriptors(catalog);
    REQUIRE(descriptors);
    REQUIRE(descriptors->size() == 3);

    const auto& openai = (*descriptors)[0];
    REQUIRE(openai.id == ProviderId{Capability::Embedding, "openai"});
    REQUIRE_THAT(openai.weight, WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(openai.quality, WithinAbs(0.9, 1e-12));
    REQUIRE(openai.cost_unit == "token");
    REQUIRE(openai.budget.has_value());

    const auto& milvus = (*descriptors)[1];
    REQUIRE(milvus.id.capability == Capability::VectorStore);
    REQUIRE_THAT(milvus.weight, WithinAbs(1.0, 1e-12));
    REQUIRE_FALSE(milvus.budget.has_value());

    REQUIRE_FALSE((*descriptors)[2].budget.has_value());
}

TEST_CASE("load_provider_descriptors rejects bad entries", "[config][catalog]") {
    auto expect_error = [](const std::string& text, ConfigError::Code code, const std::string& fragment) {
        const auto result = load_provider_descriptors(json::parse(text));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == code);
        REQUIRE_THAT(result.error().message, ContainsSubstring(fragment));
    };

    SECTION("not an array") {
        expect_error(R"({"name": "a"})", ConfigError::Code::ParseError, "array");
    }
    SECTION("missing name") {
        expect_error(R"([{"capability": "embedding"}])", ConfigError::Code::ParseError, "provider #0");
    }
    SECTION("unknown capability") {
        expect_error(R"([{"name": "a", "capability": "telepathy"}])",
                     ConfigError::Code::InvalidValue, "telepathy");
    }
    SECTION("quality out of range in second entry") {
        expect_error(R"([{"name": "a", "capability": "embedding"},
                         {"name": "b", "capability": "embedding", "quality": 7}])",
                     ConfigError::Code::InvalidValue, "provider #1");
    }
    SECTION("cost unit of wrong type") {
        expect_error(R"([{"name": "a", "capability": "embedding", "cost_unit": 1}])",
                     ConfigError::Code::ParseError, "cost_unit");
    }
}
