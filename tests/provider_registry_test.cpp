// ─────────────────────────────────────────────────────────────────────────────
// Provider Registry Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "semroute/registry/provider_registry.hpp"
#include "mocks/mock_backend.hpp"

#include <atomic>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace semroute;
using namespace semroute::testing;

namespace {

ProviderDescriptor embedding(const std::string& name) {
    return ProviderDescriptor{.id = {Capability::Embedding, name}, .weight = 1.0, .quality = 0.8};
}

}  // namespace

TEST_CASE("Registry registers and lists providers", "[registry]") {
    ProviderRegistry registry;
    auto backend = std::make_shared<MockBackend>();

    REQUIRE(registry.register_provider(embedding("openai"), backend));
    REQUIRE(registry.register_provider(embedding("ollama"), backend));
    REQUIRE(registry.register_provider(
        ProviderDescriptor{.id = {Capability::VectorStore, "milvus"}}, backend));

    REQUIRE(registry.size() == 3);
    REQUIRE(registry.list(Capability::Embedding).size() == 2);
    REQUIRE(registry.list(Capability::VectorStore).size() == 1);
    REQUIRE(registry.has_capability(Capability::VectorStore));
    REQUIRE(registry.all().size() == 3);

    const auto found = registry.find(ProviderId{Capability::Embedding, "ollama"});
    REQUIRE(found != nullptr);
    REQUIRE(found->client == backend);
}

TEST_CASE("Registry rejects duplicate (capability, name)", "[registry]") {
    ProviderRegistry registry;
    auto backend = std::make_shared<MockBackend>();

    REQUIRE(registry.register_provider(embedding("openai"), backend));
    const auto again = registry.register_provider(embedding("openai"), backend);

    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == RegistryError::Code::DuplicateProvider);
    REQUIRE(again.error().message.find("embedding/openai") != std::string::npos);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Registry allows the same name under different capabilities", "[registry]") {
    ProviderRegistry registry;
    auto backend = std::make_shared<MockBackend>();

    REQUIRE(registry.register_provider(ProviderDescriptor{.id = {Capability::Embedding, "acme"}}, backend));
    REQUIRE(registry.register_provider(ProviderDescriptor{.id = {Capability::VectorStore, "acme"}}, backend));
    REQUIRE(registry.size() == 2);
}

TEST_CASE("Registry validates descriptors", "[registry]") {
    ProviderRegistry registry;
    auto backend = std::make_shared<MockBackend>();

    auto expect_invalid = [&](ProviderDescriptor descriptor, std::shared_ptr<IBackendClient> client) {
        const auto result = registry.register_provider(std::move(descriptor), std::move(client));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == RegistryError::Code::InvalidDescriptor);
    };

    SECTION("empty name") {
        expect_invalid(embedding(""), backend);
    }
    SECTION("non-positive weight") {
        auto d = embedding("a");
        d.weight = 0.0;
        expect_invalid(d, backend);
    }
    SECTION("quality out of range") {
        auto d = embedding("a");
        d.quality = 1.5;
        expect_invalid(d, backend);
    }
    SECTION("NaN quality") {
        auto d = embedding("a");
        d.quality = std::numeric_limits<double>::quiet_NaN();
        expect_invalid(d, backend);
    }
    SECTION("negative cost") {
        auto d = embedding("a");
        d.cost_per_unit = -0.1;
        expect_invalid(d, backend);
    }
    SECTION("negative budget") {
        auto d = embedding("a");
        d.budget = -1.0;
        expect_invalid(d, backend);
    }
    SECTION("null client") {
        expect_invalid(embedding("a"), nullptr);
    }

    REQUIRE(registry.size() == 0);
}

TEST_CASE("Registry providers() reports unknown capability", "[registry]") {
    ProviderRegistry registry;
    const auto providers = registry.providers(Capability::VectorStore);

    REQUIRE_FALSE(providers.has_value());
    REQUIRE(providers.error().code == RegistryError::Code::UnknownCapability);
    REQUIRE(registry.list(Capability::VectorStore).empty());
}

TEST_CASE("Registry concurrent lookups during registration", "[registry][concurrency]") {
    ProviderRegistry registry;
    auto backend = std::make_shared<MockBackend>();
    std::atomic<bool> done{false};
    std::atomic<int> empty_names{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&]() {
            while (done.load() == false) {
                const auto listed = registry.list(Capability::Embedding);
                for (const auto& d : listed) {
                    if (d.id.name.empty()) {
                        ++empty_names;
                    }
                }
            }
        });
    }

    for (int i = 0; i < 100; ++i) {
        REQUIRE(registry.register_provider(embedding("p" + std::to_string(i)), backend));
    }
    done = true;
    for (auto& t : readers) {
        t.join();
    }

    REQUIRE(empty_names == 0);
    REQUIRE(registry.list(Capability::Embedding).size() == 100);
}
