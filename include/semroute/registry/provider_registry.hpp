#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Provider Registry
// ═══════════════════════════════════════════════════════════════════════════
// Declarative catalog of backend instances per capability. Populated once at
// startup, read on every request.
//
// Usage:
//   ProviderRegistry registry;
//   auto added = registry.register_provider(
//       ProviderDescriptor{.id = {Capability::Embedding, "openai"}, .weight = 1.0, .quality = 0.9},
//       std::make_shared<OpenAiEmbeddingClient>(...)
//   );
//   if (!added) {
//       // DuplicateProvider / InvalidDescriptor: abort startup
//   }

#include "semroute/backend/backend_client.hpp"
#include "semroute/core/capability.hpp"
#include "semroute/core/errors.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace semroute {

/// Static description of one backend. Immutable once registered.
struct ProviderDescriptor {
    ProviderId id;

    /// Static routing preference (> 0)
    double weight{1.0};

    /// Declared quality score in [0, 1]
    double quality{0.5};

    /// Price of one billable unit (>= 0)
    double cost_per_unit{0.0};

    /// Name of the billable unit: "token", "request", "vector"...
    std::string cost_unit{"request"};

    /// Optional spend limit; exceeding it lowers the provider's score
    std::optional<double> budget;
};

/// Validate ranges of a descriptor (used by register_provider and the config loader)
[[nodiscard]] RegistryResult<void> validate_descriptor(const ProviderDescriptor& descriptor);

struct RegisteredProvider {
    ProviderDescriptor descriptor;
    std::shared_ptr<IBackendClient> client;
};

using RegisteredProviderPtr = std::shared_ptr<const RegisteredProvider>;

class ProviderRegistry {
public:
    ProviderRegistry() = default;

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /// Fails with DuplicateProvider if (capability, name) exists,
    /// InvalidDescriptor on out-of-range values or a null client.
    [[nodiscard]] RegistryResult<void> register_provider(
        ProviderDescriptor descriptor,
        std::shared_ptr<IBackendClient> client
    );

    /// All descriptors for a capability, in registration order
    [[nodiscard]] std::vector<ProviderDescriptor> list(Capability capability) const;

    /// All providers for a capability; UnknownCapability when none
    [[nodiscard]] RegistryResult<std::vector<RegisteredProviderPtr>> providers(
        Capability capability
    ) const;

    [[nodiscard]] RegisteredProviderPtr find(const ProviderId& id) const;

    /// Every registered provider across capabilities
    [[nodiscard]] std::vector<RegisteredProviderPtr> all() const;

    [[nodiscard]] bool has_capability(Capability capability) const;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ProviderId, RegisteredProviderPtr, ProviderIdHash> by_id_;
    std::unordered_map<Capability, std::vector<RegisteredProviderPtr>> by_capability_;
};

}  // namespace semroute
