#include "semroute/registry/provider_registry.hpp"
#include "semroute/log/logger.hpp"

#include <format>
#include <mutex>

namespace semroute {

RegistryResult<void> validate_descriptor(const ProviderDescriptor& descriptor) {
    const auto& id = descriptor.id;
    if (id.name.empty()) {
        return tl::unexpected(RegistryError::invalid_descriptor("Provider name must not be empty"));
    }
    if ((descriptor.weight > 0.0) == false) {
        return tl::unexpected(RegistryError::invalid_descriptor(
            std::format("{}: weight must be > 0 (got {})", id.to_string(), descriptor.weight)));
    }
    const bool quality_in_range = (descriptor.quality >= 0.0) && (descriptor.quality <= 1.0);
    if (quality_in_range == false) {
        return tl::unexpected(RegistryError::invalid_descriptor(
            std::format("{}: quality must be in [0, 1] (got {})", id.to_string(), descriptor.quality)));
    }
    if ((descriptor.cost_per_unit >= 0.0) == false) {
        return tl::unexpected(RegistryError::invalid_descriptor(
            std::format("{}: cost_per_unit must be >= 0", id.to_string())));
    }
    if (descriptor.budget.has_value() && (*descriptor.budget >= 0.0) == false) {
        return tl::unexpected(RegistryError::invalid_descriptor(
            std::format("{}: budget must be >= 0", id.to_string())));
    }
    return {};
}

RegistryResult<void> ProviderRegistry::register_provider(
    ProviderDescriptor descriptor,
    std::shared_ptr<IBackendClient> client
) {
    if (auto valid = validate_descriptor(descriptor); !valid) {
        return valid;
    }
    if (!client) {
        return tl::unexpected(RegistryError::invalid_descriptor(
            descriptor.id.to_string() + ": backend client must not be null"));
    }

    const ProviderId id = descriptor.id;
    auto entry = std::make_shared<const RegisteredProvider>(
        RegisteredProvider{std::move(descriptor), std::move(client)}
    );

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const auto [it, inserted] = by_id_.try_emplace(id, entry);
        if (inserted == false) {
            return tl::unexpected(RegistryError::duplicate_provider(id));
        }
        by_capability_[id.capability].push_back(std::move(entry));
    }

    SEMROUTE_LOG_INFO("registry", std::format("Registered provider {}", id.to_string()));
    return {};
}

std::vector<ProviderDescriptor> ProviderRegistry::list(Capability capability) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ProviderDescriptor> out;
    const auto it = by_capability_.find(capability);
    if (it == by_capability_.end()) {
        return out;
    }
    out.reserve(it->second.size());
    for (const auto& entry : it->second) {
        out.push_back(entry->descriptor);
    }
    return out;
}

RegistryResult<std::vector<RegisteredProviderPtr>> ProviderRegistry::providers(
    Capability capability
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = by_capability_.find(capability);
    const bool known = (it != by_capability_.end()) && (it->second.empty() == false);
    if (known == false) {
        return tl::unexpected(RegistryError::unknown_capability(capability));
    }
    return it->second;
}

RegisteredProviderPtr ProviderRegistry::find(const ProviderId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<RegisteredProviderPtr> ProviderRegistry::all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<RegisteredProviderPtr> out;
    out.reserve(by_id_.size());
    for (const auto& [capability, entries] : by_capability_) {
        out.insert(out.end(), entries.begin(), entries.end());
    }
    return out;
}

bool ProviderRegistry::has_capability(Capability capability) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = by_capability_.find(capability);
    return (it != by_capability_.end()) && (it->second.empty() == false);
}

std::size_t ProviderRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_id_.size();
}

}  // namespace semroute
