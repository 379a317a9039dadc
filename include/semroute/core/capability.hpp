#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities and Provider Identity
// ═══════════════════════════════════════════════════════════════════════════
// A capability is the abstract kind of backend the engine routes to. A
// provider is identified by (capability, name); the same name may be reused
// across capabilities (e.g. one vendor offering both embeddings and storage).

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace semroute {

enum class Capability {
    Embedding,    ///< Text-embedding generator
    VectorStore   ///< Vector database
};

[[nodiscard]] constexpr std::string_view to_string(Capability capability) noexcept {
    switch (capability) {
        case Capability::Embedding:   return "embedding";
        case Capability::VectorStore: return "vector_store";
        default:                      return "unknown";
    }
}

[[nodiscard]] inline std::optional<Capability> capability_from_string(std::string_view text) noexcept {
    if (text == "embedding") {
        return Capability::Embedding;
    }
    if (text == "vector_store") {
        return Capability::VectorStore;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ProviderId
// ─────────────────────────────────────────────────────────────────────────────

struct ProviderId {
    Capability capability{Capability::Embedding};
    std::string name;

    /// "embedding/openai"
    [[nodiscard]] std::string to_string() const {
        std::string out(semroute::to_string(capability));
        out += '/';
        out += name;
        return out;
    }

    friend bool operator==(const ProviderId&, const ProviderId&) = default;
};

struct ProviderIdHash {
    std::size_t operator()(const ProviderId& id) const noexcept {
        const std::size_t h1 = std::hash<int>{}(static_cast<int>(id.capability));
        const std::size_t h2 = std::hash<std::string>{}(id.name);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

}  // namespace semroute
