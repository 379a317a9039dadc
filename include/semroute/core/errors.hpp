#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Error Types
// ═══════════════════════════════════════════════════════════════════════════
// Every fallible operation returns a tl::expected carrying one of these.
//
//   BackendError   - a single backend call or probe failed
//   RegistryError  - startup-time catalog misuse
//   ConfigError    - invalid configuration values or documents
//   RoutingError   - what execute() returns when no provider answered
//
// Individual backend failures never reach callers directly: the failover
// coordinator folds them into the attempt log of a RoutingError.

#include "semroute/core/capability.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace semroute {

// ─────────────────────────────────────────────────────────────────────────────
// BackendError
// ─────────────────────────────────────────────────────────────────────────────

struct BackendError {
    enum class Code {
        Timeout,      // Call or probe exceeded its time budget
        Connection,   // Could not reach the backend
        Application,  // Backend answered with an error
        Cancelled     // Caller cancelled the operation
    };

    Code code{Code::Application};
    std::string message;

    [[nodiscard]] static BackendError timeout(std::string msg) {
        return {Code::Timeout, std::move(msg)};
    }

    [[nodiscard]] static BackendError connection(std::string msg) {
        return {Code::Connection, std::move(msg)};
    }

    [[nodiscard]] static BackendError application(std::string msg) {
        return {Code::Application, std::move(msg)};
    }

    [[nodiscard]] static BackendError cancelled() {
        return {Code::Cancelled, "Operation was cancelled"};
    }
};

[[nodiscard]] constexpr std::string_view to_string(BackendError::Code code) noexcept {
    switch (code) {
        case BackendError::Code::Timeout:     return "Timeout";
        case BackendError::Code::Connection:  return "Connection";
        case BackendError::Code::Application: return "Application";
        case BackendError::Code::Cancelled:   return "Cancelled";
        default:                              return "Unknown";
    }
}

template <typename T>
using BackendResult = tl::expected<T, BackendError>;

// ─────────────────────────────────────────────────────────────────────────────
// RegistryError
// ─────────────────────────────────────────────────────────────────────────────

struct RegistryError {
    enum class Code {
        DuplicateProvider,  // (capability, name) already registered
        UnknownCapability,  // No provider registered for the capability
        InvalidDescriptor   // Weight/quality/cost out of range, empty name, null client
    };

    Code code{Code::InvalidDescriptor};
    std::string message;

    [[nodiscard]] static RegistryError duplicate_provider(const ProviderId& id) {
        return {Code::DuplicateProvider, "Provider already registered: " + id.to_string()};
    }

    [[nodiscard]] static RegistryError unknown_capability(Capability capability) {
        return {Code::UnknownCapability,
                "No provider registered for capability " + std::string(to_string(capability))};
    }

    [[nodiscard]] static RegistryError invalid_descriptor(std::string msg) {
        return {Code::InvalidDescriptor, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(RegistryError::Code code) noexcept {
    switch (code) {
        case RegistryError::Code::DuplicateProvider: return "DuplicateProvider";
        case RegistryError::Code::UnknownCapability: return "UnknownCapability";
        case RegistryError::Code::InvalidDescriptor: return "InvalidDescriptor";
        default:                                     return "Unknown";
    }
}

template <typename T>
using RegistryResult = tl::expected<T, RegistryError>;

// ─────────────────────────────────────────────────────────────────────────────
// ConfigError
// ─────────────────────────────────────────────────────────────────────────────

struct ConfigError {
    enum class Code {
        InvalidValue,  // Value present but out of range
        ParseError     // Document malformed or wrong JSON type
    };

    Code code{Code::InvalidValue};
    std::string message;

    [[nodiscard]] static ConfigError invalid_value(std::string msg) {
        return {Code::InvalidValue, std::move(msg)};
    }

    [[nodiscard]] static ConfigError parse_error(std::string msg) {
        return {Code::ParseError, std::move(msg)};
    }
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

// ─────────────────────────────────────────────────────────────────────────────
// Attempt Log
// ─────────────────────────────────────────────────────────────────────────────

enum class AttemptOutcome {
    Succeeded,    ///< Backend answered; always the last entry of a log
    Failed,       ///< Backend returned an error
    TimedOut,     ///< Per-attempt timeout fired before the backend answered
    CircuitOpen,  ///< Rejected by the breaker, never dispatched
    Cancelled     ///< Caller cancelled while the attempt was in flight
};

[[nodiscard]] constexpr std::string_view to_string(AttemptOutcome outcome) noexcept {
    switch (outcome) {
        case AttemptOutcome::Succeeded:   return "Succeeded";
        case AttemptOutcome::Failed:      return "Failed";
        case AttemptOutcome::TimedOut:    return "TimedOut";
        case AttemptOutcome::CircuitOpen: return "CircuitOpen";
        case AttemptOutcome::Cancelled:   return "Cancelled";
        default:                          return "Unknown";
    }
}

struct AttemptRecord {
    ProviderId provider;
    AttemptOutcome outcome{AttemptOutcome::Failed};
    std::optional<BackendError> backend_error;  ///< Set for failed dispatched attempts
    std::chrono::milliseconds elapsed{0};
    bool dispatched{true};                      ///< false for circuit rejections

    [[nodiscard]] std::string describe() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// RoutingError
// ─────────────────────────────────────────────────────────────────────────────

struct RoutingError {
    enum class Code {
        AllProvidersFailed,  // Every candidate was tried or rejected
        Cancelled,           // Caller cancelled the request
        UnknownCapability    // Nothing registered for the requested capability
    };

    Code code{Code::AllProvidersFailed};
    Capability capability{Capability::Embedding};
    std::string message;
    std::vector<AttemptRecord> attempts;

    [[nodiscard]] static RoutingError all_providers_failed(
        Capability capability,
        std::vector<AttemptRecord> attempts
    );

    [[nodiscard]] static RoutingError cancelled(
        Capability capability,
        std::vector<AttemptRecord> attempts
    );

    [[nodiscard]] static RoutingError unknown_capability(Capability capability);

    /// Number of attempts that actually reached a backend
    [[nodiscard]] std::size_t dispatched_count() const noexcept;

    /// Multi-line summary naming every provider tried and why it failed
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] constexpr std::string_view to_string(RoutingError::Code code) noexcept {
    switch (code) {
        case RoutingError::Code::AllProvidersFailed: return "AllProvidersFailed";
        case RoutingError::Code::Cancelled:          return "Cancelled";
        case RoutingError::Code::UnknownCapability:  return "UnknownCapability";
        default:                                     return "Unknown";
    }
}

template <typename T>
using RoutingResult = tl::expected<T, RoutingError>;

}  // namespace semroute
