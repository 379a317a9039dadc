#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Backend Client Interface
// ═══════════════════════════════════════════════════════════════════════════
// The engine never knows concrete backend types. Anything that can answer a
// request and a lightweight reachability probe can be registered for a
// capability.
//
// Implementations must suspend only on cancellable Asio operations so the
// coordinator's per-attempt timeout and caller cancellation can abort them.

#include "semroute/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <asio/awaitable.hpp>

#include <cstdint>
#include <string>

namespace semroute {

using Json = nlohmann::json;

/// Opaque request forwarded to the chosen backend
struct BackendRequest {
    std::string operation;  ///< e.g. "embed_batch", "search"
    Json payload;
};

struct BackendResponse {
    Json payload;

    /// Billable units consumed by this call (tokens, vectors, requests...)
    std::uint64_t units{1};
};

class IBackendClient {
public:
    virtual ~IBackendClient() = default;

    /// Perform a real request
    [[nodiscard]] virtual asio::awaitable<BackendResult<BackendResponse>> async_call(
        BackendRequest request
    ) = 0;

    /// Cheap synthetic call used by the health monitor
    [[nodiscard]] virtual asio::awaitable<BackendResult<void>> async_probe() = 0;
};

}  // namespace semroute
