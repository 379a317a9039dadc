#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Backend Guard
// ─────────────────────────────────────────────────────────────────────────────
// Adapters that turn anything a backend coroutine throws into a value, so a
// misbehaving client fails one attempt instead of unwinding the engine.
// Cancellation (asio::error::operation_aborted) maps to BackendError::Cancelled,
// any other asio::system_error to Connection, everything else to Application.

#include "semroute/backend/backend_client.hpp"

#include <asio/awaitable.hpp>

#include <exception>
#include <memory>

namespace semroute {

struct GuardedProbe {
    BackendResult<void> result;

    /// Set when the client threw something other than asio::system_error
    std::exception_ptr crash;
};

[[nodiscard]] asio::awaitable<GuardedProbe> guarded_probe(
    std::shared_ptr<IBackendClient> client
);

[[nodiscard]] asio::awaitable<BackendResult<BackendResponse>> guarded_call(
    std::shared_ptr<IBackendClient> client,
    BackendRequest request
);

}  // namespace semroute
