#include "semroute/core/errors.hpp"

#include <algorithm>
#include <format>

namespace semroute {

std::string AttemptRecord::describe() const {
    std::string out = std::format(
        "{} {} after {}ms",
        provider.to_string(),
        to_string(outcome),
        elapsed.count()
    );
    if (backend_error) {
        out += std::format(" ({}: {})", to_string(backend_error->code), backend_error->message);
    }
    if (dispatched == false) {
        out += " [not dispatched]";
    }
    return out;
}

RoutingError RoutingError::all_providers_failed(
    Capability capability,
    std::vector<AttemptRecord> attempts
) {
    std::string msg = std::format(
        "All {} providers failed ({} attempts)",
        to_string(capability),
        attempts.size()
    );
    return {Code::AllProvidersFailed, capability, std::move(msg), std::move(attempts)};
}

RoutingError RoutingError::cancelled(
    Capability capability,
    std::vector<AttemptRecord> attempts
) {
    return {Code::Cancelled, capability, "Request was cancelled", std::move(attempts)};
}

RoutingError RoutingError::unknown_capability(Capability capability) {
    std::string msg = std::format("No provider registered for capability {}", to_string(capability));
    return {Code::UnknownCapability, capability, std::move(msg), {}};
}

std::size_t RoutingError::dispatched_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        attempts.begin(), attempts.end(),
        [](const AttemptRecord& a) { return a.dispatched; }
    ));
}

std::string RoutingError::describe() const {
    std::string out = std::format("{}: {}", to_string(code), message);
    std::size_t index = 1;
    for (const auto& attempt : attempts) {
        out += std::format("\n  #{} {}", index, attempt.describe());
        ++index;
    }
    return out;
}

}  // namespace semroute
