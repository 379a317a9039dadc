#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Routing Observer
// ─────────────────────────────────────────────────────────────────────────────
// Per-request observability hook. The failover coordinator emits exactly one
// RoutingReport per execute() call, after the outcome is known and with no
// lock held. Observers must not block.

#include "semroute/core/errors.hpp"
#include "semroute/routing/router.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace semroute {

struct RoutingReport {
    Capability capability{Capability::Embedding};

    /// Provider that answered; empty on failure
    std::optional<ProviderId> chosen;

    /// Score of the chosen provider at ranking time
    std::optional<ScoreBreakdown> winning_score;

    std::vector<RankedCandidate> ranking;
    std::vector<AttemptRecord> attempts;
    std::chrono::milliseconds elapsed{0};

    /// Billed cost of the successful call
    double cost{0.0};

    /// Empty on success
    std::optional<RoutingError::Code> error;

    [[nodiscard]] bool succeeded() const noexcept { return !error.has_value(); }
};

class IRoutingObserver {
public:
    virtual ~IRoutingObserver() = default;

    virtual void on_request_complete(const RoutingReport& report) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Writes one line per request through the global logger ("failover"
/// component): Debug on success, Warn on failure.
class LogRoutingObserver final : public IRoutingObserver {
public:
    void on_request_complete(const RoutingReport& report) override;
    [[nodiscard]] std::string_view name() const override { return "log"; }
};

/// Fan-out to several observers, in insertion order
class MultiRoutingObserver final : public IRoutingObserver {
public:
    void add(std::shared_ptr<IRoutingObserver> observer);

    void on_request_complete(const RoutingReport& report) override;
    [[nodiscard]] std::string_view name() const override { return "multi"; }

    [[nodiscard]] std::size_t size() const noexcept { return observers_.size(); }

private:
    std::vector<std::shared_ptr<IRoutingObserver>> observers_;
};

}  // namespace semroute
