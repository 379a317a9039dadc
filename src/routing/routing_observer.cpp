#include "semroute/routing/routing_observer.hpp"
#include "semroute/log/logger.hpp"

#include <format>

namespace semroute {

void LogRoutingObserver::on_request_complete(const RoutingReport& report) {
    if (report.succeeded()) {
        SEMROUTE_LOG_DEBUG("failover", std::format(
            "{} served by {} in {}ms (attempts={} score={:.4f} cost={:.6f})",
            to_string(report.capability),
            report.chosen ? report.chosen->to_string() : std::string("?"),
            report.elapsed.count(),
            report.attempts.size(),
            report.winning_score ? report.winning_score->total : 0.0,
            report.cost
        ));
        return;
    }

    SEMROUTE_LOG_WARN("failover", std::format(
        "{} request failed with {} after {}ms ({} attempts)",
        to_string(report.capability),
        to_string(*report.error),
        report.elapsed.count(),
        report.attempts.size()
    ));
}

void MultiRoutingObserver::add(std::shared_ptr<IRoutingObserver> observer) {
    if (observer != nullptr) {
        observers_.push_back(std::move(observer));
    }
}

void MultiRoutingObserver::on_request_complete(const RoutingReport& report) {
    for (auto& observer : observers_) {
        observer->on_request_complete(report);
    }
}

}  // namespace semroute
