#pragma once
#include "aggregation_coordinator.hpp"
#include "metrics_registry.hpp"
#include <httplib.h>
#include <optional>
#include <string>

// Serves the stats endpoint with the text exposition of this process, or of
// the whole cluster when a coordinator is attached.
class StatsRequestHandler {
public:
    StatsRequestHandler(std::optional<std::string> access_token, MetricsRegistry& metrics,
                        AggregationCoordinator* coordinator);

    void handle(const httplib::Request& req, httplib::Response& res) const;

private:
    std::string cluster_snapshot() const;

    std::optional<std::string> access_token_;
    MetricsRegistry& metrics_;
    AggregationCoordinator* coordinator_;
};
