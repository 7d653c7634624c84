#pragma once
#include "aggregation_coordinator.hpp"
#include "callbacks.hpp"
#include <httplib.h>
#include <optional>
#include <string>

// Serves the health endpoint. Without a coordinator the local status is
// returned as is; with one, it seeds a cluster-wide aggregation.
class HealthRequestHandler {
public:
    HealthRequestHandler(std::optional<std::string> access_token, HealthCallback health_callback,
                         AggregationCoordinator* coordinator);

    void handle(const httplib::Request& req, httplib::Response& res) const;

private:
    nlohmann::json collect_local_status() const;

    std::optional<std::string> access_token_;
    HealthCallback health_callback_;
    AggregationCoordinator* coordinator_;
};
