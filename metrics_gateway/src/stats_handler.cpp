#include "stats_handler.hpp"
#include "access_guard.hpp"
#include "metric_families.hpp"
#include "response_writer.hpp"
#include <spdlog/spdlog.h>

StatsRequestHandler::StatsRequestHandler(std::optional<std::string> access_token,
                                         MetricsRegistry& metrics,
                                         AggregationCoordinator* coordinator)
    : access_token_(std::move(access_token)), metrics_(metrics), coordinator_(coordinator) {}

void StatsRequestHandler::handle(const httplib::Request& req, httplib::Response& res) const {
    if (!check_access(req, access_token_)) {
        send_403(res);
        return;
    }

    try {
        std::string data = coordinator_ ? cluster_snapshot() : metrics_.snapshot();
        send_text(res, data, metrics_.content_type());
    } catch (const std::exception& e) {
        spdlog::warn("Stats request failed: {}", e.what());
        send_500(res);
    }
}

std::string StatsRequestHandler::cluster_snapshot() const {
    auto local = metric_families_to_json(metrics_.collect());
    uint64_t request_id = coordinator_->next_request_id();
    auto parts = coordinator_->gather_metrics(std::move(local), request_id).get();

    std::vector<std::vector<prometheus::MetricFamily>> per_process;
    per_process.reserve(parts.size());
    for (const auto& part : parts) {
        per_process.push_back(metric_families_from_json(part));
    }
    return serialize_metric_families(merge_metric_families(per_process));
}
