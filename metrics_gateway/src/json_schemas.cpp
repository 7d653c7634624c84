#include "json_schemas.hpp"

namespace {

const char* payload_key(GatherKind kind) {
    return kind == GatherKind::HEALTH ? "healthStatus" : "metrics";
}

}

nlohmann::json GatherRequest::to_json() const {
    return nlohmann::json{
        {"type", kind == GatherKind::HEALTH ? message_type::kGetStatsRequest
                                            : message_type::kGetMetricsRequest},
        {"requestId", request_id}
    };
}

std::optional<GatherRequest> GatherRequest::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("requestId") || !j["requestId"].is_number_unsigned()) {
        return std::nullopt;
    }

    std::string type = j.value("type", "");
    GatherRequest req;
    if (type == message_type::kGetStatsRequest) {
        req.kind = GatherKind::HEALTH;
    } else if (type == message_type::kGetMetricsRequest) {
        req.kind = GatherKind::METRICS;
    } else {
        return std::nullopt;
    }
    req.request_id = j["requestId"].get<uint64_t>();
    return req;
}

nlohmann::json GatherResponse::to_json() const {
    nlohmann::json j{
        {"type", kind == GatherKind::HEALTH ? message_type::kGetStatsResponse
                                            : message_type::kGetMetricsResponse},
        {"requestId", request_id}
    };
    if (error) {
        j["error"] = *error;
    } else {
        j[payload_key(kind)] = payload;
    }
    return j;
}

std::optional<GatherResponse> GatherResponse::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("requestId") || !j["requestId"].is_number_unsigned()) {
        return std::nullopt;
    }

    std::string type = j.value("type", "");
    GatherResponse reply;
    if (type == message_type::kGetStatsResponse) {
        reply.kind = GatherKind::HEALTH;
    } else if (type == message_type::kGetMetricsResponse) {
        reply.kind = GatherKind::METRICS;
    } else {
        return std::nullopt;
    }
    reply.request_id = j["requestId"].get<uint64_t>();

    auto error_it = j.find("error");
    if (error_it != j.end() && !error_it->is_null()) {
        reply.error = error_it->is_string() ? error_it->get<std::string>() : error_it->dump();
    } else {
        reply.payload = j.value(payload_key(reply.kind), nlohmann::json());
    }
    return reply;
}
