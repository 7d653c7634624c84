#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

// What a fan-out request asks each worker for.
enum class GatherKind {
    HEALTH,
    METRICS
};

namespace message_type {
    inline constexpr const char* kGetStatsRequest = "getStatsRequest";
    inline constexpr const char* kGetStatsResponse = "getStatsResponse";
    inline constexpr const char* kGetMetricsRequest = "getMetricsRequest";
    inline constexpr const char* kGetMetricsResponse = "getMetricsResponse";
}

struct GatherRequest {
    GatherKind kind = GatherKind::HEALTH;
    uint64_t request_id = 0;

    nlohmann::json to_json() const;
    // Returns nullopt for messages that are not fan-out requests.
    static std::optional<GatherRequest> from_json(const nlohmann::json& j);
};

struct GatherResponse {
    GatherKind kind = GatherKind::HEALTH;
    uint64_t request_id = 0;
    nlohmann::json payload;
    std::optional<std::string> error;

    nlohmann::json to_json() const;
    static std::optional<GatherResponse> from_json(const nlohmann::json& j);
};
