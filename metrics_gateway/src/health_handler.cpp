#include "health_handler.hpp"
#include "access_guard.hpp"
#include "errors.hpp"
#include "response_writer.hpp"
#include <spdlog/spdlog.h>

HealthRequestHandler::HealthRequestHandler(std::optional<std::string> access_token,
                                           HealthCallback health_callback,
                                           AggregationCoordinator* coordinator)
    : access_token_(std::move(access_token))
    , health_callback_(std::move(health_callback))
    , coordinator_(coordinator) {}

void HealthRequestHandler::handle(const httplib::Request& req, httplib::Response& res) const {
    if (!check_access(req, access_token_)) {
        send_403(res);
        return;
    }

    try {
        nlohmann::json health_status = collect_local_status();

        // Ask the workers for their status and merge
        if (coordinator_) {
            uint64_t request_id = coordinator_->next_request_id();
            health_status = coordinator_->gather(std::move(health_status), request_id).get();
        }

        send_json(res, health_status.dump());
    } catch (const TimeoutError& e) {
        spdlog::warn("Health request failed: {}", e.what());
        send_500(res);
    } catch (const WorkerError& e) {
        spdlog::warn("Health request failed, worker error: {}", e.what());
        send_500(res);
    } catch (const std::exception& e) {
        spdlog::error("Health request failed: {}", e.what());
        send_500(res);
    }
}

nlohmann::json HealthRequestHandler::collect_local_status() const {
    try {
        return health_callback_();
    } catch (const std::exception& e) {
        throw CallbackError(std::string("Health callback failed: ") + e.what());
    } catch (...) {
        throw CallbackError("Health callback failed with a non-standard exception");
    }
}
