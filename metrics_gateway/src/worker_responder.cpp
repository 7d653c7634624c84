#include "worker_responder.hpp"
#include "json_schemas.hpp"
#include "metric_families.hpp"
#include <spdlog/spdlog.h>

void respond_to_coordinator(const ResponderContext& context, const std::string& from,
                            const nlohmann::json& message) {
    if (from != kCoordinatorPeer) {
        spdlog::debug("Ignoring bus message from {}", from);
        return;
    }

    auto request = GatherRequest::from_json(message);
    if (!request) {
        spdlog::debug("Ignoring unexpected bus message from coordinator");
        return;
    }

    GatherResponse reply;
    reply.kind = request->kind;
    reply.request_id = request->request_id;

    try {
        if (request->kind == GatherKind::HEALTH) {
            reply.payload = context.health_callback();
        } else {
            reply.payload = metric_families_to_json(context.metrics->collect());
        }
    } catch (const std::exception& e) {
        spdlog::warn("Local collection for request {} failed: {}", request->request_id, e.what());
        reply.error = e.what();
    } catch (...) {
        spdlog::warn("Local collection for request {} failed with a non-standard exception",
                     request->request_id);
        reply.error = "Unknown error";
    }

    if (!context.bus->send(kCoordinatorPeer, reply.to_json())) {
        spdlog::error("Failed to reply to coordinator for request {}", request->request_id);
    }
}

WorkerResponder::WorkerResponder(HealthCallback health_callback, MetricsRegistry& metrics, MessageBus& bus)
    : context_{std::move(health_callback), &metrics, &bus}, attached_(false) {}

WorkerResponder::~WorkerResponder() {
    detach();
}

void WorkerResponder::attach() {
    if (attached_.exchange(true)) return;

    context_.bus->listen([context = context_](const std::string& from, const nlohmann::json& message) {
        respond_to_coordinator(context, from, message);
    });
    spdlog::info("Worker {} responding to coordinator requests", context_.bus->self_id());
}

void WorkerResponder::detach() {
    if (!attached_.exchange(false)) return;

    context_.bus->stop_listening();
    spdlog::info("Worker {} stopped responding", context_.bus->self_id());
}

bool WorkerResponder::is_attached() const {
    return attached_;
}
