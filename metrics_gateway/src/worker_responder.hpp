#pragma once
#include "callbacks.hpp"
#include "message_bus.hpp"
#include "metrics_registry.hpp"
#include <atomic>
#include <string>

// Everything a worker needs to answer one fan-out request.
struct ResponderContext {
    HealthCallback health_callback;
    MetricsRegistry* metrics = nullptr;
    MessageBus* bus = nullptr;
};

// Answers a coordinator request with exactly one correlated reply. Messages
// that are not fan-out requests from the coordinator are ignored.
void respond_to_coordinator(const ResponderContext& context, const std::string& from,
                            const nlohmann::json& message);

class WorkerResponder {
public:
    WorkerResponder(HealthCallback health_callback, MetricsRegistry& metrics, MessageBus& bus);
    ~WorkerResponder();

    WorkerResponder(const WorkerResponder&) = delete;
    WorkerResponder& operator=(const WorkerResponder&) = delete;

    void attach();
    void detach();
    bool is_attached() const;

private:
    ResponderContext context_;
    std::atomic<bool> attached_;
};
