#pragma once
#include "callbacks.hpp"
#include "config.hpp"
#include "message_bus.hpp"
#include "metrics_registry.hpp"
#include <memory>

// Health and stats HTTP endpoints for a single process, a coordinator or a
// worker (no HTTP, answers the coordinator over the bus).
//
// Construction validates the configuration and throws ConfigError on invalid
// options; a throwing metrics setup callback surfaces as CallbackError.
class MetricsServer {
public:
    MetricsServer(const Config& config, HealthCallback health_callback,
                  MetricsSetupCallback metrics_setup_callback,
                  std::shared_ptr<MessageBus> bus = nullptr);
    ~MetricsServer();

    // Throws std::runtime_error when the listen address cannot be bound.
    void start();

    // Stops accepting requests and detaches the bus listener. In-flight
    // aggregations still resolve.
    void shutdown();

    bool is_running() const;
    MetricsRegistry& metrics();

    // Non-copyable
    MetricsServer(const MetricsServer&) = delete;
    MetricsServer& operator=(const MetricsServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
