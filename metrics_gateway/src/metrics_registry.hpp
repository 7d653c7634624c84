#pragma once
#include <prometheus/collectable.h>
#include <prometheus/metric_family.h>
#include <prometheus/registry.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Per-process metrics registry. Constructed explicitly by the server and
// handed to the setup callback and the stats handler.
class MetricsRegistry {
public:
    static constexpr const char* kContentType = "text/plain; version=0.0.4; charset=utf-8";

    MetricsRegistry();

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    prometheus::Registry& registry();

    // Adds a collector that is scraped alongside the registry.
    void register_collectable(std::shared_ptr<prometheus::Collectable> collectable);

    std::vector<prometheus::MetricFamily> collect() const;

    // Text exposition of everything collected by this process.
    std::string snapshot() const;

    const char* content_type() const { return kContentType; }

private:
    std::shared_ptr<prometheus::Registry> registry_;
    std::vector<std::shared_ptr<prometheus::Collectable>> collectables_;
    mutable std::mutex mutex_;
};

// Installs the process_* collector.
void collect_default_metrics(MetricsRegistry& metrics);

std::string serialize_metric_families(const std::vector<prometheus::MetricFamily>& families);
