#include "metrics_registry.hpp"
#include "process_collector.hpp"
#include <prometheus/text_serializer.h>
#include <spdlog/spdlog.h>

MetricsRegistry::MetricsRegistry() : registry_(std::make_shared<prometheus::Registry>()) {}

prometheus::Registry& MetricsRegistry::registry() {
    return *registry_;
}

void MetricsRegistry::register_collectable(std::shared_ptr<prometheus::Collectable> collectable) {
    std::lock_guard<std::mutex> lock(mutex_);
    collectables_.push_back(std::move(collectable));
}

std::vector<prometheus::MetricFamily> MetricsRegistry::collect() const {
    auto families = registry_->Collect();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& collectable : collectables_) {
        auto collected = collectable->Collect();
        families.insert(families.end(),
                        std::make_move_iterator(collected.begin()),
                        std::make_move_iterator(collected.end()));
    }
    return families;
}

std::string MetricsRegistry::snapshot() const {
    return serialize_metric_families(collect());
}

void collect_default_metrics(MetricsRegistry& metrics) {
    metrics.register_collectable(std::make_shared<ProcessCollector>());
    spdlog::debug("Default process metrics enabled");
}

std::string serialize_metric_families(const std::vector<prometheus::MetricFamily>& families) {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(families);
}
