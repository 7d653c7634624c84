#include "metric_families.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>

using json = nlohmann::json;
using prometheus::ClientMetric;
using prometheus::MetricFamily;
using prometheus::MetricType;

namespace {

const char* type_name(MetricType type) {
    if (type == MetricType::Counter) return "counter";
    if (type == MetricType::Gauge) return "gauge";
    if (type == MetricType::Summary) return "summary";
    if (type == MetricType::Histogram) return "histogram";
    return "untyped";
}

MetricType parse_type(const std::string& name) {
    if (name == "counter") return MetricType::Counter;
    if (name == "gauge") return MetricType::Gauge;
    if (name == "summary") return MetricType::Summary;
    if (name == "histogram") return MetricType::Histogram;
    if (name == "untyped") return MetricType::Untyped;
    throw std::invalid_argument("Unknown metric type: " + name);
}

json encode_double(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";
    return value;
}

double decode_double(const json& j) {
    if (j.is_number()) {
        return j.get<double>();
    }
    const auto& text = j.get_ref<const std::string&>();
    if (text == "NaN") return std::numeric_limits<double>::quiet_NaN();
    if (text == "+Inf") return std::numeric_limits<double>::infinity();
    if (text == "-Inf") return -std::numeric_limits<double>::infinity();
    throw std::invalid_argument("Invalid metric value: " + text);
}

json encode_metric(MetricType type, const ClientMetric& metric) {
    json labels = json::object();
    for (const auto& label : metric.label) {
        labels[label.name] = label.value;
    }

    json j{{"labels", labels}};
    if (type == MetricType::Counter) {
        j["value"] = encode_double(metric.counter.value);
    } else if (type == MetricType::Gauge) {
        j["value"] = encode_double(metric.gauge.value);
    } else if (type == MetricType::Summary) {
        j["count"] = metric.summary.sample_count;
        j["sum"] = encode_double(metric.summary.sample_sum);
        json quantiles = json::array();
        for (const auto& q : metric.summary.quantile) {
            quantiles.push_back({encode_double(q.quantile), encode_double(q.value)});
        }
        j["quantiles"] = quantiles;
    } else if (type == MetricType::Histogram) {
        j["count"] = metric.histogram.sample_count;
        j["sum"] = encode_double(metric.histogram.sample_sum);
        json buckets = json::array();
        for (const auto& b : metric.histogram.bucket) {
            buckets.push_back({encode_double(b.upper_bound), b.cumulative_count});
        }
        j["buckets"] = buckets;
    } else {
        j["value"] = encode_double(metric.untyped.value);
    }
    return j;
}

ClientMetric decode_metric(MetricType type, const json& j) {
    ClientMetric metric;
    for (const auto& [name, value] : j.at("labels").items()) {
        ClientMetric::Label label;
        label.name = name;
        label.value = value.get<std::string>();
        metric.label.push_back(label);
    }

    if (type == MetricType::Counter) {
        metric.counter.value = decode_double(j.at("value"));
    } else if (type == MetricType::Gauge) {
        metric.gauge.value = decode_double(j.at("value"));
    } else if (type == MetricType::Summary) {
        metric.summary.sample_count = j.at("count").get<std::uint64_t>();
        metric.summary.sample_sum = decode_double(j.at("sum"));
        for (const auto& q : j.at("quantiles")) {
            ClientMetric::Quantile quantile;
            quantile.quantile = decode_double(q.at(0));
            quantile.value = decode_double(q.at(1));
            metric.summary.quantile.push_back(quantile);
        }
    } else if (type == MetricType::Histogram) {
        metric.histogram.sample_count = j.at("count").get<std::uint64_t>();
        metric.histogram.sample_sum = decode_double(j.at("sum"));
        for (const auto& b : j.at("buckets")) {
            ClientMetric::Bucket bucket;
            bucket.upper_bound = decode_double(b.at(0));
            bucket.cumulative_count = b.at(1).get<std::uint64_t>();
            metric.histogram.bucket.push_back(bucket);
        }
    } else {
        metric.untyped.value = decode_double(j.at("value"));
    }
    return metric;
}

std::string label_key(std::vector<ClientMetric::Label> labels) {
    std::sort(labels.begin(), labels.end(), [](const auto& a, const auto& b) {
        return a.name < b.name;
    });

    std::string key;
    for (const auto& label : labels) {
        key += label.name;
        key += '\x1f';
        key += label.value;
        key += '\x1e';
    }
    return key;
}

struct MergedMetric {
    ClientMetric metric;
    // Processes that reported each summary quantile, parallel to metric.summary.quantile
    std::vector<size_t> quantile_contributors;
};

struct MergedFamily {
    MetricFamily family;
    std::vector<MergedMetric> metrics;
    std::unordered_map<std::string, size_t> index;
};

MergedMetric first_sample(const ClientMetric& metric) {
    MergedMetric merged;
    merged.metric = metric;
    merged.quantile_contributors.assign(metric.summary.quantile.size(), 1);
    return merged;
}

void accumulate(MetricType type, MergedMetric& into, const ClientMetric& from) {
    if (type == MetricType::Counter) {
        into.metric.counter.value += from.counter.value;
    } else if (type == MetricType::Gauge) {
        into.metric.gauge.value += from.gauge.value;
    } else if (type == MetricType::Summary) {
        auto& summary = into.metric.summary;
        summary.sample_count += from.summary.sample_count;
        summary.sample_sum += from.summary.sample_sum;
        for (const auto& q : from.summary.quantile) {
            auto it = std::find_if(summary.quantile.begin(), summary.quantile.end(),
                                   [&](const auto& existing) { return existing.quantile == q.quantile; });
            if (it != summary.quantile.end()) {
                it->value += q.value;
                into.quantile_contributors[it - summary.quantile.begin()] += 1;
            } else {
                summary.quantile.push_back(q);
                into.quantile_contributors.push_back(1);
            }
        }
    } else if (type == MetricType::Histogram) {
        auto& histogram = into.metric.histogram;
        histogram.sample_count += from.histogram.sample_count;
        histogram.sample_sum += from.histogram.sample_sum;
        for (const auto& b : from.histogram.bucket) {
            auto it = std::find_if(histogram.bucket.begin(), histogram.bucket.end(),
                                   [&](const auto& existing) { return existing.upper_bound == b.upper_bound; });
            if (it != histogram.bucket.end()) {
                it->cumulative_count += b.cumulative_count;
            } else {
                histogram.bucket.push_back(b);
            }
        }
        std::sort(histogram.bucket.begin(), histogram.bucket.end(),
                  [](const auto& a, const auto& b) { return a.upper_bound < b.upper_bound; });
    } else {
        into.metric.untyped.value += from.untyped.value;
    }
}

}

MergePolicy merge_policy(const std::string& family_name) {
    // A sum of start times means nothing
    if (family_name == "process_start_time_seconds") {
        return MergePolicy::OMIT;
    }
    // Info metrics carry their payload in labels and are identical everywhere
    static const std::string kInfoSuffix = "_info";
    if (family_name.size() > kInfoSuffix.size() &&
        family_name.compare(family_name.size() - kInfoSuffix.size(), kInfoSuffix.size(), kInfoSuffix) == 0) {
        return MergePolicy::FIRST;
    }
    return MergePolicy::SUM;
}

json metric_families_to_json(const std::vector<MetricFamily>& families) {
    json result = json::array();
    for (const auto& family : families) {
        json metrics = json::array();
        for (const auto& metric : family.metric) {
            metrics.push_back(encode_metric(family.type, metric));
        }
        result.push_back({
            {"name", family.name},
            {"help", family.help},
            {"type", type_name(family.type)},
            {"metrics", metrics}
        });
    }
    return result;
}

std::vector<MetricFamily> metric_families_from_json(const json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("Metric families must be a JSON array");
    }

    std::vector<MetricFamily> families;
    for (const auto& entry : j) {
        MetricFamily family;
        family.name = entry.at("name").get<std::string>();
        family.help = entry.value("help", "");
        family.type = parse_type(entry.at("type").get<std::string>());
        for (const auto& metric : entry.at("metrics")) {
            family.metric.push_back(decode_metric(family.type, metric));
        }
        families.push_back(std::move(family));
    }
    return families;
}

std::vector<MetricFamily> merge_metric_families(const std::vector<std::vector<MetricFamily>>& per_process) {
    std::vector<MergedFamily> merged;
    std::unordered_map<std::string, size_t> family_index;

    for (const auto& families : per_process) {
        for (const auto& family : families) {
            auto policy = merge_policy(family.name);
            if (policy == MergePolicy::OMIT) {
                continue;
            }

            auto found = family_index.find(family.name);
            if (found == family_index.end()) {
                family_index.emplace(family.name, merged.size());
                MergedFamily entry;
                entry.family.name = family.name;
                entry.family.help = family.help;
                entry.family.type = family.type;
                merged.push_back(std::move(entry));
                found = family_index.find(family.name);
            }

            auto& target = merged[found->second];
            if (target.family.type != family.type) {
                spdlog::warn("Skipping metric family {} with conflicting type {}",
                             family.name, type_name(family.type));
                continue;
            }

            for (const auto& metric : family.metric) {
                auto key = label_key(metric.label);
                auto it = target.index.find(key);
                if (it == target.index.end()) {
                    target.index.emplace(key, target.metrics.size());
                    target.metrics.push_back(first_sample(metric));
                } else if (policy == MergePolicy::SUM) {
                    accumulate(family.type, target.metrics[it->second], metric);
                }
            }
        }
    }

    std::vector<MetricFamily> result;
    result.reserve(merged.size());
    for (auto& entry : merged) {
        for (auto& m : entry.metrics) {
            auto& quantiles = m.metric.summary.quantile;
            for (size_t i = 0; i < quantiles.size(); ++i) {
                if (m.quantile_contributors[i] > 1) {
                    quantiles[i].value /= static_cast<double>(m.quantile_contributors[i]);
                }
            }
            entry.family.metric.push_back(std::move(m.metric));
        }
        result.push_back(std::move(entry.family));
    }
    return result;
}
