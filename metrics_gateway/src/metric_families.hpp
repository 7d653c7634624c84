#pragma once
#include <nlohmann/json.hpp>
#include <prometheus/metric_family.h>
#include <string>
#include <vector>

// JSON form used to ship metric families between processes. Non-finite
// values are encoded as the strings "NaN", "+Inf" and "-Inf".
nlohmann::json metric_families_to_json(const std::vector<prometheus::MetricFamily>& families);

// Throws nlohmann::json::exception or std::invalid_argument on malformed input.
std::vector<prometheus::MetricFamily> metric_families_from_json(const nlohmann::json& j);

// How the samples of one family combine across processes.
enum class MergePolicy {
    SUM,
    FIRST,  // keep the first process's sample
    OMIT    // leave the family out of the cluster view
};

MergePolicy merge_policy(const std::string& family_name);

// Combines the families collected by several processes. Families match by
// name and samples by label set. Under MergePolicy::SUM values, counts, sums
// and histogram buckets are summed and summary quantiles are averaged over the
// processes reporting them.
std::vector<prometheus::MetricFamily> merge_metric_families(
    const std::vector<std::vector<prometheus::MetricFamily>>& per_process);
