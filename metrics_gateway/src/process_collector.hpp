#pragma once
#include <prometheus/collectable.h>
#include <prometheus/metric_family.h>
#include <optional>
#include <vector>

struct ProcessStats {
    double cpu_seconds = 0.0;
    double resident_memory_bytes = 0.0;
    double virtual_memory_bytes = 0.0;
    double start_time_seconds = 0.0;
    double open_fds = 0.0;
};

// Reads the current process figures from /proc. Returns nullopt off Linux or
// when /proc is unavailable.
std::optional<ProcessStats> read_process_stats();

// Exposes process_cpu_seconds_total, process_resident_memory_bytes,
// process_virtual_memory_bytes, process_start_time_seconds and process_open_fds.
class ProcessCollector : public prometheus::Collectable {
public:
    std::vector<prometheus::MetricFamily> Collect() const override;
};
