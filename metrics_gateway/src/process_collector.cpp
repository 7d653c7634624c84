#include "process_collector.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <unistd.h>

namespace {

// Field offsets in /proc/self/stat counted after the command name
constexpr size_t kUtimeField = 11;
constexpr size_t kStimeField = 12;
constexpr size_t kStartTimeField = 19;
constexpr size_t kVsizeField = 20;
constexpr size_t kRssField = 21;

std::optional<double> read_boot_time() {
    std::ifstream file("/proc/stat");
    std::string line;
    while (std::getline(file, line)) {
        if (line.rfind("btime ", 0) == 0) {
            return std::stod(line.substr(6));
        }
    }
    return std::nullopt;
}

double count_open_fds() {
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc/self/fd", ec);
    if (ec) {
        return 0.0;
    }
    return static_cast<double>(std::distance(it, std::filesystem::directory_iterator{}));
}

prometheus::MetricFamily make_family(const std::string& name, const std::string& help,
                                     prometheus::MetricType type, double value) {
    prometheus::MetricFamily family;
    family.name = name;
    family.help = help;
    family.type = type;

    prometheus::ClientMetric metric;
    if (type == prometheus::MetricType::Counter) {
        metric.counter.value = value;
    } else {
        metric.gauge.value = value;
    }
    family.metric.push_back(metric);
    return family;
}

}

std::optional<ProcessStats> read_process_stats() {
    std::ifstream file("/proc/self/stat");
    std::string content;
    if (!file.is_open() || !std::getline(file, content)) {
        return std::nullopt;
    }

    // The command name may contain spaces, fields start after its closing paren
    auto paren = content.rfind(')');
    if (paren == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream fields_stream(content.substr(paren + 1));
    std::vector<std::string> fields{std::istream_iterator<std::string>(fields_stream),
                                    std::istream_iterator<std::string>()};
    if (fields.size() <= kRssField) {
        return std::nullopt;
    }

    const double ticks = static_cast<double>(sysconf(_SC_CLK_TCK));
    const double page_size = static_cast<double>(sysconf(_SC_PAGESIZE));

    ProcessStats stats;
    try {
        stats.cpu_seconds = (std::stod(fields[kUtimeField]) + std::stod(fields[kStimeField])) / ticks;
        stats.virtual_memory_bytes = std::stod(fields[kVsizeField]);
        stats.resident_memory_bytes = std::stod(fields[kRssField]) * page_size;
        auto boot_time = read_boot_time();
        if (boot_time) {
            stats.start_time_seconds = *boot_time + std::stod(fields[kStartTimeField]) / ticks;
        }
    } catch (const std::exception& e) {
        spdlog::debug("Unparseable /proc/self/stat: {}", e.what());
        return std::nullopt;
    }
    stats.open_fds = count_open_fds();
    return stats;
}

std::vector<prometheus::MetricFamily> ProcessCollector::Collect() const {
    auto stats = read_process_stats();
    if (!stats) {
        return {};
    }

    using prometheus::MetricType;
    return {
        make_family("process_cpu_seconds_total", "Total user and system CPU time spent in seconds.",
                    MetricType::Counter, stats->cpu_seconds),
        make_family("process_resident_memory_bytes", "Resident memory size in bytes.",
                    MetricType::Gauge, stats->resident_memory_bytes),
        make_family("process_virtual_memory_bytes", "Virtual memory size in bytes.",
                    MetricType::Gauge, stats->virtual_memory_bytes),
        make_family("process_start_time_seconds", "Start time of the process since unix epoch in seconds.",
                    MetricType::Gauge, stats->start_time_seconds),
        make_family("process_open_fds", "Number of open file descriptors.",
                    MetricType::Gauge, stats->open_fds),
    };
}
