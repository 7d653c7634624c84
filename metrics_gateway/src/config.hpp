#pragma once
#include <optional>
#include <string>

enum class ProcessMode {
    SINGLE,
    COORDINATOR,
    WORKER
};

struct Config {
    ProcessMode mode = ProcessMode::SINGLE;
    std::string listen_addr = "0.0.0.0";
    int listen_port = 0;
    int http_threads = 64;
    std::optional<std::string> access_token;
    std::string health_endpoint = "/health";
    std::string stats_endpoint = "/stats";
    std::string redis_url = "redis://127.0.0.1:6379";
    std::string bus_prefix = "metrics_gateway";
    std::string worker_id;
    int heartbeat_interval_ms = 1000;
    std::string service_name = "metrics_gateway";
    std::string log_level = "info";

    static Config from_env();
    void validate() const;

    bool serves_http() const { return mode != ProcessMode::WORKER; }
};

ProcessMode parse_process_mode(const std::string& value);
std::string to_string(ProcessMode mode);

// A path starts with '/' and every segment is limited to letters, digits and ". & [ ] ^ -".
bool is_valid_endpoint(const std::string& endpoint);
