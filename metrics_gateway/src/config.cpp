#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cstdlib>
#include <fstream>
#include <regex>
#include <unistd.h>

namespace {

constexpr int kMaxHttpThreads = 1024;

std::string get_env(const char* name, const std::string& default_val) {
    const char* value = std::getenv(name);
    return value ? value : default_val;
}

int parse_int(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid " + name + ": " + value);
    }
    if (consumed != value.size()) {
        throw ConfigError("Invalid " + name + ": " + value);
    }
    return result;
}

std::optional<std::string> read_secret(const char* file_env, const char* value_env) {
    const char* file_path = std::getenv(file_env);
    if (file_path) {
        std::ifstream file(file_path);
        if (!file.is_open()) {
            throw ConfigError(std::string("Cannot read ") + file_env + ": " + file_path);
        }
        std::string content;
        std::getline(file, content);
        return util::trim(content);
    }

    const char* value = std::getenv(value_env);
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

}

ProcessMode parse_process_mode(const std::string& value) {
    if (value == "single") return ProcessMode::SINGLE;
    if (value == "coordinator") return ProcessMode::COORDINATOR;
    if (value == "worker") return ProcessMode::WORKER;
    throw ConfigError("Invalid process mode: " + value);
}

std::string to_string(ProcessMode mode) {
    switch (mode) {
        case ProcessMode::SINGLE: return "single";
        case ProcessMode::COORDINATOR: return "coordinator";
        case ProcessMode::WORKER: return "worker";
    }
    return "unknown";
}

bool is_valid_endpoint(const std::string& endpoint) {
    static const std::regex endpoint_regex(R"(^(?:/[A-Za-z0-9.&\[\]^-]*)+$)");
    return std::regex_match(endpoint, endpoint_regex);
}

Config Config::from_env() {
    Config config;

    config.mode = parse_process_mode(get_env("PROCESS_MODE", "single"));
    std::string listen_addr = get_env("LISTEN_ADDR", "");
    if (!listen_addr.empty()) {
        config.listen_addr = listen_addr;
    }
    if (const char* port = std::getenv("LISTEN_PORT")) {
        config.listen_port = parse_int("server port", port);
    }
    if (const char* threads = std::getenv("HTTP_THREADS")) {
        config.http_threads = parse_int("HTTP thread count", threads);
    }
    config.access_token = read_secret("ACCESS_TOKEN_FILE", "ACCESS_TOKEN");
    config.health_endpoint = get_env("HEALTH_ENDPOINT", config.health_endpoint);
    config.stats_endpoint = get_env("STATS_ENDPOINT", config.stats_endpoint);
    config.redis_url = get_env("REDIS_URL", config.redis_url);
    config.bus_prefix = get_env("BUS_PREFIX", config.bus_prefix);
    config.service_name = get_env("SERVICE_NAME", config.service_name);
    config.worker_id = get_env("WORKER_ID", config.service_name + "_" + std::to_string(getpid()));
    if (const char* interval = std::getenv("HEARTBEAT_INTERVAL_MS")) {
        config.heartbeat_interval_ms = parse_int("heartbeat interval", interval);
    }
    config.log_level = get_env("LOG_LEVEL", config.log_level);

    return config;
}

void Config::validate() const {
    if (serves_http()) {
        if (listen_port == 0) {
            throw ConfigError("Server port not specified");
        }
        if (listen_port < 1 || listen_port > 65535) {
            throw ConfigError("Invalid server port");
        }
        if (http_threads < 1 || http_threads > kMaxHttpThreads) {
            throw ConfigError("Invalid HTTP thread count");
        }
    }

    if (!is_valid_endpoint(health_endpoint)) {
        throw ConfigError("Invalid get health endpoint name");
    }
    if (!is_valid_endpoint(stats_endpoint)) {
        throw ConfigError("Invalid get stats endpoint name");
    }
    if (health_endpoint == stats_endpoint) {
        throw ConfigError("Health and stats endpoints must differ");
    }

    if (mode != ProcessMode::SINGLE) {
        if (bus_prefix.empty()) {
            throw ConfigError("Message bus prefix is required");
        }
        if (heartbeat_interval_ms <= 0) {
            throw ConfigError("Invalid heartbeat interval");
        }
    }
    if (mode == ProcessMode::WORKER && worker_id.empty()) {
        throw ConfigError("Worker id is required in worker mode");
    }
}
