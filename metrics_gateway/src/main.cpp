#include "config.hpp"
#include "metrics_server.hpp"
#include "redis_bus.hpp"
#include "util.hpp"
#include <prometheus/counter.h>
#include <prometheus/registry.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>
#include <unistd.h>

// Global atomic flag to handle termination signals
std::atomic<bool> g_terminate_flag(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

int main() {
    Config config;
    try {
        config = Config::from_env();
        config.validate();
    } catch (const std::exception& e) {
        util::setup_logging("info");
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    }

    util::setup_logging(config.log_level);
    spdlog::info("Starting {} in {} mode", config.service_name, to_string(config.mode));

    std::shared_ptr<MessageBus> bus;
    if (config.mode != ProcessMode::SINGLE) {
        auto redis_bus = std::make_shared<RedisBus>(config);
        if (!redis_bus->connect()) {
            spdlog::critical("Failed to connect to the message bus");
            return 1;
        }
        bus = redis_bus;
    }

    const auto started_at = std::chrono::steady_clock::now();
    const std::string instance = config.mode == ProcessMode::WORKER ? config.worker_id : config.service_name;

    auto health_callback = [&]() {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - started_at).count();
        return nlohmann::json{
            {instance, {
                {"status", "healthy"},
                {"pid", getpid()},
                {"uptime_seconds", uptime},
                {"timestamp", util::current_iso8601()}
            }}
        };
    };

    auto metrics_setup = [&](prometheus::Registry& registry) {
        auto& started = prometheus::BuildCounter()
            .Name("metrics_gateway_starts_total")
            .Help("Number of times this process started serving metrics")
            .Register(registry);
        started.Add({{"mode", to_string(config.mode)}}).Increment();
    };

    std::unique_ptr<MetricsServer> server;
    try {
        server = std::make_unique<MetricsServer>(config, health_callback, metrics_setup, bus);
        server->start();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to start metrics server: {}", e.what());
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    while (!g_terminate_flag) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Termination signal received. Shutting down...");
    server->shutdown();
    spdlog::shutdown();
    return 0;
}
