#include "metrics_server.hpp"
#include "aggregation_coordinator.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include "health_handler.hpp"
#include "response_writer.hpp"
#include "stats_handler.hpp"
#include "worker_responder.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

constexpr int kStartupPolls = 1000;

}

class MetricsServer::Impl {
public:
    Impl(const Config& config, HealthCallback health_callback,
         MetricsSetupCallback metrics_setup_callback, std::shared_ptr<MessageBus> bus)
        : config_(config), bus_(std::move(bus)), running_(false) {
        config_.validate();

        if (!health_callback) {
            throw ConfigError("Invalid get health callback");
        }
        if (!metrics_setup_callback) {
            throw ConfigError("Invalid metrics setup callback");
        }
        if (config_.mode != ProcessMode::SINGLE && !bus_) {
            throw ConfigError("A message bus is required in " + to_string(config_.mode) + " mode");
        }

        // Setup default metrics, then the application's
        collect_default_metrics(metrics_);
        try {
            metrics_setup_callback(metrics_.registry());
        } catch (const std::exception& e) {
            throw CallbackError(std::string("Metrics setup callback failed: ") + e.what());
        }

        if (config_.mode == ProcessMode::WORKER) {
            responder_ = std::make_unique<WorkerResponder>(std::move(health_callback), metrics_, *bus_);
            return;
        }

        if (config_.mode == ProcessMode::COORDINATOR) {
            coordinator_ = std::make_unique<AggregationCoordinator>(loop_, *bus_);
        }
        health_handler_ = std::make_unique<HealthRequestHandler>(
            config_.access_token, std::move(health_callback), coordinator_.get());
        stats_handler_ = std::make_unique<StatsRequestHandler>(
            config_.access_token, metrics_, coordinator_.get());
    }

    ~Impl() {
        shutdown();
    }

    void start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_) {
            spdlog::warn("Metrics server already running");
            return;
        }

        if (responder_) {
            responder_->attach();
            running_ = true;
            spdlog::info("Metrics worker {} started", bus_->self_id());
            return;
        }

        if (coordinator_) {
            loop_.start();
            coordinator_->attach();
        }

        server_ = std::make_unique<httplib::Server>();
        // Aggregating handlers hold a worker thread until the cluster answers
        const size_t handler_threads = static_cast<size_t>(config_.http_threads);
        server_->new_task_queue = [handler_threads]() {
            return new httplib::ThreadPool(handler_threads);
        };
        setup_routes();

        if (!server_->bind_to_port(config_.listen_addr, config_.listen_port)) {
            server_.reset();
            stop_coordinator();
            throw std::runtime_error("Failed to bind metrics server to " + config_.listen_addr + ":" +
                                     std::to_string(config_.listen_port));
        }

        running_ = true;
        server_thread_ = std::thread([this]() {
            if (!server_->listen_after_bind()) {
                spdlog::error("Metrics server on {}:{} stopped unexpectedly",
                              config_.listen_addr, config_.listen_port);
            }
        });

        // stop() is only effective once the accept loop runs
        for (int i = 0; i < kStartupPolls && !server_->is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        spdlog::info("Metrics server listening on {}:{} ({} mode, health {}, stats {})",
                     config_.listen_addr, config_.listen_port, to_string(config_.mode),
                     config_.health_endpoint, config_.stats_endpoint);
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!running_) return;
        running_ = false;

        if (responder_) {
            responder_->detach();
            spdlog::info("Metrics worker stopped");
            return;
        }

        // Waits for in-flight handlers, which may still be aggregating
        server_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        server_.reset();

        stop_coordinator();
        spdlog::info("Metrics server stopped");
    }

    bool is_running() const {
        return running_;
    }

    MetricsRegistry& metrics() {
        return metrics_;
    }

private:
    void setup_routes() {
        // Only GET requests are allowed
        server_->set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
            if (req.method != "GET") {
                send_404(res);
                return httplib::Server::HandlerResponse::Handled;
            }
            return httplib::Server::HandlerResponse::Unhandled;
        });

        // Endpoints match the whole request target, so a query string is a miss
        server_->Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.target == config_.health_endpoint) {
                health_handler_->handle(req, res);
            } else if (req.target == config_.stats_endpoint) {
                stats_handler_->handle(req, res);
            } else {
                send_404(res);
            }
        });
    }

    void stop_coordinator() {
        if (coordinator_) {
            coordinator_->detach();
            loop_.stop();
        }
    }

    Config config_;
    std::shared_ptr<MessageBus> bus_;
    MetricsRegistry metrics_;
    EventLoop loop_;
    std::unique_ptr<AggregationCoordinator> coordinator_;
    std::unique_ptr<WorkerResponder> responder_;
    std::unique_ptr<HealthRequestHandler> health_handler_;
    std::unique_ptr<StatsRequestHandler> stats_handler_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
    std::mutex lifecycle_mutex_;
};

MetricsServer::MetricsServer(const Config& config, HealthCallback health_callback,
                             MetricsSetupCallback metrics_setup_callback,
                             std::shared_ptr<MessageBus> bus)
    : pImpl_(std::make_unique<Impl>(config, std::move(health_callback),
                                    std::move(metrics_setup_callback), std::move(bus))) {}

MetricsServer::~MetricsServer() = default;

void MetricsServer::start() {
    pImpl_->start();
}

void MetricsServer::shutdown() {
    pImpl_->shutdown();
}

bool MetricsServer::is_running() const {
    return pImpl_->is_running();
}

MetricsRegistry& MetricsServer::metrics() {
    return pImpl_->metrics();
}
