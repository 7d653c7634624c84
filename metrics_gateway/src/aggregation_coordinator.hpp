#pragma once
#include "event_loop.hpp"
#include "json_schemas.hpp"
#include "message_bus.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>

// Fans a gather request out to every connected worker, merges their replies
// and resolves the caller's future exactly once: with the merged result when
// every worker answered, with WorkerError on the first worker error, or with
// TimeoutError when the deadline passes first.
//
// The request table is only touched from loop tasks.
class AggregationCoordinator {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{5000};

    AggregationCoordinator(EventLoop& loop, MessageBus& bus,
                           std::chrono::milliseconds timeout = kDefaultTimeout);
    ~AggregationCoordinator();

    AggregationCoordinator(const AggregationCoordinator&) = delete;
    AggregationCoordinator& operator=(const AggregationCoordinator&) = delete;

    // Starts receiving worker replies from the bus.
    void attach();
    void detach();

    uint64_t next_request_id();

    // Resolves with local_status overwritten key-wise by each worker's health
    // status, in reply arrival order.
    std::future<nlohmann::json> gather(nlohmann::json local_status, uint64_t request_id);

    // Resolves with an array holding local_families followed by each
    // worker's metric families, in reply arrival order.
    std::future<nlohmann::json> gather_metrics(nlohmann::json local_families, uint64_t request_id);

    // Entry point for bus messages; safe to call from any thread.
    void on_message(const std::string& from, const nlohmann::json& message);

    size_t in_flight() const;

private:
    struct AggregationRequest {
        GatherKind kind = GatherKind::HEALTH;
        nlohmann::json merged;
        std::unordered_set<std::string> awaiting;
        std::atomic<bool> fulfilled{false};
        std::promise<nlohmann::json> promise;
        EventLoop::Clock::time_point deadline;
        EventLoop::TimerId timer = 0;

        void resolve(nlohmann::json result);
        void reject(std::exception_ptr error);
    };

    using RequestPtr = std::shared_ptr<AggregationRequest>;

    std::future<nlohmann::json> begin(GatherKind kind, nlohmann::json seed, uint64_t request_id);
    void fan_out(uint64_t request_id, RequestPtr request);
    void handle_reply(const std::string& from, const GatherResponse& reply);
    void handle_timeout(uint64_t request_id);
    void complete(uint64_t request_id);
    void abort(uint64_t request_id, std::exception_ptr error);
    RequestPtr take(uint64_t request_id);

    EventLoop& loop_;
    MessageBus& bus_;
    std::chrono::milliseconds timeout_;
    std::atomic<uint64_t> next_request_id_;
    std::unordered_map<uint64_t, RequestPtr> requests_;
    std::atomic<size_t> in_flight_;
    std::atomic<bool> attached_;
};
