#include "aggregation_coordinator.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

void AggregationCoordinator::AggregationRequest::resolve(nlohmann::json result) {
    if (!fulfilled.exchange(true)) {
        promise.set_value(std::move(result));
    }
}

void AggregationCoordinator::AggregationRequest::reject(std::exception_ptr error) {
    if (!fulfilled.exchange(true)) {
        promise.set_exception(error);
    }
}

AggregationCoordinator::AggregationCoordinator(EventLoop& loop, MessageBus& bus,
                                               std::chrono::milliseconds timeout)
    : loop_(loop), bus_(bus), timeout_(timeout), next_request_id_(0), in_flight_(0), attached_(false) {}

AggregationCoordinator::~AggregationCoordinator() {
    detach();
}

void AggregationCoordinator::attach() {
    if (attached_.exchange(true)) return;

    bus_.listen([this](const std::string& from, const nlohmann::json& message) {
        on_message(from, message);
    });
}

void AggregationCoordinator::detach() {
    if (!attached_.exchange(false)) return;

    bus_.stop_listening();
}

uint64_t AggregationCoordinator::next_request_id() {
    return next_request_id_.fetch_add(1);
}

std::future<nlohmann::json> AggregationCoordinator::gather(nlohmann::json local_status, uint64_t request_id) {
    if (!local_status.is_object()) {
        std::promise<nlohmann::json> failed;
        failed.set_exception(std::make_exception_ptr(
            CallbackError("Local health status must be a JSON object")));
        return failed.get_future();
    }
    return begin(GatherKind::HEALTH, std::move(local_status), request_id);
}

std::future<nlohmann::json> AggregationCoordinator::gather_metrics(nlohmann::json local_families,
                                                                  uint64_t request_id) {
    return begin(GatherKind::METRICS, nlohmann::json::array({std::move(local_families)}), request_id);
}

void AggregationCoordinator::on_message(const std::string& from, const nlohmann::json& message) {
    auto reply = GatherResponse::from_json(message);
    if (!reply) {
        spdlog::debug("Ignoring unexpected bus message from {}", from);
        return;
    }

    loop_.post([this, from, reply = std::move(*reply)]() {
        handle_reply(from, reply);
    });
}

size_t AggregationCoordinator::in_flight() const {
    return in_flight_;
}

std::future<nlohmann::json> AggregationCoordinator::begin(GatherKind kind, nlohmann::json seed,
                                                          uint64_t request_id) {
    auto request = std::make_shared<AggregationRequest>();
    request->kind = kind;
    request->merged = std::move(seed);
    // The budget runs from creation, not from when the loop gets to it
    request->deadline = EventLoop::Clock::now() + timeout_;
    auto future = request->promise.get_future();

    loop_.post([this, request_id, request]() {
        fan_out(request_id, request);
    });
    return future;
}

void AggregationCoordinator::fan_out(uint64_t request_id, RequestPtr request) {
    if (requests_.count(request_id) != 0) {
        request->reject(std::make_exception_ptr(
            std::logic_error("Duplicate aggregation request id " + std::to_string(request_id))));
        return;
    }

    requests_.emplace(request_id, request);
    ++in_flight_;

    GatherRequest message;
    message.kind = request->kind;
    message.request_id = request_id;
    auto payload = message.to_json();

    // A worker that went away since enumeration is skipped
    for (const auto& peer : bus_.connected_peers()) {
        if (bus_.send(peer, payload)) {
            request->awaiting.insert(peer);
        }
    }

    if (request->awaiting.empty()) {
        // No workers were up
        take(request_id);
        loop_.post([request]() {
            request->resolve(request->merged);
        });
        spdlog::debug("Aggregation {} has no workers, using local result", request_id);
        return;
    }

    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(request->deadline - EventLoop::Clock::now());
    remaining = std::max(remaining, std::chrono::milliseconds(0));
    request->timer = loop_.schedule_after(remaining, [this, request_id]() {
        handle_timeout(request_id);
    });
    spdlog::debug("Aggregation {} sent to {} workers", request_id, request->awaiting.size());
}

void AggregationCoordinator::handle_reply(const std::string& from, const GatherResponse& reply) {
    auto it = requests_.find(reply.request_id);
    if (it == requests_.end()) {
        // Already resolved or timed out
        spdlog::debug("Ignoring late reply from {} for aggregation {}", from, reply.request_id);
        return;
    }

    auto request = it->second;
    if (request->kind != reply.kind || request->awaiting.count(from) == 0) {
        spdlog::debug("Ignoring unexpected reply from {} for aggregation {}", from, reply.request_id);
        return;
    }

    if (reply.error) {
        spdlog::warn("Worker {} failed aggregation {}: {}", from, reply.request_id, *reply.error);
        abort(reply.request_id, std::make_exception_ptr(WorkerError(*reply.error)));
        return;
    }

    if (request->kind == GatherKind::HEALTH) {
        if (!reply.payload.is_object()) {
            spdlog::warn("Worker {} returned a non-object health status for aggregation {}",
                         from, reply.request_id);
            abort(reply.request_id, std::make_exception_ptr(
                WorkerError("Worker " + from + " returned an invalid health status")));
            return;
        }
        request->merged.update(reply.payload);
    } else {
        request->merged.push_back(reply.payload);
    }

    request->awaiting.erase(from);
    if (request->awaiting.empty()) {
        complete(reply.request_id);
    }
}

void AggregationCoordinator::handle_timeout(uint64_t request_id) {
    auto request = take(request_id);
    if (!request) return;

    spdlog::warn("Aggregation {} timed out waiting for {} workers", request_id, request->awaiting.size());
    request->reject(std::make_exception_ptr(TimeoutError("Operation timed out")));
}

void AggregationCoordinator::complete(uint64_t request_id) {
    auto request = take(request_id);
    if (!request) return;

    loop_.cancel(request->timer);
    spdlog::debug("Aggregation {} complete", request_id);
    request->resolve(std::move(request->merged));
}

void AggregationCoordinator::abort(uint64_t request_id, std::exception_ptr error) {
    auto request = take(request_id);
    if (!request) return;

    loop_.cancel(request->timer);
    request->reject(error);
}

AggregationCoordinator::RequestPtr AggregationCoordinator::take(uint64_t request_id) {
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return nullptr;
    }

    auto request = it->second;
    requests_.erase(it);
    --in_flight_;
    return request;
}
