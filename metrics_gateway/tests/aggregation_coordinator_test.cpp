#include "aggregation_coordinator.hpp"
#include "errors.hpp"
#include "test_support/loopback_bus.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

constexpr auto kTestTimeout = 200ms;
constexpr auto kWait = 3s;

class AggregationCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        coordinator_bus_ = network_.add_peer(kCoordinatorPeer);
        coordinator_ = std::make_unique<AggregationCoordinator>(loop_, *coordinator_bus_, kTestTimeout);
        loop_.start();
        coordinator_->attach();
    }

    void TearDown() override {
        coordinator_->detach();
        loop_.stop();
    }

    std::shared_ptr<MessageBus> add_worker(const std::string& id) {
        auto bus = network_.add_peer(id);
        workers_.emplace(id, bus);
        return bus;
    }

    void reply(const std::string& worker, uint64_t request_id, json status) {
        GatherResponse response;
        response.request_id = request_id;
        response.payload = std::move(status);
        workers_.at(worker)->send(kCoordinatorPeer, response.to_json());
    }

    void reply_error(const std::string& worker, uint64_t request_id, const std::string& error) {
        GatherResponse response;
        response.request_id = request_id;
        response.error = error;
        workers_.at(worker)->send(kCoordinatorPeer, response.to_json());
    }

    // Returns once every task posted so far has run
    void drain() {
        std::promise<void> done;
        loop_.post([&done]() { done.set_value(); });
        done.get_future().wait();
    }

    LoopbackNetwork network_;
    EventLoop loop_;
    std::shared_ptr<MessageBus> coordinator_bus_;
    std::map<std::string, std::shared_ptr<MessageBus>> workers_;
    std::unique_ptr<AggregationCoordinator> coordinator_;
};

}

TEST_F(AggregationCoordinatorTest, MergesWorkerRepliesInArrivalOrder) {
    add_worker("worker-1");
    add_worker("worker-2");

    auto result = coordinator_->gather(json{{"a", 1}, {"shared", "local"}}, 1);
    reply("worker-2", 1, json{{"c", 3}, {"shared", "worker-2"}});
    reply("worker-1", 1, json{{"b", 2}, {"shared", "worker-1"}});

    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    EXPECT_EQ(result.get(), (json{{"a", 1}, {"b", 2}, {"c", 3}, {"shared", "worker-1"}}));
    EXPECT_EQ(coordinator_->in_flight(), 0u);
}

TEST_F(AggregationCoordinatorTest, SendsOneTaggedRequestPerWorker) {
    add_worker("worker-1");
    add_worker("worker-2");
    std::vector<json> received;
    std::mutex received_mutex;
    for (const auto& [id, bus] : workers_) {
        bus->listen([&](const std::string& from, const json& message) {
            std::lock_guard<std::mutex> lock(received_mutex);
            EXPECT_EQ(from, kCoordinatorPeer);
            received.push_back(message);
        });
    }

    auto result = coordinator_->gather(json::object(), 42);
    drain();

    std::lock_guard<std::mutex> lock(received_mutex);
    ASSERT_EQ(received.size(), 2u);
    for (const auto& message : received) {
        EXPECT_EQ(message["type"], "getStatsRequest");
        EXPECT_EQ(message["requestId"], 42);
    }
}

TEST_F(AggregationCoordinatorTest, ResolvesWithLocalStatusWhenNoWorkers) {
    const json local{{"a", 1}};

    auto result = coordinator_->gather(local, 1);

    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    EXPECT_EQ(result.get(), local);
    EXPECT_EQ(coordinator_->in_flight(), 0u);
}

TEST_F(AggregationCoordinatorTest, ResolutionWithoutWorkersIsNotOnTheCallingStack) {
    std::promise<bool> ready_in_same_task;
    std::future<json> result;

    loop_.post([&]() {
        result = coordinator_->gather(json{{"a", 1}}, 1);
        ready_in_same_task.set_value(result.wait_for(0s) == std::future_status::ready);
    });

    EXPECT_FALSE(ready_in_same_task.get_future().get());
    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    EXPECT_EQ(result.get(), (json{{"a", 1}}));
}

TEST_F(AggregationCoordinatorTest, WorkerErrorRejectsWholeAggregation) {
    add_worker("worker-1");
    add_worker("worker-2");
    add_worker("worker-3");

    auto result = coordinator_->gather(json{{"a", 1}}, 7);
    reply("worker-1", 7, json{{"b", 2}});
    reply_error("worker-2", 7, "disk full");

    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    try {
        result.get();
        FAIL() << "Expected WorkerError";
    } catch (const WorkerError& e) {
        EXPECT_STREQ(e.what(), "disk full");
    }
    EXPECT_EQ(coordinator_->in_flight(), 0u);

    // The pending worker's reply is a no-op now
    reply("worker-3", 7, json{{"c", 3}});
    drain();
    EXPECT_EQ(coordinator_->in_flight(), 0u);
}

TEST_F(AggregationCoordinatorTest, TimesOutWhenWorkerNeverReplies) {
    add_worker("worker-1");

    auto started = std::chrono::steady_clock::now();
    auto result = coordinator_->gather(json{{"a", 1}}, 3);

    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    EXPECT_GE(std::chrono::steady_clock::now() - started, kTestTimeout);
    EXPECT_THROW(result.get(), TimeoutError);
    EXPECT_EQ(coordinator_->in_flight(), 0u);

    reply("worker-1", 3, json{{"late", true}});
    drain();
    EXPECT_EQ(coordinator_->in_flight(), 0u);
}

TEST_F(AggregationCoordinatorTest, TimeoutCountsFromCreation) {
    add_worker("worker-1");

    // Keep the loop busy past the whole budget before the fan-out runs
    loop_.post([]() { std::this_thread::sleep_for(2 * kTestTimeout); });

    auto started = std::chrono::steady_clock::now();
    auto result = coordinator_->gather(json{{"a", 1}}, 11);

    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_THROW(result.get(), TimeoutError);
    // Not a fresh budget after the busy task
    EXPECT_LT(elapsed, 3 * kTestTimeout - 50ms);
}

TEST_F(AggregationCoordinatorTest, PartialRepliesStillTimeOut) {
    add_worker("worker-1");
    add_worker("worker-2");

    auto result = coordinator_->gather(json{{"a", 1}}, 4);
    reply("worker-1", 4, json{{"b", 2}});

    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    EXPECT_THROW(result.get(), TimeoutError);
}

TEST_F(AggregationCoordinatorTest, DisconnectedWorkerIsNotAwaited) {
    add_worker("worker-1");
    add_worker("worker-2");
    network_.disconnect("worker-2");

    auto result = coordinator_->gather(json{{"a", 1}}, 5);
    reply("worker-1", 5, json{{"b", 2}});

    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    EXPECT_EQ(result.get(), (json{{"a", 1}, {"b", 2}}));
}

TEST_F(AggregationCoordinatorTest, DuplicateReplyFromSameWorkerCountsOnce) {
    add_worker("worker-1");
    add_worker("worker-2");

    auto result = coordinator_->gather(json::object(), 6);
    reply("worker-1", 6, json{{"b", 2}});
    reply("worker-1", 6, json{{"b", 20}});
    drain();

    EXPECT_EQ(result.wait_for(0s), std::future_status::timeout);
    EXPECT_EQ(coordinator_->in_flight(), 1u);

    reply("worker-2", 6, json{{"c", 3}});
    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    EXPECT_EQ(result.get(), (json{{"b", 2}, {"c", 3}}));
}

TEST_F(AggregationCoordinatorTest, ConcurrentAggregationsResolveIndependently) {
    add_worker("worker-1");

    auto first = coordinator_->gather(json{{"request", 1}}, 10);
    auto second = coordinator_->gather(json{{"request", 2}}, 11);
    EXPECT_NE(first.wait_for(0s), std::future_status::ready);

    reply("worker-1", 11, json{{"answer", "second"}});
    ASSERT_EQ(second.wait_for(kWait), std::future_status::ready);
    EXPECT_EQ(second.get(), (json{{"request", 2}, {"answer", "second"}}));
    EXPECT_EQ(coordinator_->in_flight(), 1u);

    reply("worker-1", 10, json{{"answer", "first"}});
    ASSERT_EQ(first.wait_for(kWait), std::future_status::ready);
    EXPECT_EQ(first.get(), (json{{"request", 1}, {"answer", "first"}}));
}

TEST_F(AggregationCoordinatorTest, NonObjectWorkerStatusIsAWorkerError) {
    add_worker("worker-1");

    auto result = coordinator_->gather(json::object(), 12);
    reply("worker-1", 12, json::array({1, 2}));

    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    EXPECT_THROW(result.get(), WorkerError);
}

TEST_F(AggregationCoordinatorTest, RejectsNonObjectLocalStatus) {
    auto result = coordinator_->gather(json("healthy"), 13);

    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    EXPECT_THROW(result.get(), CallbackError);
}

TEST_F(AggregationCoordinatorTest, RejectsDuplicateRequestId) {
    add_worker("worker-1");

    auto first = coordinator_->gather(json::object(), 14);
    auto second = coordinator_->gather(json::object(), 14);

    ASSERT_EQ(second.wait_for(kWait), std::future_status::ready);
    EXPECT_THROW(second.get(), std::logic_error);
    EXPECT_EQ(coordinator_->in_flight(), 1u);

    reply("worker-1", 14, json::object());
    ASSERT_EQ(first.wait_for(kWait), std::future_status::ready);
    EXPECT_NO_THROW(first.get());
}

TEST_F(AggregationCoordinatorTest, GatherMetricsCollectsEveryProcess) {
    add_worker("worker-1");

    auto result = coordinator_->gather_metrics(json::array({"local"}), 20);

    GatherResponse response;
    response.kind = GatherKind::METRICS;
    response.request_id = 20;
    response.payload = json::array({"worker"});
    workers_.at("worker-1")->send(kCoordinatorPeer, response.to_json());

    ASSERT_EQ(result.wait_for(kWait), std::future_status::ready);
    EXPECT_EQ(result.get(), json::array({json::array({"local"}), json::array({"worker"})}));
}

TEST_F(AggregationCoordinatorTest, HealthReplyDoesNotCompleteMetricsRequest) {
    add_worker("worker-1");

    auto result = coordinator_->gather_metrics(json::array(), 21);
    reply("worker-1", 21, json{{"b", 2}});
    drain();

    EXPECT_EQ(result.wait_for(0s), std::future_status::timeout);
    EXPECT_EQ(coordinator_->in_flight(), 1u);
}

TEST_F(AggregationCoordinatorTest, RequestIdsAreUniqueAndIncreasing) {
    auto first = coordinator_->next_request_id();
    auto second = coordinator_->next_request_id();
    auto third = coordinator_->next_request_id();

    EXPECT_LT(first, second);
    EXPECT_LT(second, third);
}
