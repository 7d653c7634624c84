#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <unordered_map>
#include <unordered_set>

namespace {

constexpr long long kMaxInboxLength = 1000;
constexpr std::chrono::milliseconds kReadBlockTimeout(1000);
constexpr long long kReadBatchSize = 64;
constexpr int kPresenceTtlHeartbeats = 3;

using Attrs = std::vector<std::pair<std::string, std::string>>;
using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
using ItemStream = std::vector<Item>;

}

RedisBus::RedisBus(const Config& config)
    : config_(config)
    , self_id_(config.mode == ProcessMode::WORKER ? config.worker_id : kCoordinatorPeer)
    , is_coordinator_(config.mode != ProcessMode::WORKER)
    , heartbeat_interval_(config.heartbeat_interval_ms)
    , running_(false) {}

RedisBus::~RedisBus() {
    stop_listening();
    disconnect();
}

bool RedisBus::connect() {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
        reader_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
        redis_->ping();
        spdlog::info("Connected to Redis: {} as {}", config_.redis_url, self_id_);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        redis_.reset();
        reader_.reset();
        return false;
    }
}

void RedisBus::disconnect() {
    if (redis_) {
        redis_.reset();
        reader_.reset();
        spdlog::info("Disconnected from Redis");
    }
}

bool RedisBus::is_connected() const {
    if (!redis_) return false;

    try {
        redis_->ping();
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string RedisBus::self_id() const {
    return self_id_;
}

std::vector<std::string> RedisBus::connected_peers() {
    std::vector<std::string> peers;
    if (!redis_) return peers;

    try {
        if (!is_coordinator_) {
            if (is_peer_alive(kCoordinatorPeer)) {
                peers.emplace_back(kCoordinatorPeer);
            }
            return peers;
        }

        std::unordered_set<std::string> members;
        redis_->smembers(workers_key(), std::inserter(members, members.end()));
        for (const auto& worker : members) {
            if (is_peer_alive(worker)) {
                peers.push_back(worker);
            } else {
                // Presence expired, the worker is gone
                redis_->srem(workers_key(), worker);
                spdlog::debug("Pruned stale worker {}", worker);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to enumerate peers: {}", e.what());
    }

    std::sort(peers.begin(), peers.end());
    return peers;
}

bool RedisBus::send(const std::string& peer, const nlohmann::json& message) {
    if (!redis_) return false;

    try {
        if (!is_peer_alive(peer)) {
            spdlog::debug("Skipping message to disconnected peer {}", peer);
            return false;
        }

        Attrs attrs = {{"from", self_id_}, {"data", message.dump()}};
        redis_->xadd(inbox_key(peer), "*", attrs.begin(), attrs.end(), kMaxInboxLength, true);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to send message to {}: {}", peer, e.what());
        return false;
    }
}

void RedisBus::listen(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
        spdlog::warn("Bus listener already running");
        return;
    }
    if (!redis_) {
        spdlog::error("Cannot listen on bus: not connected");
        return;
    }

    try {
        // Messages left over from a previous run are never replayed
        redis_->del(inbox_key(self_id_));
        refresh_presence();
    } catch (const std::exception& e) {
        spdlog::error("Failed to prepare inbox for {}: {}", self_id_, e.what());
        return;
    }

    running_ = true;
    reader_thread_ = std::thread([this, handler]() {
        reader_loop(handler);
    });
    spdlog::info("Listening on bus inbox {}", inbox_key(self_id_));
}

void RedisBus::stop_listening() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_) return;

    running_ = false;
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    remove_presence();
    spdlog::info("Stopped listening on bus inbox {}", inbox_key(self_id_));
}

std::string RedisBus::inbox_key(const std::string& peer) const {
    return config_.bus_prefix + ":inbox:" + peer;
}

std::string RedisBus::presence_key(const std::string& peer) const {
    return config_.bus_prefix + ":presence:" + peer;
}

std::string RedisBus::workers_key() const {
    return config_.bus_prefix + ":workers";
}

bool RedisBus::is_peer_alive(const std::string& peer) {
    return redis_->exists(presence_key(peer)) > 0;
}

void RedisBus::refresh_presence() {
    redis_->set(presence_key(self_id_), util::current_iso8601(), heartbeat_interval_ * kPresenceTtlHeartbeats);
    if (!is_coordinator_) {
        redis_->sadd(workers_key(), self_id_);
    }
}

void RedisBus::remove_presence() {
    if (!redis_) return;

    try {
        redis_->del(presence_key(self_id_));
        if (!is_coordinator_) {
            redis_->srem(workers_key(), self_id_);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Failed to remove presence for {}: {}", self_id_, e.what());
    }
}

void RedisBus::reader_loop(MessageHandler handler) {
    std::string last_id = "0";
    auto last_heartbeat = std::chrono::steady_clock::now();

    while (running_) {
        try {
            auto now = std::chrono::steady_clock::now();
            if (now - last_heartbeat >= heartbeat_interval_) {
                refresh_presence();
                last_heartbeat = now;
            }

            std::unordered_map<std::string, ItemStream> result;
            reader_->xread(inbox_key(self_id_), last_id, kReadBlockTimeout, kReadBatchSize,
                           std::inserter(result, result.end()));

            for (const auto& stream : result) {
                for (const auto& item : stream.second) {
                    last_id = item.first;
                    if (!item.second) continue;

                    std::string from;
                    std::string data;
                    for (const auto& attr : *item.second) {
                        if (attr.first == "from") from = attr.second;
                        else if (attr.first == "data") data = attr.second;
                    }

                    try {
                        handler(from, nlohmann::json::parse(data));
                    } catch (const std::exception& e) {
                        spdlog::error("Failed to process bus message from {}: {}", from, e.what());
                    }
                }
            }
        } catch (const std::exception& e) {
            if (running_) {
                spdlog::error("Bus reader error: {}", e.what());
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }
    }
}
