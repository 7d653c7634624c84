#pragma once
#include "config.hpp"
#include "message_bus.hpp"
#include <sw/redis++/redis++.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

// MessageBus over Redis streams. Every peer reads its own inbox stream and
// advertises liveness through a presence key with a TTL.
class RedisBus : public MessageBus {
public:
    explicit RedisBus(const Config& config);
    ~RedisBus() override;

    bool connect();
    void disconnect();
    bool is_connected() const;

    std::string self_id() const override;
    std::vector<std::string> connected_peers() override;
    bool send(const std::string& peer, const nlohmann::json& message) override;
    void listen(MessageHandler handler) override;
    void stop_listening() override;

private:
    std::string inbox_key(const std::string& peer) const;
    std::string presence_key(const std::string& peer) const;
    std::string workers_key() const;

    bool is_peer_alive(const std::string& peer);
    void refresh_presence();
    void remove_presence();
    void reader_loop(MessageHandler handler);

    Config config_;
    std::string self_id_;
    bool is_coordinator_;
    std::chrono::milliseconds heartbeat_interval_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::unique_ptr<sw::redis::Redis> reader_;
    std::atomic<bool> running_;
    std::thread reader_thread_;
    std::mutex lifecycle_mutex_;
};
