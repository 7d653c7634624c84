#pragma once
#include "message_bus.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// In-process stand-in for the Redis bus. Messages are delivered synchronously
// on the sender's thread. A connected peer without a listener silently drops
// what it receives.
class LoopbackNetwork {
public:
    std::shared_ptr<MessageBus> add_peer(const std::string& id);

    void disconnect(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        peers_[id].connected = false;
    }

    std::vector<std::string> connected_peers_for(const std::string& self) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> peers;
        for (const auto& [id, peer] : peers_) {
            if (id == self || !peer.connected) continue;
            // Workers only talk to the coordinator
            if (self != kCoordinatorPeer && id != kCoordinatorPeer) continue;
            peers.push_back(id);
        }
        return peers;
    }

    bool deliver(const std::string& from, const std::string& to, const nlohmann::json& message) {
        MessageBus::MessageHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = peers_.find(to);
            if (it == peers_.end() || !it->second.connected) {
                return false;
            }
            handler = it->second.handler;
            delivered_.push_back(message);
        }
        if (handler) {
            handler(from, message);
        }
        return true;
    }

    void set_handler(const std::string& id, MessageBus::MessageHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        peers_[id].handler = std::move(handler);
    }

    size_t delivered_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_.size();
    }

private:
    struct Peer {
        bool connected = true;
        MessageBus::MessageHandler handler;
    };

    std::mutex mutex_;
    std::map<std::string, Peer> peers_;
    std::vector<nlohmann::json> delivered_;
};

class LoopbackBus : public MessageBus {
public:
    LoopbackBus(LoopbackNetwork& network, std::string id) : network_(network), id_(std::move(id)) {}

    std::string self_id() const override { return id_; }

    std::vector<std::string> connected_peers() override {
        return network_.connected_peers_for(id_);
    }

    bool send(const std::string& peer, const nlohmann::json& message) override {
        return network_.deliver(id_, peer, message);
    }

    void listen(MessageHandler handler) override {
        network_.set_handler(id_, std::move(handler));
    }

    void stop_listening() override {
        network_.set_handler(id_, nullptr);
    }

private:
    LoopbackNetwork& network_;
    std::string id_;
};

inline std::shared_ptr<MessageBus> LoopbackNetwork::add_peer(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        peers_[id];
    }
    return std::make_shared<LoopbackBus>(*this, id);
}
