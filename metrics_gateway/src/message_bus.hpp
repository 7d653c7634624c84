#pragma once
#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

inline constexpr const char* kCoordinatorPeer = "coordinator";

// Point-to-point channel between the coordinator and its workers. Messages to
// one peer arrive in send order; a lost message is never redelivered.
class MessageBus {
public:
    using MessageHandler = std::function<void(const std::string& from, const nlohmann::json& message)>;

    virtual ~MessageBus() = default;

    virtual std::string self_id() const = 0;

    // Peers reachable right now: live workers on the coordinator, the
    // coordinator on a worker.
    virtual std::vector<std::string> connected_peers() = 0;

    // Returns false when the peer is gone or the message could not be queued.
    virtual bool send(const std::string& peer, const nlohmann::json& message) = 0;

    // Handler runs on the bus reader thread.
    virtual void listen(MessageHandler handler) = 0;
    virtual void stop_listening() = 0;
};
