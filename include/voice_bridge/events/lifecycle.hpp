#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "voice_bridge/events/bus.hpp"
#include "voice_bridge/utils/timer.hpp"

namespace voice_bridge {
namespace events {

enum class Phase {
    Created,
    Initializing,
    Ready,
    Terminating,
    Terminated
};

const char* to_string(Phase phase);

namespace deps {
inline constexpr const char* kTransportAudioReady = "transport-audio-ready";
inline constexpr const char* kTransportSdpReady = "transport-sdp-ready";
inline constexpr const char* kModelConnectionReady = "model-connection-ready";
inline constexpr const char* kModelAudioReady = "model-audio-ready";
inline constexpr const char* kModelControlChannelReady = "model-control-channel-ready";
inline constexpr const char* kRemoteAudioReady = "remote-audio-ready";
inline constexpr const char* kRemoteCallAccepted = "remote-call-accepted";
}

class ConnectionNotFound : public std::runtime_error {
public:
    explicit ConnectionNotFound(const std::string& connection_id)
        : std::runtime_error("connection not found: " + connection_id),
          connection_id_(connection_id) {}

    const std::string& connection_id() const { return connection_id_; }

private:
    std::string connection_id_;
};

struct ConnectionState {
    std::string connection_id;
    std::string call_id;
    std::string tenant_id;
    Phase phase = Phase::Created;
    std::map<std::string, bool> dependencies;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;

    bool all_dependencies_ready() const;
};

// Tracks the phase of every call and promotes it to Ready once all of its
// registered dependencies are satisfied. Phases only move forward.
class ConnectionLifecycle {
public:
    ConnectionLifecycle(EventBus& bus,
                        utils::TimerService& timers,
                        std::chrono::milliseconds cleanup_delay = std::chrono::seconds(5));
    ~ConnectionLifecycle();

    ConnectionLifecycle(const ConnectionLifecycle&) = delete;
    ConnectionLifecycle& operator=(const ConnectionLifecycle&) = delete;

    void register_connection(const std::string& connection_id,
                             const std::string& call_id,
                             const std::string& tenant_id,
                             const std::vector<std::string>& dependencies);
    bool update_phase(const std::string& connection_id, Phase phase);
    bool mark_dependency_ready(const std::string& connection_id, const std::string& dependency);
    ConnectionState get_state(const std::string& connection_id) const;
    bool contains(const std::string& connection_id) const;
    bool terminate_connection(const std::string& connection_id);
    std::vector<ConnectionState> all_connections() const;
    void close();

private:
    struct Entry {
        ConnectionState state;
        utils::TimerHandle cleanup_timer;
    };

    void subscribe_dependency(EventType type, const char* dependency);
    void remove_entry(const std::string& connection_id);

    EventBus& bus_;
    utils::TimerService& timers_;
    std::chrono::milliseconds cleanup_delay_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> connections_;
    std::vector<SubscriptionId> subscriptions_;
    bool closed_ = false;
};

}
}
