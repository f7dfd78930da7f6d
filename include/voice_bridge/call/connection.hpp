#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "voice_bridge/call/call_delegate.hpp"
#include "voice_bridge/call/function_call_tracker.hpp"
#include "voice_bridge/call/model_connector.hpp"
#include "voice_bridge/media/activity.hpp"
#include "voice_bridge/media/codec_bridge.hpp"
#include "voice_bridge/webrtc/session_negotiator.hpp"

namespace voice_bridge {
namespace call {

enum class CallDirection {
    Inbound,
    Outbound
};

const char* to_string(CallDirection direction);

// Withholds caller audio from the model until the greeting is playing and
// the interruption window has passed. Each waiting stage is released by a
// failsafe timeout.
class GreetingGate {
public:
    using Clock = std::chrono::steady_clock;

    GreetingGate(Clock::time_point created,
                 std::chrono::milliseconds failsafe,
                 std::chrono::milliseconds interruption_window);

    void greeting_sent(Clock::time_point at);
    void greeting_audio_started(Clock::time_point at);
    bool suppress(Clock::time_point now) const;

    bool greeting_was_sent() const { return sent_ms_.load() != kUnset; }

private:
    static constexpr int64_t kUnset = -1;
    static int64_t to_ms(Clock::time_point at);

    int64_t created_ms_;
    std::chrono::milliseconds failsafe_;
    std::chrono::milliseconds interruption_window_;
    std::atomic<int64_t> sent_ms_{kUnset};
    std::atomic<int64_t> audio_ms_{kUnset};
};

// One active call. Owned by the registry; workers and timers refer to it by
// id and take a shared_ptr copy for the duration of a single operation.
struct PendingToolCall {
    ToolCall call;
    FunctionCallTracker::Guard guard;
};

struct Connection {
    std::string id;
    std::string tenant_id;
    std::string agent_id;
    std::string call_id;
    CallDirection direction = CallDirection::Inbound;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();

    std::shared_ptr<media::ActivityTracker> activity;
    std::shared_ptr<media::ActivityTracker> playback;
    std::unique_ptr<GreetingGate> gate;
    std::atomic<bool> terminating{false};
    std::atomic<bool> closed{false};

    std::mutex mutex;
    std::shared_ptr<webrtc::PeerSession> telephony;
    ModelLeg model;
    std::map<std::string, PendingToolCall> tool_calls;
    std::unique_ptr<media::BackgroundInjector> injector;
    std::vector<std::thread> workers;
    bool bridged = false;
};

class ConnectionRegistry {
public:
    // Throws std::runtime_error when the id is taken.
    void add(std::shared_ptr<Connection> connection);
    std::shared_ptr<Connection> find(const std::string& connection_id) const;
    std::shared_ptr<Connection> remove(const std::string& connection_id);
    std::vector<std::shared_ptr<Connection>> all() const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Connection>> connections_;
};

}
}
