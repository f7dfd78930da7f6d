#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "voice_bridge/call/call_delegate.hpp"
#include "voice_bridge/call/connection.hpp"
#include "voice_bridge/call/function_call_tracker.hpp"
#include "voice_bridge/call/model_connector.hpp"
#include "voice_bridge/call/timer_coordinator.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/events/bus.hpp"
#include "voice_bridge/events/lifecycle.hpp"
#include "voice_bridge/media/audio_cache.hpp"
#include "voice_bridge/media/codec_bridge.hpp"
#include "voice_bridge/media/codec_state.hpp"
#include "voice_bridge/utils/async.hpp"
#include "voice_bridge/utils/timer.hpp"
#include "voice_bridge/webrtc/session_negotiator.hpp"

namespace voice_bridge {
namespace call {

struct CallRequest {
    std::string connection_id;
    std::string tenant_id;
    std::string agent_id;
    std::string call_id;
    std::string sdp;
};

struct CallSetup {
    std::string connection_id;
    std::string sdp;
};

// Outbound notifications for the signaling collaborator.
class CallNotifier {
public:
    virtual ~CallNotifier() = default;

    virtual void send_tool_call(const std::string& connection_id, const ToolCall& call) = 0;
    virtual void send_call_ended(const std::string& connection_id, ExitReason reason) = 0;
};

std::vector<std::string> required_dependencies(CallDirection direction);

// Orchestrates calls: negotiates the telephony leg, opens the model leg,
// wires the codec bridge once both audio paths exist and tears everything
// down in a fixed order.
class BridgeService : public TimerListener {
public:
    BridgeService(const Config& config,
                  events::EventBus& bus,
                  events::ConnectionLifecycle& lifecycle,
                  utils::TimerService& timers,
                  webrtc::SessionNegotiator& negotiator,
                  ModelConnector& models,
                  CallBridgeDelegate& delegate,
                  media::AudioCache* cache = nullptr);
    ~BridgeService() override;

    BridgeService(const BridgeService&) = delete;
    BridgeService& operator=(const BridgeService&) = delete;

    void set_notifier(CallNotifier* notifier);

    // Answers a telephony offer. Throws webrtc::NegotiationError when the
    // offer is rejected; nothing is kept for the call in that case.
    CallSetup start_inbound(const CallRequest& request);
    // Creates a telephony offer; the answer arrives via apply_answer.
    CallSetup start_outbound(const CallRequest& request);
    // Throws events::ConnectionNotFound or webrtc::NegotiationError.
    void apply_answer(const std::string& connection_id, const std::string& sdp);

    // Returns false when the call is unknown or already terminating.
    bool terminate(const std::string& connection_id, ExitReason reason, bool with_grace = false);
    void submit_tool_result(const std::string& connection_id,
                            const std::string& call_id,
                            const std::string& output);
    void handle_model_message(const std::string& connection_id, const std::string& raw);

    std::shared_ptr<Connection> find(const std::string& connection_id) const;
    size_t active_connections() const;
    void shutdown();

    void on_inactivity_prompt(const std::string& connection_id, int retry, int max_retries) override;
    void on_termination_requested(const std::string& connection_id, ExitReason reason) override;

private:
    std::shared_ptr<Connection> open_connection(const CallRequest& request, CallDirection direction);
    void discard_connection(const std::shared_ptr<Connection>& connection);
    webrtc::PeerCallbacks telephony_callbacks(const std::string& connection_id);
    void connect_model(const std::shared_ptr<Connection>& connection);
    void bridge_media(const std::shared_ptr<Connection>& connection);
    void on_ready(const events::Event& event);
    void start_tool_call(const std::string& connection_id, const ToolCall& tool_call);
    void publish(events::EventType type,
                 const std::string& connection_id,
                 nlohmann::json data = nlohmann::json::object());
    void update_metrics();
    void spawn(std::function<void()> task, const char* name);

    const Config& config_;
    events::EventBus& bus_;
    events::ConnectionLifecycle& lifecycle_;
    utils::TimerService& timers_;
    webrtc::SessionNegotiator& negotiator_;
    ModelConnector& models_;
    CallBridgeDelegate& delegate_;
    media::AudioCache* cache_;

    ConnectionRegistry registry_;
    media::CodecStateRegistry codec_states_;
    media::CodecBridge codec_bridge_;
    FunctionCallTracker tool_calls_;
    TimerCoordinator call_timers_;
    std::shared_ptr<const media::OpusFrames> cue_clip_;

    std::atomic<CallNotifier*> notifier_{nullptr};
    std::vector<events::SubscriptionId> subscriptions_;
    std::atomic<bool> shutting_down_{false};
    utils::TaskGroup tasks_;
};

}
}
