#pragma once

#include <atomic>
#include <memory>

#include "voice_bridge/call/bridge_service.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/events/bus.hpp"
#include "voice_bridge/events/lifecycle.hpp"
#include "voice_bridge/media/audio_cache.hpp"
#include "voice_bridge/model/gemini_delegate.hpp"
#include "voice_bridge/model/realtime_delegate.hpp"
#include "voice_bridge/model/realtime_session.hpp"
#include "voice_bridge/model/sdp_client.hpp"
#include "voice_bridge/server/rest_server.hpp"
#include "voice_bridge/signaling/control_client.hpp"
#include "voice_bridge/utils/timer.hpp"
#include "voice_bridge/webrtc/session_negotiator.hpp"

namespace voice_bridge {

class BridgeApp {
public:
    explicit BridgeApp(Config config);
    ~BridgeApp();

    void init();
    void run();
    void stop();
    const Config& config() const;

private:
    Config config_;
    utils::Scheduler scheduler_;
    std::unique_ptr<events::EventBus> bus_;
    std::unique_ptr<events::ConnectionLifecycle> lifecycle_;
    std::unique_ptr<webrtc::SessionNegotiator> negotiator_;
    std::unique_ptr<model::SdpExchanger> sdp_client_;
    std::unique_ptr<model::RealtimeConnector> connector_;
    std::unique_ptr<call::CallBridgeDelegate> delegate_;
    std::unique_ptr<media::FileAudioCache> audio_cache_;
    std::unique_ptr<call::BridgeService> bridge_;
    std::unique_ptr<signaling::ControlClient> control_client_;
    std::unique_ptr<RestServer> rest_server_;
    std::atomic<bool> quitting_{false};
    bool stopped_ = false;
};

}
