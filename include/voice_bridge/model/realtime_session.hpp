#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "voice_bridge/call/model_connector.hpp"
#include "voice_bridge/media/opus_codec.hpp"
#include "voice_bridge/media/pcm_framer.hpp"
#include "voice_bridge/model/model_session.hpp"
#include "voice_bridge/model/sdp_client.hpp"
#include "voice_bridge/webrtc/session_negotiator.hpp"

namespace voice_bridge {
namespace model {

// Model leg carried over WebRTC: one Opus sendrecv track for audio and one
// data channel for the backend's JSON control messages.
class RealtimeModelSession : public ModelSession {
public:
    RealtimeModelSession(std::shared_ptr<webrtc::PeerSession> peer, int bitrate);
    ~RealtimeModelSession() override;

    void send_audio(const std::vector<int16_t>& pcm) override;
    void send_control_message(const nlohmann::json& message) override;
    void close() override;
    bool is_connected() const override;

    std::shared_ptr<media::FrameSource> audio_source() const;

private:
    std::shared_ptr<webrtc::PeerSession> peer_;
    std::mutex audio_mutex_;
    media::Encoder encoder_;
    media::PcmFramer framer_;
    std::atomic<bool> closed_{false};
};

class RealtimeConnector : public call::ModelConnector {
public:
    RealtimeConnector(webrtc::SessionNegotiator& negotiator,
                      SdpExchanger& exchanger,
                      int bitrate,
                      std::string control_label = webrtc::kRealtimeControlLabel);

    call::ModelLeg connect(const std::string& connection_id, call::ModelLegHooks hooks) override;

private:
    webrtc::SessionNegotiator& negotiator_;
    SdpExchanger& exchanger_;
    int bitrate_;
    std::string control_label_;
};

}
}
