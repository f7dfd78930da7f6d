#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <rtc/rtc.hpp>

#include "voice_bridge/config.hpp"
#include "voice_bridge/media/frame_queue.hpp"
#include "voice_bridge/webrtc/sdp.hpp"
#include "voice_bridge/webrtc/track_io.hpp"

namespace voice_bridge {
namespace webrtc {

// Control data channel labels the model backends expect.
inline constexpr const char* kRealtimeControlLabel = "oai-events";
inline constexpr const char* kLiveControlLabel = "dc0";

// fmtp profile placed on the local Opus track: mono, 20 ms packets, FEC.
inline constexpr const char* kOpusProfile =
    "minptime=10;useinbandfec=1;stereo=0;sprop-stereo=0;ptime=20";

struct NegotiatorSettings {
    std::vector<std::string> stun_servers;
    std::optional<std::string> turn_server;
    std::optional<std::string> turn_username;
    std::optional<std::string> turn_credential;
    std::chrono::milliseconds gathering_timeout{5000};
    int opus_payload_type = 111;

    bool have_relay_credentials() const;
    static NegotiatorSettings from_config(const Config& config);
};

struct PeerCallbacks {
    std::function<void()> on_track_open;
    std::function<void()> on_control_open;
    std::function<void(const std::string&)> on_control_message;
    std::function<void(const std::string&)> on_state_change;
};

// One negotiated media session with one peer. Only the negotiator mutates it
// until the transport opens; afterwards only the control send path is used.
struct PeerSession {
    std::string connection_id;
    std::string leg;
    TransportPolicy policy = TransportPolicy::All;
    std::string local_description;
    std::string remote_description;
    bool gathering_complete = false;

    std::shared_ptr<rtc::PeerConnection> peer;
    std::shared_ptr<rtc::Track> track;
    std::shared_ptr<media::FrameQueue> inbound;
    std::shared_ptr<TrackFrameSink> outbound;

    void send_control(const std::string& message);
    bool control_open() const;
    bool transport_open() const;
    void close();

private:
    friend class SessionNegotiator;

    mutable std::mutex control_mutex_;
    std::shared_ptr<rtc::DataChannel> control_;
};

// Negotiates a single bidirectional Opus channel (plus an optional control
// data channel) with one peer per call. Track and control-channel readiness
// are reported through PeerCallbacks and never awaited here.
class SessionNegotiator {
public:
    explicit SessionNegotiator(NegotiatorSettings settings);

    // Answers a remote offer. Throws NegotiationError and keeps no state
    // when the offer does not fit the single-channel Opus layout.
    std::shared_ptr<PeerSession> answer(const std::string& connection_id,
                                        const std::string& leg,
                                        const std::string& remote_offer,
                                        PeerCallbacks callbacks);

    // Produces an offer after candidate gathering completes or the
    // gathering timeout passes, whichever is first. A non-empty
    // control_label adds a data channel under that label.
    std::shared_ptr<PeerSession> create_offer(const std::string& connection_id,
                                              const std::string& leg,
                                              const std::string& control_label,
                                              PeerCallbacks callbacks);

    void apply_answer(PeerSession& session, const std::string& remote_answer);

    const NegotiatorSettings& settings() const { return settings_; }

private:
    struct Gathering;

    std::shared_ptr<rtc::PeerConnection> make_peer_connection(TransportPolicy policy) const;
    std::shared_ptr<Gathering> watch(const std::shared_ptr<PeerSession>& session,
                                     const PeerCallbacks& callbacks) const;
    void add_audio_track(const std::shared_ptr<PeerSession>& session,
                         const std::string& mid,
                         int payload_type,
                         const PeerCallbacks& callbacks) const;
    static void bind_control(const std::shared_ptr<PeerSession>& session,
                             const std::shared_ptr<rtc::DataChannel>& channel,
                             const PeerCallbacks& callbacks);
    void finish_local_description(PeerSession& session, Gathering& gathering) const;

    NegotiatorSettings settings_;
};

}
}
