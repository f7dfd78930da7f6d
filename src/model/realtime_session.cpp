#include "voice_bridge/model/realtime_session.hpp"

#include <chrono>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::model {

RealtimeModelSession::RealtimeModelSession(std::shared_ptr<webrtc::PeerSession> peer, int bitrate)
    : peer_(std::move(peer)),
      encoder_(bitrate) {}

RealtimeModelSession::~RealtimeModelSession() {
    close();
}

void RealtimeModelSession::send_audio(const std::vector<int16_t>& pcm) {
    if (closed_) {
        throw ModelSessionError("model session is closed");
    }
    std::lock_guard<std::mutex> lock(audio_mutex_);
    framer_.push(pcm, [this](const int16_t* frame) {
        const auto packet = encoder_.encode(frame, media::kFrameSamples);
        peer_->outbound->write_frame(packet, std::chrono::milliseconds(20));
    });
}

void RealtimeModelSession::send_control_message(const nlohmann::json& message) {
    if (closed_) {
        throw ModelSessionError("model session is closed");
    }
    try {
        peer_->send_control(message.dump());
    } catch (const std::exception& ex) {
        throw ModelSessionError(std::string("failed to send control message: ") + ex.what());
    }
}

void RealtimeModelSession::close() {
    if (closed_.exchange(true)) {
        return;
    }
    peer_->close();
    logging::info("Model session closed", {kv("connection_id", peer_->connection_id)});
}

bool RealtimeModelSession::is_connected() const {
    return !closed_ && peer_->transport_open();
}

std::shared_ptr<media::FrameSource> RealtimeModelSession::audio_source() const {
    return peer_->inbound;
}

RealtimeConnector::RealtimeConnector(webrtc::SessionNegotiator& negotiator,
                                     SdpExchanger& exchanger,
                                     int bitrate,
                                     std::string control_label)
    : negotiator_(negotiator),
      exchanger_(exchanger),
      bitrate_(bitrate),
      control_label_(std::move(control_label)) {}

call::ModelLeg RealtimeConnector::connect(const std::string& connection_id, call::ModelLegHooks hooks) {
    webrtc::PeerCallbacks callbacks;
    callbacks.on_track_open = hooks.on_audio_open;
    callbacks.on_control_open = hooks.on_control_open;
    callbacks.on_control_message = hooks.on_control_message;

    auto peer = negotiator_.create_offer(connection_id, "model", control_label_, std::move(callbacks));
    try {
        const auto answer = exchanger_.exchange(peer->local_description);
        negotiator_.apply_answer(*peer, answer);
    } catch (const std::exception&) {
        peer->close();
        throw;
    }

    auto session = std::make_shared<RealtimeModelSession>(peer, bitrate_);
    logging::info("Model session negotiated",
                  {kv("connection_id", connection_id), kv("channel", control_label_)});
    return {session, session->audio_source()};
}

}
