#include "voice_bridge/events/event.hpp"

#include <array>
#include <utility>

namespace voice_bridge::events {

namespace {

constexpr std::array<std::pair<EventType, const char*>, 16> kEventNames{{
    {EventType::ConnectionCreated, "connection.created"},
    {EventType::ConnectionReady, "connection.ready"},
    {EventType::ConnectionTerminated, "connection.terminated"},
    {EventType::SdpOfferReceived, "webrtc.sdp_offer_received"},
    {EventType::SdpAnswerGenerated, "webrtc.sdp_answer_generated"},
    {EventType::IceConnectionChanged, "webrtc.ice_connection_changed"},
    {EventType::AudioTrackReady, "webrtc.audio_track_ready"},
    {EventType::ModelConnectionInitialized, "model.connection_initialized"},
    {EventType::ModelAudioReady, "model.audio_track_ready"},
    {EventType::ModelControlChannelReady, "model.control_channel_ready"},
    {EventType::ModelGreetingSent, "model.greeting_sent"},
    {EventType::RemoteCallStarted, "remote.call_started"},
    {EventType::RemoteCallAccepted, "remote.call_accepted"},
    {EventType::RemoteCallTerminated, "remote.call_terminated"},
    {EventType::RemoteAudioReady, "remote.audio_ready"},
    {EventType::HandlerFailure, "handler.failure"},
}};

}

const char* to_string(EventType type) {
    for (const auto& entry : kEventNames) {
        if (entry.first == type) {
            return entry.second;
        }
    }
    return "unknown";
}

std::optional<EventType> parse_event_type(const std::string& name) {
    for (const auto& entry : kEventNames) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

Event make_event(EventType type,
                 std::string connection_id,
                 std::string source,
                 nlohmann::json data) {
    Event event;
    event.type = type;
    event.connection_id = std::move(connection_id);
    event.source = std::move(source);
    event.timestamp = std::chrono::system_clock::now();
    event.data = std::move(data);
    return event;
}

}
