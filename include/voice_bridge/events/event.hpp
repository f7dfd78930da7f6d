#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge {
namespace events {

enum class EventType {
    ConnectionCreated,
    ConnectionReady,
    ConnectionTerminated,

    SdpOfferReceived,
    SdpAnswerGenerated,
    IceConnectionChanged,
    AudioTrackReady,

    ModelConnectionInitialized,
    ModelAudioReady,
    ModelControlChannelReady,
    ModelGreetingSent,

    RemoteCallStarted,
    RemoteCallAccepted,
    RemoteCallTerminated,
    RemoteAudioReady,

    HandlerFailure
};

const char* to_string(EventType type);
std::optional<EventType> parse_event_type(const std::string& name);

struct Event {
    EventType type = EventType::ConnectionCreated;
    std::string connection_id;
    std::string source;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    nlohmann::json data = nlohmann::json::object();
};

Event make_event(EventType type,
                 std::string connection_id,
                 std::string source = "",
                 nlohmann::json data = nlohmann::json::object());

}
}
