#pragma once

#include <functional>
#include <memory>
#include <string>

#include "voice_bridge/media/frame.hpp"
#include "voice_bridge/model/model_session.hpp"

namespace voice_bridge {
namespace call {

struct ModelLegHooks {
    std::function<void()> on_audio_open;
    std::function<void()> on_control_open;
    std::function<void(const std::string&)> on_control_message;
};

struct ModelLeg {
    std::shared_ptr<model::ModelSession> session;
    std::shared_ptr<media::FrameSource> audio;
};

// Opens the model side of a call. Blocks until the backend accepted the
// session; readiness of audio and control is reported through the hooks.
class ModelConnector {
public:
    virtual ~ModelConnector() = default;

    virtual ModelLeg connect(const std::string& connection_id, ModelLegHooks hooks) = 0;
};

}
}
