#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace voice_bridge {
namespace model {

class ModelSessionError : public std::runtime_error {
public:
    explicit ModelSessionError(const std::string& message) : std::runtime_error(message) {}
};

// Uniform surface of an AI speech backend as seen by the bridge.
class ModelSession {
public:
    virtual ~ModelSession() = default;

    // 48 kHz mono PCM16.
    virtual void send_audio(const std::vector<int16_t>& pcm) = 0;
    virtual void send_control_message(const nlohmann::json& message) = 0;
    virtual void close() = 0;
    virtual bool is_connected() const = 0;
};

}
}
