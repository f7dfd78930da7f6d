#include "voice_bridge/media/codec_state.hpp"

#include "voice_bridge/logging.hpp"

namespace voice_bridge::media {

const char* to_string(Direction direction) {
    switch (direction) {
        case Direction::TelephonyToModel:
            return "telephony_to_model";
        case Direction::ModelToTelephony:
            return "model_to_telephony";
    }
    return "unknown";
}

std::shared_ptr<CodecState> CodecStateRegistry::get_or_create(const std::string& connection_id,
                                                              Direction direction,
                                                              const Factory& factory) {
    const Key key{connection_id, direction};
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto it = states_.find(key);
        if (it != states_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = states_.find(key);
    if (it != states_.end()) {
        return it->second;
    }
    std::shared_ptr<CodecState> state = factory();
    states_.emplace(key, state);
    logging::debug(
        "Codec state created",
        {kv("connection_id", connection_id),
         kv("direction", to_string(direction))});
    return state;
}

std::shared_ptr<CodecState> CodecStateRegistry::find(const std::string& connection_id,
                                                     Direction direction) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = states_.find({connection_id, direction});
    return it == states_.end() ? nullptr : it->second;
}

void CodecStateRegistry::remove_connection(const std::string& connection_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = states_.begin(); it != states_.end();) {
        if (it->first.first == connection_id) {
            it = states_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t CodecStateRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return states_.size();
}

}
