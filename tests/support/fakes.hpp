#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_bridge/media/frame.hpp"
#include "voice_bridge/model/model_session.hpp"

namespace voice_bridge::testing {

// Replays a fixed list of frames, then reports end of stream.
class ScriptedSource : public media::FrameSource {
public:
    explicit ScriptedSource(std::vector<std::vector<uint8_t>> payloads) {
        uint16_t sequence = 1;
        for (auto& payload : payloads) {
            media::MediaFrame frame;
            frame.payload = std::move(payload);
            frame.sequence = sequence++;
            frames_.push_back(std::move(frame));
        }
    }

    std::optional<media::MediaFrame> next_frame() override {
        if (frames_.empty()) {
            return std::nullopt;
        }
        auto frame = std::move(frames_.front());
        frames_.pop_front();
        return frame;
    }

    void close() override { frames_.clear(); }

private:
    std::deque<media::MediaFrame> frames_;
};

class RecordingSink : public media::FrameSink {
public:
    void write_frame(const std::vector<uint8_t>& payload,
                     std::chrono::milliseconds duration) override {
        if (fail) {
            throw std::runtime_error("sink closed");
        }
        std::lock_guard<std::mutex> lock(mutex);
        frames.push_back(payload);
        durations.push_back(duration);
    }

    bool fail = false;
    std::mutex mutex;
    std::vector<std::vector<uint8_t>> frames;
    std::vector<std::chrono::milliseconds> durations;
};

class FakeModelSession : public model::ModelSession {
public:
    void send_audio(const std::vector<int16_t>& pcm) override {
        if (fail_audio) {
            throw model::ModelSessionError("audio track closed");
        }
        audio.push_back(pcm);
    }

    void send_control_message(const nlohmann::json& message) override {
        if (fail_control) {
            throw model::ModelSessionError("control channel closed");
        }
        control.push_back(message);
    }

    void close() override { connected = false; }
    bool is_connected() const override { return connected; }

    bool connected = true;
    bool fail_audio = false;
    bool fail_control = false;
    std::vector<std::vector<int16_t>> audio;
    std::vector<nlohmann::json> control;
};

}
