#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "voice_bridge/media/activity.hpp"
#include "voice_bridge/media/audio_cache.hpp"
#include "voice_bridge/media/codec_state.hpp"
#include "voice_bridge/media/cue_clip.hpp"
#include "voice_bridge/media/frame.hpp"
#include "voice_bridge/model/model_session.hpp"
#include "voice_bridge/utils/timer.hpp"

namespace voice_bridge {
namespace media {

struct BridgeSettings {
    int dtx_interval = 4;
    int duplicate_limit = 3;
    std::chrono::milliseconds cue_idle_threshold{1000};
};

// What a forwarding loop needs to know about its connection. Predicates
// left empty are treated as false.
struct StreamContext {
    std::string connection_id;
    std::shared_ptr<ActivityTracker> activity;
    // Last audio written to the telephony leg. Only forward_to_telephony
    // touches it; the background injector gates on it.
    std::shared_ptr<ActivityTracker> playback;
    std::function<bool()> closed;
    std::function<bool()> suppress_inbound;
    std::function<bool()> tool_call_in_flight;
    std::function<void()> on_first_frame;
};

class CodecBridge {
public:
    CodecBridge(BridgeSettings settings,
                CodecStateRegistry& registry,
                utils::TimerService& clock,
                AudioCache* cache = nullptr);

    // Telephony -> model: DTX sparsification, Opus decode, PCM to the
    // model. Returns when the source ends or the connection closes.
    void forward_to_model(const StreamContext& context,
                          FrameSource& source,
                          model::ModelSession& model);

    // Model -> telephony: silence-marker and duplicate filtering, Opus
    // passthrough to the telephony track.
    void forward_to_telephony(const StreamContext& context,
                              FrameSource& source,
                              FrameSink& sink);

    const BridgeSettings& settings() const { return settings_; }

private:
    std::shared_ptr<CodecState> state_for(const std::string& connection_id, Direction direction);
    void cache(const StreamContext& context,
               CacheRole role,
               const std::vector<uint8_t>& payload);

    BridgeSettings settings_;
    CodecStateRegistry& registry_;
    utils::TimerService& clock_;
    AudioCache* cache_;
};

// Streams the cue clip to the telephony leg on a 20 ms ticker while the
// call is idle beyond the threshold and a tool call is pending. The clip
// does not count as activity, so it stops as soon as real audio flows.
class BackgroundInjector {
public:
    static constexpr std::chrono::milliseconds kTick{20};

    BackgroundInjector(std::shared_ptr<const OpusFrames> clip,
                       std::chrono::milliseconds idle_threshold,
                       utils::TimerService& clock);

    // One ticker step. Returns true when a cue frame was written.
    bool tick(const StreamContext& context, FrameSink& sink);

    // Ticks until stop() is called or the connection closes.
    void run(const StreamContext& context, FrameSink& sink);
    void stop();

    size_t position() const { return position_; }

private:
    std::shared_ptr<const OpusFrames> clip_;
    std::chrono::milliseconds idle_threshold_;
    utils::TimerService& clock_;
    size_t position_ = 0;
    bool injecting_ = false;
    uint64_t write_errors_ = 0;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

}
}
