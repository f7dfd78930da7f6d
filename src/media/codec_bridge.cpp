#include "voice_bridge/media/codec_bridge.hpp"

#include "voice_bridge/logging.hpp"
#include "voice_bridge/media/frame_filter.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge::media {

namespace {

constexpr std::chrono::milliseconds kFrameDuration{20};
constexpr uint64_t kProgressInterval = 100;
constexpr uint64_t kLoggedWriteErrors = 3;

bool check(const std::function<bool()>& predicate) {
    return predicate && predicate();
}

void count(Direction direction, const char* outcome) {
    Metrics::instance().increment_frames(to_string(direction), outcome);
}

}

CodecBridge::CodecBridge(BridgeSettings settings,
                         CodecStateRegistry& registry,
                         utils::TimerService& clock,
                         AudioCache* cache)
    : settings_(settings),
      registry_(registry),
      clock_(clock),
      cache_(cache) {}

std::shared_ptr<CodecState> CodecBridge::state_for(const std::string& connection_id,
                                                   Direction direction) {
    const auto dtx_interval = settings_.dtx_interval;
    const auto duplicate_limit = settings_.duplicate_limit;
    return registry_.get_or_create(connection_id, direction, [=]() {
        auto state = std::make_unique<CodecState>(dtx_interval, duplicate_limit);
        if (direction == Direction::TelephonyToModel) {
            state->decoder = std::make_unique<Decoder>();
        }
        return state;
    });
}

void CodecBridge::cache(const StreamContext& context,
                        CacheRole role,
                        const std::vector<uint8_t>& payload) {
    if (!cache_) {
        return;
    }
    try {
        cache_->cache_frame(context.connection_id, role, CacheFormat::Opus, payload);
    } catch (const std::exception& ex) {
        logging::debug("Audio cache write failed",
                       {kv("connection_id", context.connection_id), kv("error", ex.what())});
    }
}

void CodecBridge::forward_to_model(const StreamContext& context,
                                   FrameSource& source,
                                   model::ModelSession& model) {
    constexpr auto direction = Direction::TelephonyToModel;
    const std::vector<int16_t> silence(kFrameSamples, 0);
    std::vector<int16_t> pcm;
    std::shared_ptr<CodecState> state;
    bool first_frame = true;

    logging::info("Forwarding started",
                  {kv("connection_id", context.connection_id), kv("direction", to_string(direction))});

    while (!check(context.closed)) {
        auto frame = source.next_frame();
        if (!frame) {
            logging::info("Inbound stream ended",
                          {kv("connection_id", context.connection_id), kv("direction", to_string(direction))});
            break;
        }
        if (check(context.closed)) {
            break;
        }
        if (!state) {
            try {
                state = state_for(context.connection_id, direction);
            } catch (const std::exception& ex) {
                logging::error("Failed to create codec state",
                               {kv("connection_id", context.connection_id), kv("error", ex.what())});
                break;
            }
        }
        ++state->packets;
        if (first_frame) {
            first_frame = false;
            if (context.on_first_frame) {
                context.on_first_frame();
            }
        }
        if (state->packets % kProgressInterval == 0) {
            logging::debug("Forwarding progress",
                           {kv("connection_id", context.connection_id),
                            kv("direction", to_string(direction)),
                            kv("packets", state->packets),
                            kv("decode_errors", state->decode_errors)});
        }
        cache(context, CacheRole::UserInput, frame->payload);

        if (check(context.suppress_inbound)) {
            context.activity->touch(clock_.now());
            count(direction, "suppressed");
            continue;
        }

        const std::vector<int16_t>* outgoing = &pcm;
        if (is_dtx_frame(frame->payload) || is_silence_marker(frame->payload)) {
            if (!state->dtx.on_dtx_frame()) {
                count(direction, "dtx_dropped");
                continue;
            }
            outgoing = &silence;
        } else {
            state->dtx.on_audio_frame();
            try {
                state->decoder->decode(frame->payload, pcm);
            } catch (const CodecError& ex) {
                ++state->decode_errors;
                count(direction, "decode_error");
                if (frame->sequence % 100 == 0) {
                    logging::warn("Opus decode failed",
                                  {kv("connection_id", context.connection_id),
                                   kv("sequence", frame->sequence),
                                   kv("errors", state->decode_errors),
                                   kv("error", ex.what())});
                }
                continue;
            }
        }

        try {
            model.send_audio(*outgoing);
        } catch (const std::exception& ex) {
            ++state->write_errors;
            count(direction, "write_error");
            if (check(context.closed)) {
                break;
            }
            if (state->write_errors <= kLoggedWriteErrors) {
                logging::warn("Failed to send audio to model",
                              {kv("connection_id", context.connection_id),
                               kv("errors", state->write_errors),
                               kv("error", ex.what())});
            }
            continue;
        }

        if (outgoing == &silence) {
            count(direction, "dtx_silence");
        } else {
            context.activity->touch(clock_.now());
            count(direction, "forwarded");
        }
    }

    logging::info("Forwarding stopped",
                  {kv("connection_id", context.connection_id),
                   kv("direction", to_string(direction)),
                   kv("packets", state ? state->packets : 0)});
}

void CodecBridge::forward_to_telephony(const StreamContext& context,
                                       FrameSource& source,
                                       FrameSink& sink) {
    constexpr auto direction = Direction::ModelToTelephony;
    std::shared_ptr<CodecState> state;
    bool first_frame = true;

    logging::info("Forwarding started",
                  {kv("connection_id", context.connection_id), kv("direction", to_string(direction))});

    while (!check(context.closed)) {
        auto frame = source.next_frame();
        if (!frame) {
            logging::info("Inbound stream ended",
                          {kv("connection_id", context.connection_id), kv("direction", to_string(direction))});
            break;
        }
        if (check(context.closed)) {
            break;
        }
        if (!state) {
            state = state_for(context.connection_id, direction);
        }
        ++state->packets;
        cache(context, CacheRole::ModelOutput, frame->payload);

        if (is_silence_marker(frame->payload)) {
            count(direction, "silence_dropped");
            continue;
        }
        if (!state->duplicates.should_forward(frame->payload)) {
            count(direction, "duplicate_dropped");
            continue;
        }
        if (first_frame) {
            first_frame = false;
            if (context.on_first_frame) {
                context.on_first_frame();
            }
        }

        try {
            sink.write_frame(frame->payload, kFrameDuration);
        } catch (const std::exception& ex) {
            ++state->write_errors;
            count(direction, "write_error");
            if (check(context.closed)) {
                break;
            }
            if (state->write_errors <= kLoggedWriteErrors) {
                logging::warn("Failed to write audio to telephony",
                              {kv("connection_id", context.connection_id),
                               kv("errors", state->write_errors),
                               kv("error", ex.what())});
            }
            continue;
        }
        const auto now = clock_.now();
        context.activity->touch(now);
        if (context.playback) {
            context.playback->touch(now);
        }
        count(direction, "forwarded");
    }

    logging::info("Forwarding stopped",
                  {kv("connection_id", context.connection_id),
                   kv("direction", to_string(direction)),
                   kv("packets", state ? state->packets : 0)});
}

BackgroundInjector::BackgroundInjector(std::shared_ptr<const OpusFrames> clip,
                                       std::chrono::milliseconds idle_threshold,
                                       utils::TimerService& clock)
    : clip_(std::move(clip)),
      idle_threshold_(idle_threshold),
      clock_(clock) {}

bool BackgroundInjector::tick(const StreamContext& context, FrameSink& sink) {
    if (!clip_ || clip_->empty() || !context.playback || check(context.closed)) {
        return false;
    }
    const bool idle = context.playback->idle_for(clock_.now()) > idle_threshold_;
    if (!idle || !check(context.tool_call_in_flight)) {
        if (injecting_) {
            injecting_ = false;
            position_ = 0;
            logging::debug("Background audio stopped", {kv("connection_id", context.connection_id)});
        }
        return false;
    }
    if (!injecting_) {
        injecting_ = true;
        logging::debug("Background audio started", {kv("connection_id", context.connection_id)});
    }
    const auto& frame = (*clip_)[position_ % clip_->size()];
    ++position_;
    try {
        sink.write_frame(frame, kTick);
    } catch (const std::exception& ex) {
        ++write_errors_;
        if (write_errors_ <= kLoggedWriteErrors) {
            logging::warn("Failed to write background audio",
                          {kv("connection_id", context.connection_id), kv("error", ex.what())});
        }
        return false;
    }
    Metrics::instance().increment_frames(to_string(Direction::ModelToTelephony), "background");
    return true;
}

void BackgroundInjector::run(const StreamContext& context, FrameSink& sink) {
    auto next = std::chrono::steady_clock::now();
    while (!check(context.closed)) {
        tick(context, sink);
        next += kTick;
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_until(lock, next, [this]() { return stopping_; })) {
            break;
        }
    }
}

void BackgroundInjector::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
}

}
