#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/media/codec_bridge.hpp"
#include "voice_bridge/media/opus_codec.hpp"
#include "support/fakes.hpp"
#include "support/manual_timer_service.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <memory>
#include <thread>
#include <vector>

namespace media = voice_bridge::media;

using voice_bridge::testing::FakeModelSession;
using voice_bridge::testing::ManualTimerService;
using voice_bridge::testing::RecordingSink;
using voice_bridge::testing::ScriptedSource;

namespace {

media::StreamContext make_context(ManualTimerService& clock) {
    media::StreamContext context;
    context.connection_id = "c1";
    context.activity = std::make_shared<media::ActivityTracker>(clock.now());
    context.playback = std::make_shared<media::ActivityTracker>(clock.now());
    return context;
}

std::vector<uint8_t> encoded_tone() {
    std::vector<int16_t> pcm(media::kFrameSamples);
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = static_cast<int16_t>(8000.0 * std::sin(2.0 * 3.14159265 * 440.0 * i / media::kSampleRate));
    }
    media::Encoder encoder(32000);
    return encoder.encode(pcm.data(), media::kFrameSamples);
}

class RecordingCache : public media::AudioCache {
public:
    void cache_frame(const std::string&, media::CacheRole role, media::CacheFormat,
                     const std::vector<uint8_t>&) override {
        roles.push_back(role);
    }
    void cleanup(const std::string&) override {}

    std::vector<media::CacheRole> roles;
};

}

TEST_CASE("codec registry creates one state per direction under contention") {
    media::CodecStateRegistry registry;
    std::atomic<int> created{0};
    std::vector<std::shared_ptr<media::CodecState>> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i]() {
            results[i] = registry.get_or_create("c1", media::Direction::ModelToTelephony, [&]() {
                ++created;
                return std::make_unique<media::CodecState>(4, 3);
            });
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(created == 1);
    for (const auto& state : results) {
        REQUIRE(state == results.front());
    }
    REQUIRE(registry.size() == 1);
    registry.remove_connection("c1");
    REQUIRE(registry.find("c1", media::Direction::ModelToTelephony) == nullptr);
}

TEST_CASE("twelve DTX frames reach the model as three silence frames") {
    ManualTimerService clock;
    media::CodecStateRegistry registry;
    media::CodecBridge bridge({}, registry, clock);
    auto context = make_context(clock);
    const auto before = context.activity->last();

    ScriptedSource source(std::vector<std::vector<uint8_t>>(12, std::vector<uint8_t>{0xF8}));
    FakeModelSession model;
    clock.advance(std::chrono::seconds(1));
    bridge.forward_to_model(context, source, model);

    REQUIRE(model.audio.size() == 3);
    for (const auto& pcm : model.audio) {
        REQUIRE(pcm.size() == static_cast<size_t>(media::kFrameSamples));
        REQUIRE(std::all_of(pcm.begin(), pcm.end(), [](int16_t s) { return s == 0; }));
    }
    REQUIRE(context.activity->last() == before);
}

TEST_CASE("speech frames are decoded and mark activity") {
    ManualTimerService clock;
    media::CodecStateRegistry registry;
    media::CodecBridge bridge({}, registry, clock);
    auto context = make_context(clock);
    int first_frames = 0;
    context.on_first_frame = [&first_frames]() { ++first_frames; };

    const auto tone = encoded_tone();
    ScriptedSource source({tone, tone});
    FakeModelSession model;
    clock.advance(std::chrono::seconds(2));
    bridge.forward_to_model(context, source, model);

    REQUIRE(model.audio.size() == 2);
    REQUIRE(model.audio.front().size() == static_cast<size_t>(media::kFrameSamples));
    REQUIRE(first_frames == 1);
    REQUIRE(context.activity->last() == clock.now());
}

TEST_CASE("undecodable frames are skipped without stopping the loop") {
    ManualTimerService clock;
    media::CodecStateRegistry registry;
    media::CodecBridge bridge({}, registry, clock);
    auto context = make_context(clock);

    ScriptedSource source({std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFF, 0xFF}, encoded_tone()});
    FakeModelSession model;
    bridge.forward_to_model(context, source, model);

    REQUIRE(model.audio.size() == 1);
    const auto state = registry.find("c1", media::Direction::TelephonyToModel);
    REQUIRE(state != nullptr);
    REQUIRE(state->decode_errors == 1);
}

TEST_CASE("suppressed caller audio is withheld but counts as activity") {
    ManualTimerService clock;
    media::CodecStateRegistry registry;
    RecordingCache cache;
    media::CodecBridge bridge({}, registry, clock, &cache);
    auto context = make_context(clock);
    context.suppress_inbound = []() { return true; };

    ScriptedSource source({encoded_tone()});
    FakeModelSession model;
    clock.advance(std::chrono::seconds(1));
    bridge.forward_to_model(context, source, model);

    REQUIRE(model.audio.empty());
    REQUIRE(context.activity->last() == clock.now());
    REQUIRE(cache.roles == std::vector<media::CacheRole>{media::CacheRole::UserInput});
}

TEST_CASE("model send failures do not stop forwarding") {
    ManualTimerService clock;
    media::CodecStateRegistry registry;
    media::CodecBridge bridge({}, registry, clock);
    auto context = make_context(clock);

    ScriptedSource source({encoded_tone(), encoded_tone(), encoded_tone()});
    FakeModelSession model;
    model.fail_audio = true;
    bridge.forward_to_model(context, source, model);

    REQUIRE(registry.find("c1", media::Direction::TelephonyToModel)->write_errors == 3);
}

TEST_CASE("a closed connection stops forwarding before the next frame") {
    ManualTimerService clock;
    media::CodecStateRegistry registry;
    media::CodecBridge bridge({}, registry, clock);
    auto context = make_context(clock);
    context.closed = []() { return true; };

    ScriptedSource source({encoded_tone()});
    FakeModelSession model;
    bridge.forward_to_model(context, source, model);
    REQUIRE(model.audio.empty());
}

TEST_CASE("model audio drops repeats beyond three and silence markers") {
    ManualTimerService clock;
    media::CodecStateRegistry registry;
    media::CodecBridge bridge({}, registry, clock);
    auto context = make_context(clock);

    const std::vector<uint8_t> frame{0x78, 0x10, 0x20, 0x30};
    const std::vector<uint8_t> other{0x78, 0x11, 0x21, 0x31};
    ScriptedSource source({frame, frame, std::vector<uint8_t>{0xF8}, frame, frame, frame, other});
    RecordingSink sink;
    clock.advance(std::chrono::seconds(1));
    bridge.forward_to_telephony(context, source, sink);

    REQUIRE(sink.frames.size() == 4);
    REQUIRE(sink.frames.back() == other);
    REQUIRE(sink.durations.front() == std::chrono::milliseconds(20));
    REQUIRE(context.activity->last() == clock.now());
    REQUIRE(context.playback->last() == clock.now());
}

TEST_CASE("five identical model frames write three and a new frame is written") {
    ManualTimerService clock;
    media::CodecStateRegistry registry;
    media::CodecBridge bridge({}, registry, clock);
    auto context = make_context(clock);

    const std::vector<uint8_t> frame{0x78, 0x10, 0x20, 0x30};
    const std::vector<uint8_t> other{0x78, 0x99, 0x20, 0x30};
    ScriptedSource source({frame, frame, frame, frame, frame, other});
    RecordingSink sink;
    bridge.forward_to_telephony(context, source, sink);

    REQUIRE(sink.frames.size() == 4);
    REQUIRE(std::count(sink.frames.begin(), sink.frames.end(), frame) == 3);
    REQUIRE(sink.frames.back() == other);
}

TEST_CASE("background cue plays only while idle with a tool call in flight") {
    ManualTimerService clock;
    auto clip = std::make_shared<const media::OpusFrames>(
        media::OpusFrames{{0x78, 0x01, 0x01}, {0x78, 0x02, 0x02}});
    media::BackgroundInjector injector(clip, std::chrono::milliseconds(1000), clock);
    auto context = make_context(clock);
    bool tool_call = true;
    context.tool_call_in_flight = [&tool_call]() { return tool_call; };
    RecordingSink sink;

    REQUIRE_FALSE(injector.tick(context, sink));

    clock.advance(std::chrono::milliseconds(1500));
    REQUIRE(injector.tick(context, sink));
    REQUIRE(injector.tick(context, sink));
    REQUIRE(injector.tick(context, sink));
    REQUIRE(sink.frames.size() == 3);
    REQUIRE(sink.frames[2] == clip->front());
    REQUIRE(context.playback->idle_for(clock.now()) == std::chrono::milliseconds(1500));

    tool_call = false;
    REQUIRE_FALSE(injector.tick(context, sink));
    REQUIRE(injector.position() == 0);

    tool_call = true;
    context.playback->touch(clock.now());
    REQUIRE_FALSE(injector.tick(context, sink));
    REQUIRE(sink.frames.size() == 3);
}

TEST_CASE("background cue plays over caller audio while the model leg is silent") {
    ManualTimerService clock;
    media::CodecStateRegistry registry;
    media::CodecBridge bridge({}, registry, clock);
    auto clip = std::make_shared<const media::OpusFrames>(
        media::OpusFrames{{0x78, 0x01, 0x01}, {0x78, 0x02, 0x02}});
    media::BackgroundInjector injector(clip, std::chrono::milliseconds(1000), clock);
    auto context = make_context(clock);
    context.tool_call_in_flight = []() { return true; };
    const auto tone = encoded_tone();
    FakeModelSession model;
    RecordingSink telephony;

    for (int step = 0; step < 150; ++step) {
        clock.advance(std::chrono::milliseconds(20));
        ScriptedSource caller({tone});
        bridge.forward_to_model(context, caller, model);
        injector.tick(context, telephony);
    }

    REQUIRE(model.audio.size() == 150);
    REQUIRE(context.activity->last() == clock.now());
    REQUIRE(telephony.frames.size() == 100);

    ScriptedSource reply({std::vector<uint8_t>{0x78, 0x33, 0x44, 0x55}});
    bridge.forward_to_telephony(context, reply, telephony);
    REQUIRE_FALSE(injector.tick(context, telephony));
    REQUIRE(injector.position() == 0);
}

TEST_CASE("background injector run returns after stop") {
    ManualTimerService clock;
    auto clip = std::make_shared<const media::OpusFrames>(media::OpusFrames{{0x78, 0x01, 0x01}});
    media::BackgroundInjector injector(clip, std::chrono::milliseconds(1000), clock);
    auto context = make_context(clock);
    RecordingSink sink;

    std::thread runner([&]() { injector.run(context, sink); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    injector.stop();
    runner.join();
    REQUIRE(sink.frames.empty());
}
