#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/call/timer_coordinator.hpp"
#include "support/manual_timer_service.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace call = voice_bridge::call;

using std::chrono::milliseconds;
using std::chrono::seconds;
using voice_bridge::testing::ManualTimerService;

namespace {

struct Prompt {
    std::string connection_id;
    int retry;
    int max_retries;
};

class RecordingListener : public call::TimerListener {
public:
    void on_inactivity_prompt(const std::string& connection_id, int retry, int max_retries) override {
        prompts.push_back({connection_id, retry, max_retries});
    }

    void on_termination_requested(const std::string& connection_id, call::ExitReason reason) override {
        terminations.emplace_back(connection_id, reason);
    }

    std::vector<Prompt> prompts;
    std::vector<std::pair<std::string, call::ExitReason>> terminations;
};

call::TimerSettings settings(int max_retries = 5) {
    call::TimerSettings s;
    s.max_duration = seconds(300);
    s.silence_window = seconds(20);
    s.max_retries = max_retries;
    return s;
}

}

TEST_CASE("recent activity re-arms the silence timer for the remaining window") {
    ManualTimerService timers;
    RecordingListener listener;
    call::TimerCoordinator coordinator(timers, listener, nullptr, settings());
    auto activity = std::make_shared<voice_bridge::media::ActivityTracker>(timers.now());
    coordinator.start("c1", activity);
    coordinator.start_silence_timer("c1");

    timers.advance(seconds(15));
    activity->touch(timers.now());
    timers.advance(seconds(5));
    REQUIRE(listener.prompts.empty());
    REQUIRE(coordinator.silence_armed("c1"));

    timers.advance(seconds(14));
    REQUIRE(listener.prompts.empty());
    timers.advance(seconds(1));
    REQUIRE(listener.prompts.size() == 1);
}

TEST_CASE("twenty seconds of silence prompts the caller") {
    ManualTimerService timers;
    RecordingListener listener;
    call::TimerCoordinator coordinator(timers, listener, nullptr, settings());
    coordinator.start("c1", std::make_shared<voice_bridge::media::ActivityTracker>(timers.now()));
    coordinator.start_silence_timer("c1");

    timers.advance(milliseconds(19999));
    REQUIRE(listener.prompts.empty());
    timers.advance(milliseconds(1));
    REQUIRE(listener.prompts.size() == 1);
    REQUIRE(listener.prompts[0].connection_id == "c1");
    REQUIRE(listener.prompts[0].retry == 0);
    REQUIRE(listener.prompts[0].max_retries == 5);
    REQUIRE(coordinator.silence_retries("c1") == 1);
    REQUIRE(coordinator.silence_armed("c1"));
}

TEST_CASE("silence during a tool call is not counted") {
    ManualTimerService timers;
    RecordingListener listener;
    call::FunctionCallTracker tools;
    call::TimerCoordinator coordinator(timers, listener, &tools, settings());
    coordinator.start("c1", std::make_shared<voice_bridge::media::ActivityTracker>(timers.now()));
    coordinator.start_silence_timer("c1");

    auto guard = tools.begin("c1");
    timers.advance(seconds(20));
    REQUIRE(listener.prompts.empty());
    REQUIRE(coordinator.silence_retries("c1") == 0);
    REQUIRE(coordinator.silence_armed("c1"));

    guard.release();
    timers.advance(seconds(20));
    REQUIRE(listener.prompts.size() == 1);
}

TEST_CASE("exhausted retries end the call for silence") {
    ManualTimerService timers;
    RecordingListener listener;
    call::TimerCoordinator coordinator(timers, listener, nullptr, settings(2));
    coordinator.start("c1", std::make_shared<voice_bridge::media::ActivityTracker>(timers.now()));
    coordinator.start_silence_timer("c1");

    timers.advance(seconds(20));
    timers.advance(seconds(20));
    REQUIRE(listener.prompts.size() == 2);
    REQUIRE(listener.prompts[1].retry == 1);
    REQUIRE(listener.terminations.empty());

    timers.advance(seconds(20));
    REQUIRE(listener.terminations.size() == 1);
    REQUIRE(listener.terminations[0].second == call::ExitReason::Silence);
}

TEST_CASE("user speech resets the retry count and AI speech pauses the timer") {
    ManualTimerService timers;
    RecordingListener listener;
    call::TimerCoordinator coordinator(timers, listener, nullptr, settings());
    coordinator.start("c1", std::make_shared<voice_bridge::media::ActivityTracker>(timers.now()));
    coordinator.start_silence_timer("c1");
    timers.advance(seconds(20));
    REQUIRE(coordinator.silence_retries("c1") == 1);

    coordinator.pause_silence_timer("c1");
    REQUIRE_FALSE(coordinator.silence_armed("c1"));
    REQUIRE(coordinator.silence_retries("c1") == 1);
    timers.advance(seconds(60));
    REQUIRE(listener.prompts.size() == 1);

    coordinator.start_silence_timer("c1");
    coordinator.reset_silence_timer("c1");
    REQUIRE(coordinator.silence_retries("c1") == 0);
    REQUIRE_FALSE(coordinator.silence_armed("c1"));
}

TEST_CASE("max duration ends the call with timeout") {
    ManualTimerService timers;
    RecordingListener listener;
    auto s = settings();
    s.max_duration = seconds(60);
    call::TimerCoordinator coordinator(timers, listener, nullptr, s);
    coordinator.start("c1", std::make_shared<voice_bridge::media::ActivityTracker>(timers.now()));

    timers.advance(seconds(59));
    REQUIRE(listener.terminations.empty());
    timers.advance(seconds(1));
    REQUIRE(listener.terminations.size() == 1);
    REQUIRE(listener.terminations[0].first == "c1");
    REQUIRE(listener.terminations[0].second == call::ExitReason::Timeout);
}

TEST_CASE("stopped connections fire nothing") {
    ManualTimerService timers;
    RecordingListener listener;
    call::TimerCoordinator coordinator(timers, listener, nullptr, settings());
    coordinator.start("c1", std::make_shared<voice_bridge::media::ActivityTracker>(timers.now()));
    coordinator.start_silence_timer("c1");
    coordinator.stop("c1");

    REQUIRE_FALSE(coordinator.contains("c1"));
    timers.advance(seconds(600));
    REQUIRE(listener.prompts.empty());
    REQUIRE(listener.terminations.empty());
}

TEST_CASE("tool call tracker counts guards per connection") {
    call::FunctionCallTracker tracker;
    REQUIRE_FALSE(tracker.is_call_in_flight("c1"));
    {
        auto first = tracker.begin("c1");
        auto second = tracker.begin("c1");
        REQUIRE(tracker.in_flight("c1") == 2);
        REQUIRE_FALSE(tracker.is_call_in_flight("c2"));

        auto moved = std::move(first);
        REQUIRE(tracker.in_flight("c1") == 2);
        moved.release();
        moved.release();
        REQUIRE(tracker.in_flight("c1") == 1);
    }
    REQUIRE(tracker.in_flight("c1") == 0);
    REQUIRE_FALSE(tracker.is_call_in_flight("c1"));
}
