#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/events/lifecycle.hpp"
#include "support/manual_timer_service.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace events = voice_bridge::events;
namespace deps = voice_bridge::events::deps;

using events::EventType;
using events::Phase;
using voice_bridge::testing::ManualTimerService;

namespace {

void count_events(events::EventBus& bus, EventType type, int& counter) {
    bus.subscribe(type, [&counter](const events::Event&) { ++counter; });
}

const std::vector<std::string> kInboundDeps = {
    deps::kTransportSdpReady,
    deps::kModelConnectionReady,
    deps::kModelAudioReady,
    deps::kModelControlChannelReady,
};

}

TEST_CASE("connection becomes ready once every dependency in any order is satisfied") {
    auto order = kInboundDeps;
    std::sort(order.begin(), order.end());
    do {
        events::EventBus bus;
        ManualTimerService timers;
        events::ConnectionLifecycle lifecycle(bus, timers);
        int ready = 0;
        count_events(bus, EventType::ConnectionReady, ready);

        lifecycle.register_connection("c1", "call-1", "tenant", kInboundDeps);
        REQUIRE(lifecycle.get_state("c1").phase == Phase::Created);
        for (size_t i = 0; i < order.size(); ++i) {
            REQUIRE(lifecycle.mark_dependency_ready("c1", order[i]));
            const auto phase = lifecycle.get_state("c1").phase;
            if (i + 1 < order.size()) {
                REQUIRE(phase == Phase::Initializing);
                REQUIRE(ready == 0);
            } else {
                REQUIRE(phase == Phase::Ready);
            }
        }
        REQUIRE(ready == 1);
    } while (std::next_permutation(order.begin(), order.end()));
}

TEST_CASE("connection missing one dependency never becomes ready") {
    events::EventBus bus;
    ManualTimerService timers;
    events::ConnectionLifecycle lifecycle(bus, timers);
    int ready = 0;
    count_events(bus, EventType::ConnectionReady, ready);

    lifecycle.register_connection("c1", "call-1", "tenant", kInboundDeps);
    for (size_t i = 0; i + 1 < kInboundDeps.size(); ++i) {
        lifecycle.mark_dependency_ready("c1", kInboundDeps[i]);
    }
    REQUIRE_FALSE(lifecycle.update_phase("c1", Phase::Ready));
    REQUIRE(lifecycle.get_state("c1").phase == Phase::Initializing);
    REQUIRE(ready == 0);
}

TEST_CASE("dependency events on the bus satisfy dependencies") {
    events::EventBus bus;
    ManualTimerService timers;
    events::ConnectionLifecycle lifecycle(bus, timers);
    lifecycle.register_connection("c1", "call-1", "tenant",
                                  {deps::kTransportSdpReady, deps::kModelAudioReady});

    bus.publish(events::make_event(EventType::SdpAnswerGenerated, "c1", "test", {{"sdp", "v=0"}}));
    bus.publish(events::make_event(EventType::ModelAudioReady, "c1", "test", {{"track_type", "audio"}}));
    REQUIRE(lifecycle.get_state("c1").phase == Phase::Ready);
}

TEST_CASE("an empty dependency set is ready at registration") {
    events::EventBus bus;
    ManualTimerService timers;
    events::ConnectionLifecycle lifecycle(bus, timers);
    int ready = 0;
    count_events(bus, EventType::ConnectionReady, ready);

    lifecycle.register_connection("c1", "call-1", "tenant", {});
    REQUIRE(lifecycle.get_state("c1").phase == Phase::Ready);
    REQUIRE(ready == 1);
}

TEST_CASE("phases never move backwards") {
    events::EventBus bus;
    ManualTimerService timers;
    events::ConnectionLifecycle lifecycle(bus, timers);
    lifecycle.register_connection("c1", "call-1", "tenant", {deps::kTransportSdpReady});

    REQUIRE(lifecycle.update_phase("c1", Phase::Initializing));
    REQUIRE_FALSE(lifecycle.update_phase("c1", Phase::Created));
    REQUIRE_FALSE(lifecycle.update_phase("c1", Phase::Initializing));
    REQUIRE(lifecycle.update_phase("c1", Phase::Terminating));
    REQUIRE_FALSE(lifecycle.mark_dependency_ready("c1", deps::kTransportSdpReady));
    REQUIRE(lifecycle.get_state("c1").phase == Phase::Terminating);
}

TEST_CASE("unknown and repeated dependencies are ignored") {
    events::EventBus bus;
    ManualTimerService timers;
    events::ConnectionLifecycle lifecycle(bus, timers);
    lifecycle.register_connection("c1", "call-1", "tenant",
                                  {deps::kTransportSdpReady, deps::kModelAudioReady});

    REQUIRE_FALSE(lifecycle.mark_dependency_ready("c1", "not-a-dependency"));
    REQUIRE(lifecycle.get_state("c1").phase == Phase::Created);
    REQUIRE(lifecycle.mark_dependency_ready("c1", deps::kTransportSdpReady));
    REQUIRE_FALSE(lifecycle.mark_dependency_ready("c1", deps::kTransportSdpReady));
}

TEST_CASE("terminate publishes exactly one event and cleans up after the delay") {
    events::EventBus bus;
    ManualTimerService timers;
    events::ConnectionLifecycle lifecycle(bus, timers, std::chrono::seconds(5));
    int terminated = 0;
    count_events(bus, EventType::ConnectionTerminated, terminated);
    lifecycle.register_connection("c1", "call-1", "tenant", {deps::kTransportSdpReady});

    REQUIRE(lifecycle.terminate_connection("c1"));
    REQUIRE_FALSE(lifecycle.terminate_connection("c1"));
    REQUIRE_FALSE(lifecycle.update_phase("c1", Phase::Terminated));
    REQUIRE(terminated == 1);
    REQUIRE(lifecycle.get_state("c1").phase == Phase::Terminated);

    timers.advance(std::chrono::seconds(4));
    REQUIRE(lifecycle.contains("c1"));
    timers.advance(std::chrono::seconds(1));
    REQUIRE_FALSE(lifecycle.contains("c1"));
}

TEST_CASE("operations on unknown connections throw ConnectionNotFound") {
    events::EventBus bus;
    ManualTimerService timers;
    events::ConnectionLifecycle lifecycle(bus, timers);

    REQUIRE_THROWS_AS(lifecycle.get_state("missing"), events::ConnectionNotFound);
    REQUIRE_THROWS_AS(lifecycle.update_phase("missing", Phase::Ready), events::ConnectionNotFound);
    REQUIRE_THROWS_AS(lifecycle.mark_dependency_ready("missing", deps::kTransportSdpReady),
                      events::ConnectionNotFound);
    REQUIRE_THROWS_AS(lifecycle.terminate_connection("missing"), events::ConnectionNotFound);
}

TEST_CASE("duplicate registration is rejected") {
    events::EventBus bus;
    ManualTimerService timers;
    events::ConnectionLifecycle lifecycle(bus, timers);
    lifecycle.register_connection("c1", "call-1", "tenant", {});
    REQUIRE_THROWS(lifecycle.register_connection("c1", "call-2", "tenant", {}));
    REQUIRE(lifecycle.all_connections().size() == 1);
}
