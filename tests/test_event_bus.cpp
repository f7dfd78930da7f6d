#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/events/bus.hpp"
#include "voice_bridge/events/middleware.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using voice_bridge::events::Event;
using voice_bridge::events::EventBus;
using voice_bridge::events::EventType;
using voice_bridge::events::make_event;

TEST_CASE("handlers run in subscription order") {
    EventBus bus;
    std::vector<int> calls;
    bus.subscribe(EventType::ConnectionReady, [&](const Event&) { calls.push_back(1); });
    bus.subscribe(EventType::ConnectionReady, [&](const Event&) { calls.push_back(2); });
    bus.subscribe(EventType::ConnectionCreated, [&](const Event&) { calls.push_back(99); });

    bus.publish(make_event(EventType::ConnectionReady, "c1"));
    REQUIRE(calls == std::vector<int>{1, 2});
}

TEST_CASE("a failing handler does not stop its siblings and is reported") {
    EventBus bus;
    int sibling_calls = 0;
    std::string failed_type;
    bus.subscribe(EventType::AudioTrackReady,
                  [](const Event&) { throw std::runtime_error("boom"); });
    bus.subscribe(EventType::AudioTrackReady, [&](const Event&) { ++sibling_calls; });
    bus.subscribe(EventType::HandlerFailure, [&](const Event& e) {
        failed_type = e.data.value("failed_type", "");
    });

    REQUIRE_NOTHROW(bus.publish(make_event(EventType::AudioTrackReady, "c1", "test",
                                           {{"track_type", "audio"}})));
    REQUIRE(sibling_calls == 1);
    REQUIRE(failed_type == voice_bridge::events::to_string(EventType::AudioTrackReady));
}

TEST_CASE("unsubscribed handlers stop receiving events") {
    EventBus bus;
    int calls = 0;
    const auto id = bus.subscribe(EventType::ConnectionReady, [&](const Event&) { ++calls; });
    bus.publish(make_event(EventType::ConnectionReady, "c1"));
    REQUIRE(bus.unsubscribe(id));
    REQUIRE_FALSE(bus.unsubscribe(id));
    bus.publish(make_event(EventType::ConnectionReady, "c1"));
    REQUIRE(calls == 1);
}

TEST_CASE("validation middleware drops events without a connection id") {
    EventBus bus({voice_bridge::events::validation_middleware()});
    int calls = 0;
    bus.subscribe(EventType::SdpAnswerGenerated, [&](const Event&) { ++calls; });

    bus.publish(make_event(EventType::SdpAnswerGenerated, "", "test", {{"sdp", "v=0"}}));
    bus.publish(make_event(EventType::SdpAnswerGenerated, "c1", "test"));
    bus.publish(make_event(EventType::SdpAnswerGenerated, "c1", "test", {{"sdp", "v=0"}}));
    REQUIRE(calls == 1);
}

TEST_CASE("deduplication middleware suppresses repeats inside the window") {
    EventBus bus({voice_bridge::events::deduplication_middleware(std::chrono::seconds(5))});
    int calls = 0;
    bus.subscribe(EventType::ModelGreetingSent, [&](const Event&) { ++calls; });

    bus.publish(make_event(EventType::ModelGreetingSent, "c1"));
    bus.publish(make_event(EventType::ModelGreetingSent, "c1"));
    bus.publish(make_event(EventType::ModelGreetingSent, "c2"));
    REQUIRE(calls == 2);
}

TEST_CASE("rate limit middleware drops events beyond the bucket") {
    EventBus bus({voice_bridge::events::rate_limit_middleware(2)});
    int calls = 0;
    bus.subscribe(EventType::IceConnectionChanged, [&](const Event&) { ++calls; });

    for (int i = 0; i < 5; ++i) {
        bus.publish(make_event(EventType::IceConnectionChanged, "c" + std::to_string(i)));
    }
    REQUIRE(calls == 2);
}

TEST_CASE("recovery middleware wraps the whole fan-out") {
    std::vector<std::string> reported;
    EventBus bus({voice_bridge::events::recovery_middleware(
        [&](const Event&, const std::string& what) { reported.push_back(what); })});
    bus.use([](voice_bridge::events::Handler) -> voice_bridge::events::Handler {
        return [](const Event&) { throw std::runtime_error("middleware failure"); };
    });

    REQUIRE_NOTHROW(bus.publish(make_event(EventType::ConnectionCreated, "c1")));
    REQUIRE(reported == std::vector<std::string>{"middleware failure"});
}

TEST_CASE("timeout middleware returns to the publisher before a slow handler finishes") {
    std::atomic<bool> finished{false};
    EventBus bus({voice_bridge::events::timeout_middleware(std::chrono::milliseconds(50))});
    bus.subscribe(EventType::ConnectionReady, [&finished](const Event&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        finished = true;
    });

    const auto started = std::chrono::steady_clock::now();
    bus.publish(make_event(EventType::ConnectionReady, "c1"));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < std::chrono::milliseconds(300));
    REQUIRE_FALSE(finished);
}

TEST_CASE("timeout middleware waits for handlers that finish in time") {
    EventBus bus({voice_bridge::events::timeout_middleware(std::chrono::seconds(2))});
    std::atomic<int> calls{0};
    bus.subscribe(EventType::ConnectionReady, [&calls](const Event&) { ++calls; });

    bus.publish(make_event(EventType::ConnectionReady, "c1"));
    REQUIRE(calls == 1);
}

TEST_CASE("destroying the bus waits for handlers detached by a timeout") {
    std::atomic<bool> finished{false};
    {
        EventBus bus({voice_bridge::events::timeout_middleware(std::chrono::milliseconds(20))});
        bus.subscribe(EventType::ConnectionTerminated, [&finished](const Event&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            finished = true;
        });
        bus.publish(make_event(EventType::ConnectionTerminated, "c1"));
        REQUIRE_FALSE(finished);
    }
    REQUIRE(finished);
}

TEST_CASE("wait_for returns the matching event") {
    EventBus bus;
    std::thread publisher([&bus]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        bus.publish(make_event(EventType::ModelAudioReady, "other", "test", {{"track_type", "audio"}}));
        bus.publish(make_event(EventType::ModelAudioReady, "c1", "test", {{"track_type", "audio"}}));
    });
    const auto event = bus.wait_for(EventType::ModelAudioReady, "c1", std::chrono::seconds(2));
    publisher.join();

    REQUIRE(event.has_value());
    REQUIRE(event->connection_id == "c1");
}

TEST_CASE("wait_for times out without an event") {
    EventBus bus;
    const auto event = bus.wait_for(EventType::ConnectionReady, "c1", std::chrono::milliseconds(20));
    REQUIRE_FALSE(event.has_value());
}

TEST_CASE("cancel_waits releases pending waiters for the connection") {
    EventBus bus;
    std::atomic<bool> returned{false};
    std::optional<Event> result;
    std::thread waiter([&]() {
        result = bus.wait_for(EventType::ConnectionReady, "c1", std::chrono::seconds(10));
        returned = true;
    });
    while (!returned) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        bus.cancel_waits("c1");
    }
    waiter.join();
    REQUIRE(returned);
    REQUIRE_FALSE(result.has_value());
}

TEST_CASE("stats count published events by type") {
    EventBus bus;
    bus.subscribe(EventType::ConnectionReady, [](const Event&) {});
    bus.publish(make_event(EventType::ConnectionReady, "c1"));
    bus.publish(make_event(EventType::ConnectionReady, "c2"));

    const auto stats = bus.stats();
    REQUIRE(stats.total_events == 2);
    REQUIRE(stats.events_by_type.at(voice_bridge::events::to_string(EventType::ConnectionReady)) == 2);
    REQUIRE(stats.active_handlers == 1);
}

TEST_CASE("a closed bus ignores publishes") {
    EventBus bus;
    int calls = 0;
    bus.subscribe(EventType::ConnectionReady, [&](const Event&) { ++calls; });
    bus.close();
    bus.publish(make_event(EventType::ConnectionReady, "c1"));
    REQUIRE(bus.closed());
    REQUIRE(calls == 0);
}
