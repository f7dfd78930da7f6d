#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/call/connection.hpp"
#include "voice_bridge/call/exit_reason.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace call = voice_bridge::call;

using std::chrono::milliseconds;

TEST_CASE("greeting gate suppresses until greeting audio plays past the interruption window") {
    const auto t0 = call::GreetingGate::Clock::time_point(std::chrono::hours(1));
    call::GreetingGate gate(t0, milliseconds(5000), milliseconds(3000));

    REQUIRE(gate.suppress(t0 + milliseconds(100)));
    gate.greeting_sent(t0 + milliseconds(500));
    REQUIRE(gate.greeting_was_sent());
    REQUIRE(gate.suppress(t0 + milliseconds(1000)));

    gate.greeting_audio_started(t0 + milliseconds(1000));
    REQUIRE(gate.suppress(t0 + milliseconds(3999)));
    REQUIRE_FALSE(gate.suppress(t0 + milliseconds(4000)));
}

TEST_CASE("greeting gate failsafes release caller audio") {
    const auto t0 = call::GreetingGate::Clock::time_point(std::chrono::hours(1));

    call::GreetingGate never_sent(t0, milliseconds(5000), milliseconds(3000));
    REQUIRE(never_sent.suppress(t0 + milliseconds(4999)));
    REQUIRE_FALSE(never_sent.suppress(t0 + milliseconds(5000)));

    call::GreetingGate no_audio(t0, milliseconds(5000), milliseconds(3000));
    no_audio.greeting_sent(t0 + milliseconds(2000));
    REQUIRE(no_audio.suppress(t0 + milliseconds(6999)));
    REQUIRE_FALSE(no_audio.suppress(t0 + milliseconds(7000)));
}

TEST_CASE("greeting gate keeps the first timestamps") {
    const auto t0 = call::GreetingGate::Clock::time_point(std::chrono::hours(1));
    call::GreetingGate gate(t0, milliseconds(5000), milliseconds(3000));
    gate.greeting_sent(t0);
    gate.greeting_audio_started(t0);
    gate.greeting_audio_started(t0 + milliseconds(10000));
    REQUIRE_FALSE(gate.suppress(t0 + milliseconds(3000)));
}

TEST_CASE("connection registry rejects duplicate ids") {
    call::ConnectionRegistry registry;
    auto connection = std::make_shared<call::Connection>();
    connection->id = "c1";
    registry.add(connection);

    auto duplicate = std::make_shared<call::Connection>();
    duplicate->id = "c1";
    REQUIRE_THROWS_AS(registry.add(duplicate), std::runtime_error);
    REQUIRE(registry.find("c1") == connection);
    REQUIRE(registry.size() == 1);

    REQUIRE(registry.remove("c1") == connection);
    REQUIRE(registry.remove("c1") == nullptr);
    REQUIRE(registry.all().empty());
}

TEST_CASE("exit reasons round trip through their names") {
    for (const auto reason : {call::ExitReason::Timeout, call::ExitReason::Silence, call::ExitReason::Default}) {
        REQUIRE(call::parse_exit_reason(call::to_string(reason)) == reason);
    }
    REQUIRE_FALSE(call::parse_exit_reason("hangup").has_value());
}

TEST_CASE("farewell messages differ per exit reason") {
    const std::string timeout = call::farewell_message(call::ExitReason::Timeout);
    const std::string silence = call::farewell_message(call::ExitReason::Silence);
    const std::string fallback = call::farewell_message(call::ExitReason::Default);
    REQUIRE(timeout.find("call time limit") != std::string::npos);
    REQUIRE(silence.find("haven't heard from you") != std::string::npos);
    REQUIRE(fallback == "We will end the call. Please feel free to contact us again anytime.");
}
