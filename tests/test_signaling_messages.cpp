#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/signaling/messages.hpp"

#include <chrono>
#include <string>

namespace signaling = voice_bridge::signaling;

TEST_CASE("parse_call_request reads optional fields") {
    const auto request = signaling::parse_call_request(
        {{"tenant_id", "acme"}, {"agent_id", "support"}, {"call_id", "pstn-1"}, {"sdp", "v=0"}}, true);
    REQUIRE(request.connection_id.empty());
    REQUIRE(request.tenant_id == "acme");
    REQUIRE(request.agent_id == "support");
    REQUIRE(request.call_id == "pstn-1");
    REQUIRE(request.sdp == "v=0");

    const auto outbound = signaling::parse_call_request({{"connection_id", "c9"}, {"sdp", nullptr}}, false);
    REQUIRE(outbound.connection_id == "c9");
    REQUIRE(outbound.sdp.empty());
}

TEST_CASE("parse_call_request rejects bad input") {
    REQUIRE_THROWS_AS(signaling::parse_call_request(nlohmann::json::array(), false),
                      signaling::InvalidRequest);
    REQUIRE_THROWS_AS(signaling::parse_call_request({{"tenant_id", 5}}, false),
                      signaling::InvalidRequest);
    REQUIRE_THROWS_AS(signaling::parse_call_request({{"tenant_id", "acme"}}, true),
                      signaling::InvalidRequest);
}

TEST_CASE("require_string demands a non-empty string") {
    REQUIRE(signaling::require_string({{"sdp", "v=0"}}, "sdp") == "v=0");
    REQUIRE_THROWS_AS(signaling::require_string({{"sdp", ""}}, "sdp"), signaling::InvalidRequest);
    REQUIRE_THROWS_AS(signaling::require_string({{"other", "x"}}, "sdp"), signaling::InvalidRequest);
}

TEST_CASE("outbound notifications carry the connection id") {
    const auto setup = signaling::setup_message("answer", {"c1", "v=0"});
    REQUIRE(setup["type"] == "answer");
    REQUIRE(setup["connection_id"] == "c1");
    REQUIRE(setup["sdp"] == "v=0");

    const auto tool = signaling::tool_call_message("c1", {"call_1", "lookup", "{}"});
    REQUIRE(tool["type"] == "tool_call");
    REQUIRE(tool["call_id"] == "call_1");
    REQUIRE(tool["name"] == "lookup");

    const auto ended = signaling::call_ended_message("c1", voice_bridge::call::ExitReason::Timeout);
    REQUIRE(ended["type"] == "call_ended");
    REQUIRE(ended["reason"] == "timeout");
}

TEST_CASE("error messages omit an empty connection id") {
    const auto with_id = signaling::error_message("c1", "terminate", "not found");
    REQUIRE(with_id["connection_id"] == "c1");
    REQUIRE(with_id["request_type"] == "terminate");

    const auto without_id = signaling::error_message("", "bogus", "unknown task");
    REQUIRE_FALSE(without_id.contains("connection_id"));
    REQUIRE(without_id["message"] == "unknown task");
}

TEST_CASE("connection state renders phase and dependencies") {
    voice_bridge::events::ConnectionState state;
    state.connection_id = "c1";
    state.call_id = "pstn-1";
    state.tenant_id = "acme";
    state.phase = voice_bridge::events::Phase::Initializing;
    state.dependencies = {{"transport-sdp-ready", true}, {"model-audio-ready", false}};
    state.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1000));
    state.updated_at = state.created_at;

    const auto json = signaling::connection_state_json(state);
    REQUIRE(json["phase"] == "initializing");
    REQUIRE(json["dependencies"]["transport-sdp-ready"] == true);
    REQUIRE(json["dependencies"]["model-audio-ready"] == false);
    REQUIRE(json["created_at_ms"] == 1000);
}
