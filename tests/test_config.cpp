#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/config.hpp"

#include <stdexcept>

namespace {

voice_bridge::Config valid_config() {
    voice_bridge::Config config;
    config.model_api_key = "sk-test";
    return config;
}

}

TEST_CASE("default configuration with an api key is valid") {
    REQUIRE_NOTHROW(valid_config().validate());
}

TEST_CASE("validate requires the model api key") {
    voice_bridge::Config config;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("a relay server needs both credentials") {
    auto config = valid_config();
    config.turn_server = "turn.example.com:3478";
    config.turn_username = "bridge";
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    config.turn_credential = "secret";
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("validate rejects out of range media and timer settings") {
    auto payload_type = valid_config();
    payload_type.opus_payload_type = 8;
    REQUIRE_THROWS_AS(payload_type.validate(), std::runtime_error);

    auto dtx = valid_config();
    dtx.dtx_forward_interval = 0;
    REQUIRE_THROWS_AS(dtx.validate(), std::runtime_error);

    auto silence = valid_config();
    silence.silence_timeout_sec = 0;
    REQUIRE_THROWS_AS(silence.validate(), std::runtime_error);

    auto profile = valid_config();
    profile.event_middleware_profile = "verbose";
    REQUIRE_THROWS_AS(profile.validate(), std::runtime_error);
}

TEST_CASE("validate accepts the known model providers only") {
    auto gemini = valid_config();
    gemini.model_provider = "gemini";
    REQUIRE_NOTHROW(gemini.validate());

    auto unknown = valid_config();
    unknown.model_provider = "azure";
    REQUIRE_THROWS_AS(unknown.validate(), std::runtime_error);
}
