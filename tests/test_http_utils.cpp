#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/http.hpp"

#include <stdexcept>
#include <string>

TEST_CASE("url_encode escapes reserved characters") {
    REQUIRE(voice_bridge::utils::url_encode("hello world!") == "hello%20world%21");
    REQUIRE(voice_bridge::utils::url_encode("gpt-realtime_v1.0~x") == "gpt-realtime_v1.0~x");
}

TEST_CASE("parse_url splits scheme host port and path") {
    const auto parts = voice_bridge::utils::parse_url("https://example.com:8443/path/file");
    REQUIRE(parts.scheme == "https");
    REQUIRE(parts.host == "example.com");
    REQUIRE(parts.port == 8443);
    REQUIRE(parts.path == "/path/file");
}

TEST_CASE("parse_url fills default ports and root path") {
    REQUIRE(voice_bridge::utils::parse_url("https://api.example.com").port == 443);
    REQUIRE(voice_bridge::utils::parse_url("wss://api.example.com").port == 443);
    const auto plain = voice_bridge::utils::parse_url("signal.local");
    REQUIRE(plain.scheme == "http");
    REQUIRE(plain.port == 80);
    REQUIRE(plain.path == "/");
}

TEST_CASE("parse_url rejects a non-numeric port") {
    REQUIRE_THROWS_AS(voice_bridge::utils::parse_url("http://host:abc/"), std::runtime_error);
}

TEST_CASE("build_url omits default ports") {
    REQUIRE(voice_bridge::utils::build_url("https", "host", 443, "/v1") == "https://host/v1");
    REQUIRE(voice_bridge::utils::build_url("http", "host", 8080, "v1") == "http://host:8080/v1");
}

TEST_CASE("join_path keeps exactly one separator") {
    using voice_bridge::utils::join_path;
    REQUIRE(join_path("", "/v1/realtime/calls") == "/v1/realtime/calls");
    REQUIRE(join_path("/", "v1") == "/v1");
    REQUIRE(join_path("/api/", "/v1") == "/api/v1");
    REQUIRE(join_path("/api", "v1") == "/api/v1");
    REQUIRE(join_path("/api", "") == "/api");
}

TEST_CASE("to_websocket_url maps http schemes") {
    using voice_bridge::utils::to_websocket_url;
    REQUIRE(to_websocket_url("http://signal:9000") == "ws://signal:9000");
    REQUIRE(to_websocket_url("https://signal") == "wss://signal");
    REQUIRE(to_websocket_url("ws://signal") == "ws://signal");
    REQUIRE(to_websocket_url("signal:9000") == "ws://signal:9000");
}
