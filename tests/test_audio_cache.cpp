#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/media/audio_cache.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace media = voice_bridge::media;

TEST_CASE("file audio cache writes length-prefixed records per role") {
    const auto root = std::filesystem::temp_directory_path() /
                      ("voice_bridge_cache_" + std::to_string(
                          std::chrono::steady_clock::now().time_since_epoch().count()));
    {
        media::FileAudioCache cache(root);
        cache.cache_frame("c1", media::CacheRole::UserInput, media::CacheFormat::Opus, {0x01, 0x02, 0x03});
        cache.cache_frame("c1", media::CacheRole::UserInput, media::CacheFormat::Opus, {0x04});
        cache.cache_frame("c1", media::CacheRole::ModelOutput, media::CacheFormat::Opus, {0x05, 0x06});
        REQUIRE(cache.open_files() == 2);
        cache.cleanup("c1");
        REQUIRE(cache.open_files() == 0);
        cache.cleanup("c1");
    }

    std::ifstream in(root / "c1" / "user_input.opus", std::ios::binary);
    const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                     std::istreambuf_iterator<char>());
    REQUIRE(bytes == std::vector<uint8_t>{3, 0, 0, 0, 0x01, 0x02, 0x03, 1, 0, 0, 0, 0x04});
    REQUIRE(std::filesystem::file_size(root / "c1" / "model_output.opus") == 6);

    std::filesystem::remove_all(root);
}

TEST_CASE("cache names describe role and format") {
    REQUIRE(std::string(media::to_string(media::CacheRole::UserInput)) == "user_input");
    REQUIRE(std::string(media::to_string(media::CacheRole::ModelOutput)) == "model_output");
    REQUIRE(std::string(media::to_string(media::CacheFormat::Pcm16)) == "pcm16");
}
