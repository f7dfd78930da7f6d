#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/media/frame_filter.hpp"
#include "voice_bridge/media/frame_queue.hpp"

#include <cstdint>
#include <vector>

using voice_bridge::media::DtxSparsifier;
using voice_bridge::media::DuplicateSuppressor;

TEST_CASE("short payloads are DTX frames") {
    REQUIRE(voice_bridge::media::is_dtx_frame({}));
    REQUIRE(voice_bridge::media::is_dtx_frame({0xF8}));
    REQUIRE(voice_bridge::media::is_dtx_frame({0x01, 0x02}));
    REQUIRE_FALSE(voice_bridge::media::is_dtx_frame({0x78, 0x01, 0x02}));
}

TEST_CASE("silence markers cover canonical TOCs and short zero payloads") {
    REQUIRE(voice_bridge::media::is_silence_marker({0xF8}));
    REQUIRE(voice_bridge::media::is_silence_marker({0x48}));
    REQUIRE(voice_bridge::media::is_silence_marker({0x00, 0x00, 0x00}));
    REQUIRE_FALSE(voice_bridge::media::is_silence_marker({0x78}));
    REQUIRE_FALSE(voice_bridge::media::is_silence_marker({0x00, 0x00, 0x00, 0x00}));
}

TEST_CASE("DTX sparsifier forwards one of every four frames in a run") {
    DtxSparsifier dtx(4);
    std::vector<bool> forwarded;
    for (int i = 0; i < 9; ++i) {
        forwarded.push_back(dtx.on_dtx_frame());
    }
    REQUIRE(forwarded == std::vector<bool>{true, false, false, false,
                                           true, false, false, false, true});
}

TEST_CASE("audio frames restart the DTX run") {
    DtxSparsifier dtx(4);
    REQUIRE(dtx.on_dtx_frame());
    REQUIRE_FALSE(dtx.on_dtx_frame());
    dtx.on_audio_frame();
    REQUIRE(dtx.run_length() == 0);
    REQUIRE(dtx.on_dtx_frame());
}

TEST_CASE("duplicate suppressor passes at most three identical payloads") {
    DuplicateSuppressor duplicates(3);
    const std::vector<uint8_t> frame{1, 2, 3, 4};
    REQUIRE(duplicates.should_forward(frame));
    REQUIRE(duplicates.should_forward(frame));
    REQUIRE(duplicates.should_forward(frame));
    REQUIRE_FALSE(duplicates.should_forward(frame));
    REQUIRE_FALSE(duplicates.should_forward(frame));
    REQUIRE(duplicates.should_forward({5, 6, 7, 8}));
    REQUIRE(duplicates.repeat_count() == 1);
    REQUIRE(duplicates.should_forward(frame));
}

TEST_CASE("frame queue drops the oldest frame when full") {
    voice_bridge::media::FrameQueue queue;
    for (size_t i = 0; i < voice_bridge::media::FrameQueue::kMaxQueueSize + 2; ++i) {
        voice_bridge::media::MediaFrame frame;
        frame.sequence = static_cast<uint16_t>(i);
        queue.push(frame);
    }
    REQUIRE(queue.dropped() == 2);
    queue.finish();
    const auto first = queue.next_frame();
    REQUIRE(first.has_value());
    REQUIRE(first->sequence == 2);
}

TEST_CASE("finished frame queue drains before ending and closed queue ends at once") {
    voice_bridge::media::FrameQueue finished;
    finished.push({{1, 2, 3}, 1, 0});
    finished.finish();
    finished.push({{4, 5, 6}, 2, 0});
    REQUIRE(finished.next_frame().has_value());
    REQUIRE_FALSE(finished.next_frame().has_value());

    voice_bridge::media::FrameQueue closed;
    closed.push({{1, 2, 3}, 1, 0});
    closed.close();
    REQUIRE_FALSE(closed.next_frame().has_value());
}
