#include "voice_bridge/media/frame_filter.hpp"

#include <algorithm>

namespace voice_bridge::media {

bool is_dtx_frame(const std::vector<uint8_t>& payload) {
    return payload.size() < 3;
}

bool is_silence_marker(const std::vector<uint8_t>& payload) {
    if (payload.size() == 1 && (payload[0] == 0xF8 || payload[0] == 0x48)) {
        return true;
    }
    if (payload.size() <= 3) {
        return std::all_of(payload.begin(), payload.end(),
                           [](uint8_t byte) { return byte == 0; });
    }
    return false;
}

DtxSparsifier::DtxSparsifier(int interval)
    : interval_(interval > 0 ? interval : 1) {}

bool DtxSparsifier::on_dtx_frame() {
    ++run_length_;
    return (run_length_ - 1) % interval_ == 0;
}

void DtxSparsifier::on_audio_frame() {
    run_length_ = 0;
}

DuplicateSuppressor::DuplicateSuppressor(int limit)
    : limit_(limit > 0 ? limit : 1) {}

bool DuplicateSuppressor::should_forward(const std::vector<uint8_t>& payload) {
    if (repeat_count_ > 0 && payload == last_payload_) {
        ++repeat_count_;
    } else {
        last_payload_ = payload;
        repeat_count_ = 1;
    }
    return repeat_count_ <= limit_;
}

}
