#pragma once

#include <cstdint>
#include <vector>

namespace voice_bridge {
namespace media {

// Payloads under 3 bytes carry no speech (DTX / comfort-noise markers).
bool is_dtx_frame(const std::vector<uint8_t>& payload);

// Canonical single-byte silence TOCs and short all-zero payloads.
bool is_silence_marker(const std::vector<uint8_t>& payload);

// Forwards the first frame of every `interval` consecutive DTX frames as a
// synthesized silence frame and drops the rest.
class DtxSparsifier {
public:
    explicit DtxSparsifier(int interval = 4);

    bool on_dtx_frame();
    void on_audio_frame();
    int run_length() const { return run_length_; }

private:
    int interval_;
    int run_length_ = 0;
};

// Passes at most `limit` consecutive identical payloads.
class DuplicateSuppressor {
public:
    explicit DuplicateSuppressor(int limit = 3);

    bool should_forward(const std::vector<uint8_t>& payload);
    int repeat_count() const { return repeat_count_; }

private:
    int limit_;
    int repeat_count_ = 0;
    std::vector<uint8_t> last_payload_;
};

}
}
