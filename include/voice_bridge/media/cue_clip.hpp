#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace voice_bridge {
namespace media {

struct PcmAudio {
    int sample_rate = 0;
    int channels = 0;
    std::vector<int16_t> samples;   // interleaved
};

using OpusFrames = std::vector<std::vector<uint8_t>>;

// Reads a 16-bit PCM RIFF/WAVE payload. Throws std::runtime_error otherwise.
PcmAudio parse_wav(const std::string& bytes);
PcmAudio read_wav(const std::filesystem::path& path);

std::vector<int16_t> downmix_to_mono(const std::vector<int16_t>& interleaved, int channels);
std::vector<int16_t> resample_linear(const std::vector<int16_t>& input, int from_rate, int to_rate);

// Splits 48 kHz mono PCM into 20 ms frames (the last one zero padded) and
// encodes each with a fresh encoder.
OpusFrames encode_frames(const std::vector<int16_t>& pcm, int bitrate);

// Loads, converts and encodes the clip once per path; later calls share the
// cached frames. Throws if the clip cannot be prepared.
std::shared_ptr<const OpusFrames> load_cue_frames(const std::filesystem::path& path, int bitrate);

}
}
