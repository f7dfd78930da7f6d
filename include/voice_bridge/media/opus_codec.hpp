#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

struct OpusDecoder;
struct OpusEncoder;

namespace voice_bridge {
namespace media {

inline constexpr int kSampleRate = 48000;
inline constexpr int kChannels = 1;
inline constexpr int kFrameSamples = 960;       // 20 ms
inline constexpr int kMaxFrameSamples = 2880;   // 60 ms
inline constexpr size_t kMaxPacketBytes = 4000;

class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

class Decoder {
public:
    explicit Decoder(int sample_rate = kSampleRate, int channels = kChannels);
    ~Decoder();

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    // Decodes one packet into pcm (resized to the decoded sample count).
    void decode(const std::vector<uint8_t>& packet, std::vector<int16_t>& pcm);

private:
    ::OpusDecoder* decoder_ = nullptr;
    int channels_;
    std::vector<int16_t> buffer_;
};

class Encoder {
public:
    Encoder(int bitrate, int sample_rate = kSampleRate, int channels = kChannels);
    ~Encoder();

    Encoder(const Encoder&) = delete;
    Encoder& operator=(const Encoder&) = delete;

    // pcm must hold exactly one frame (kFrameSamples per channel).
    std::vector<uint8_t> encode(const int16_t* pcm, int frame_samples);

private:
    ::OpusEncoder* encoder_ = nullptr;
};

}
}
