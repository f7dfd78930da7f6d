#include "voice_bridge/media/cue_clip.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <stdexcept>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/media/opus_codec.hpp"

namespace voice_bridge::media {

namespace {

uint16_t read_u16(const std::string& bytes, size_t offset) {
    return static_cast<uint16_t>(static_cast<uint8_t>(bytes[offset]) |
                                 (static_cast<uint8_t>(bytes[offset + 1]) << 8));
}

uint32_t read_u32(const std::string& bytes, size_t offset) {
    return static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 3])) << 24);
}

struct CacheEntry {
    std::once_flag once;
    std::shared_ptr<const OpusFrames> frames;
    std::string error;
};

std::mutex cache_mutex;
std::map<std::string, std::shared_ptr<CacheEntry>> cache;

}

PcmAudio parse_wav(const std::string& bytes) {
    if (bytes.size() < 12 || bytes.compare(0, 4, "RIFF") != 0 ||
        bytes.compare(8, 4, "WAVE") != 0) {
        throw std::runtime_error("not a RIFF/WAVE file");
    }

    PcmAudio audio;
    bool have_format = false;
    size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const auto chunk_id = bytes.substr(offset, 4);
        const size_t chunk_size = read_u32(bytes, offset + 4);
        const size_t body = offset + 8;
        if (body + chunk_size > bytes.size()) {
            throw std::runtime_error("truncated WAV chunk: " + chunk_id);
        }
        if (chunk_id == "fmt ") {
            if (chunk_size < 16) {
                throw std::runtime_error("invalid WAV fmt chunk");
            }
            const auto format = read_u16(bytes, body);
            audio.channels = read_u16(bytes, body + 2);
            audio.sample_rate = static_cast<int>(read_u32(bytes, body + 4));
            const auto bits = read_u16(bytes, body + 14);
            if (format != 1 || bits != 16) {
                throw std::runtime_error("only 16-bit PCM WAV is supported");
            }
            have_format = true;
        } else if (chunk_id == "data") {
            if (!have_format) {
                throw std::runtime_error("WAV data chunk before fmt chunk");
            }
            audio.samples.resize(chunk_size / sizeof(int16_t));
            for (size_t i = 0; i < audio.samples.size(); ++i) {
                audio.samples[i] = static_cast<int16_t>(read_u16(bytes, body + i * 2));
            }
            break;
        }
        offset = body + chunk_size + (chunk_size & 1);
    }

    if (!have_format || audio.channels <= 0 || audio.sample_rate <= 0) {
        throw std::runtime_error("WAV file has no usable fmt chunk");
    }
    if (audio.samples.empty()) {
        throw std::runtime_error("WAV file has no audio data");
    }
    return audio;
}

PcmAudio read_wav(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw std::runtime_error("failed to open " + path.string());
    }
    const std::string bytes((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
    return parse_wav(bytes);
}

std::vector<int16_t> downmix_to_mono(const std::vector<int16_t>& interleaved, int channels) {
    if (channels <= 1) {
        return interleaved;
    }
    std::vector<int16_t> mono(interleaved.size() / static_cast<size_t>(channels));
    for (size_t frame = 0; frame < mono.size(); ++frame) {
        int32_t sum = 0;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[frame * static_cast<size_t>(channels) + static_cast<size_t>(ch)];
        }
        mono[frame] = static_cast<int16_t>(sum / channels);
    }
    return mono;
}

std::vector<int16_t> resample_linear(const std::vector<int16_t>& input, int from_rate, int to_rate) {
    if (input.empty() || from_rate == to_rate) {
        return input;
    }
    const double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    const auto out_len = static_cast<size_t>(std::lround(static_cast<double>(input.size()) / ratio));
    std::vector<int16_t> output(out_len);
    const size_t last = input.size() - 1;
    for (size_t i = 0; i < out_len; ++i) {
        const double position = static_cast<double>(i) * ratio;
        size_t s0 = static_cast<size_t>(position);
        if (s0 > last) {
            s0 = last;
        }
        const size_t s1 = s0 + 1 > last ? last : s0 + 1;
        const double frac = position - static_cast<double>(s0);
        const double value = input[s0] + (input[s1] - input[s0]) * frac;
        output[i] = static_cast<int16_t>(std::lround(value));
    }
    return output;
}

OpusFrames encode_frames(const std::vector<int16_t>& pcm, int bitrate) {
    Encoder encoder(bitrate);
    OpusFrames frames;
    frames.reserve(pcm.size() / kFrameSamples + 1);
    std::vector<int16_t> frame(kFrameSamples);
    for (size_t offset = 0; offset < pcm.size(); offset += kFrameSamples) {
        const size_t count = std::min<size_t>(kFrameSamples, pcm.size() - offset);
        std::fill(frame.begin(), frame.end(), 0);
        std::memcpy(frame.data(), pcm.data() + offset, count * sizeof(int16_t));
        frames.push_back(encoder.encode(frame.data(), kFrameSamples));
    }
    return frames;
}

std::shared_ptr<const OpusFrames> load_cue_frames(const std::filesystem::path& path, int bitrate) {
    std::shared_ptr<CacheEntry> entry;
    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        auto& slot = cache[path.string()];
        if (!slot) {
            slot = std::make_shared<CacheEntry>();
        }
        entry = slot;
    }

    std::call_once(entry->once, [&]() {
        try {
            const auto wav = read_wav(path);
            auto pcm = downmix_to_mono(wav.samples, wav.channels);
            pcm = resample_linear(pcm, wav.sample_rate, kSampleRate);
            auto frames = encode_frames(pcm, bitrate);
            if (frames.empty()) {
                entry->error = "no frames encoded";
                return;
            }
            logging::info(
                "Background cue loaded",
                {kv("path", path.string()),
                 kv("frames", frames.size())});
            entry->frames = std::make_shared<const OpusFrames>(std::move(frames));
        } catch (const std::exception& ex) {
            entry->error = ex.what();
        }
    });

    if (!entry->frames) {
        throw std::runtime_error("failed to load background cue " + path.string() + ": " +
                                 entry->error);
    }
    return entry->frames;
}

}
