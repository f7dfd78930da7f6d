#include "voice_bridge/media/opus_codec.hpp"

#include <opus/opus.h>

namespace voice_bridge::media {

Decoder::Decoder(int sample_rate, int channels)
    : channels_(channels),
      buffer_(static_cast<size_t>(kMaxFrameSamples * channels)) {
    int error = OPUS_OK;
    decoder_ = opus_decoder_create(sample_rate, channels, &error);
    if (error != OPUS_OK || !decoder_) {
        throw CodecError(std::string("failed to create opus decoder: ") + opus_strerror(error));
    }
}

Decoder::~Decoder() {
    if (decoder_) {
        opus_decoder_destroy(decoder_);
    }
}

void Decoder::decode(const std::vector<uint8_t>& packet, std::vector<int16_t>& pcm) {
    const int samples = opus_decode(decoder_,
                                    packet.data(),
                                    static_cast<opus_int32>(packet.size()),
                                    buffer_.data(),
                                    kMaxFrameSamples,
                                    0);
    if (samples < 0) {
        throw CodecError(std::string("opus decode failed: ") + opus_strerror(samples));
    }
    pcm.assign(buffer_.begin(), buffer_.begin() + samples * channels_);
}

Encoder::Encoder(int bitrate, int sample_rate, int channels) {
    int error = OPUS_OK;
    encoder_ = opus_encoder_create(sample_rate, channels, OPUS_APPLICATION_VOIP, &error);
    if (error != OPUS_OK || !encoder_) {
        throw CodecError(std::string("failed to create opus encoder: ") + opus_strerror(error));
    }
    const int ctl = opus_encoder_ctl(encoder_, OPUS_SET_BITRATE(bitrate));
    if (ctl != OPUS_OK) {
        opus_encoder_destroy(encoder_);
        encoder_ = nullptr;
        throw CodecError(std::string("failed to set opus bitrate: ") + opus_strerror(ctl));
    }
}

Encoder::~Encoder() {
    if (encoder_) {
        opus_encoder_destroy(encoder_);
    }
}

std::vector<uint8_t> Encoder::encode(const int16_t* pcm, int frame_samples) {
    std::vector<uint8_t> packet(kMaxPacketBytes);
    const int bytes = opus_encode(encoder_,
                                  pcm,
                                  frame_samples,
                                  packet.data(),
                                  static_cast<opus_int32>(packet.size()));
    if (bytes < 0) {
        throw CodecError(std::string("opus encode failed: ") + opus_strerror(bytes));
    }
    packet.resize(static_cast<size_t>(bytes));
    return packet;
}

}
