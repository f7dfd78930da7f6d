#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "voice_bridge/media/opus_codec.hpp"

namespace voice_bridge {
namespace media {

// Cuts a PCM stream into fixed-size frames. A frame leaves the buffer before
// it is emitted; if emit throws, everything still buffered is discarded and
// the exception propagates.
class PcmFramer {
public:
    using Emit = std::function<void(const int16_t* frame)>;

    explicit PcmFramer(size_t frame_samples = kFrameSamples);

    void push(const std::vector<int16_t>& pcm, const Emit& emit);
    void clear();
    size_t buffered() const { return pending_.size(); }

private:
    size_t frame_samples_;
    std::vector<int16_t> pending_;
    std::vector<int16_t> frame_;
};

}
}
