#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace voice_bridge {
namespace media {

struct MediaFrame {
    std::vector<uint8_t> payload;
    uint16_t sequence = 0;
    uint32_t timestamp = 0;
};

// Blocking reader over one inbound track. Returns std::nullopt once the
// stream has ended or the source was closed.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual std::optional<MediaFrame> next_frame() = 0;
    virtual void close() = 0;
};

// Writer for one outbound track carrying compressed frames. Throws when the
// destination rejects the frame.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual void write_frame(const std::vector<uint8_t>& payload,
                             std::chrono::milliseconds duration) = 0;
};

}
}
