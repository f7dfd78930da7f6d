#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

#include "voice_bridge/media/frame.hpp"

namespace voice_bridge {
namespace media {

// Bounded hand-off between a transport callback thread and the forwarding
// task. When full, the oldest frame is dropped.
class FrameQueue : public FrameSource {
public:
    static constexpr size_t kMaxQueueSize = 64;

    void push(MediaFrame frame);
    // Ends the stream once the queued frames are drained.
    void finish();

    std::optional<MediaFrame> next_frame() override;
    void close() override;

    size_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<MediaFrame> frames_;
    size_t dropped_ = 0;
    bool finished_ = false;
    bool closed_ = false;
};

}
}
