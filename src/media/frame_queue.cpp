#include "voice_bridge/media/frame_queue.hpp"

namespace voice_bridge::media {

void FrameQueue::push(MediaFrame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || finished_) {
            return;
        }
        if (frames_.size() >= kMaxQueueSize) {
            frames_.pop_front();
            ++dropped_;
        }
        frames_.push_back(std::move(frame));
    }
    cv_.notify_one();
}

void FrameQueue::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

std::optional<MediaFrame> FrameQueue::next_frame() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || finished_ || !frames_.empty(); });
    if (closed_ || frames_.empty()) {
        return std::nullopt;
    }
    auto frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

void FrameQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        frames_.clear();
    }
    cv_.notify_all();
}

size_t FrameQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

}
