#include "voice_bridge/media/pcm_framer.hpp"

#include <algorithm>
#include <exception>

namespace voice_bridge::media {

PcmFramer::PcmFramer(size_t frame_samples)
    : frame_samples_(frame_samples),
      frame_(frame_samples) {}

void PcmFramer::push(const std::vector<int16_t>& pcm, const Emit& emit) {
    pending_.insert(pending_.end(), pcm.begin(), pcm.end());
    while (pending_.size() >= frame_samples_) {
        const auto end = pending_.begin() + static_cast<std::ptrdiff_t>(frame_samples_);
        std::copy(pending_.begin(), end, frame_.begin());
        pending_.erase(pending_.begin(), end);
        try {
            emit(frame_.data());
        } catch (const std::exception&) {
            pending_.clear();
            throw;
        }
    }
}

void PcmFramer::clear() {
    pending_.clear();
}

}
