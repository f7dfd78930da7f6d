#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace voice_bridge {
namespace media {

// Last-audio-activity marker shared by the forwarding loops (writers, once
// per frame) and timers (readers). Lock-free.
class ActivityTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ActivityTracker(Clock::time_point start = Clock::now()) { touch(start); }

    void touch(Clock::time_point at) {
        last_ms_.store(to_ms(at), std::memory_order_relaxed);
    }

    Clock::time_point last() const {
        return Clock::time_point(std::chrono::milliseconds(last_ms_.load(std::memory_order_relaxed)));
    }

    std::chrono::milliseconds idle_for(Clock::time_point now) const {
        const auto idle = to_ms(now) - last_ms_.load(std::memory_order_relaxed);
        return std::chrono::milliseconds(idle > 0 ? idle : 0);
    }

private:
    static int64_t to_ms(Clock::time_point at) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
    }

    std::atomic<int64_t> last_ms_{0};
};

}
}
