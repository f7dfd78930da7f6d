#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <rtc/rtc.hpp>

#include "voice_bridge/media/frame.hpp"
#include "voice_bridge/media/frame_queue.hpp"

namespace voice_bridge {
namespace webrtc {

// Installs the Opus packetizer, sender reports and the receiving RTCP
// session on a negotiated audio track.
std::shared_ptr<rtc::RtpPacketizationConfig> configure_opus_track(const std::shared_ptr<rtc::Track>& track,
                                                                  uint32_t ssrc,
                                                                  const std::string& cname,
                                                                  int payload_type);

// Routes RTP arriving on the track into a frame queue. The queue ends when
// the track closes.
std::shared_ptr<media::FrameQueue> attach_frame_queue(const std::shared_ptr<rtc::Track>& track,
                                                      const std::string& connection_id,
                                                      const std::string& leg);

class TrackFrameSink : public media::FrameSink {
public:
    explicit TrackFrameSink(std::shared_ptr<rtc::Track> track);

    void write_frame(const std::vector<uint8_t>& payload,
                     std::chrono::milliseconds duration) override;

private:
    std::mutex mutex_;
    std::shared_ptr<rtc::Track> track_;
    uint32_t timestamp_ = 0;
};

}
}
