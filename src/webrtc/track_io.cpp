#include "voice_bridge/webrtc/track_io.hpp"

#include <stdexcept>
#include <variant>

#include <rtc/frameinfo.hpp>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/media/opus_codec.hpp"
#include "voice_bridge/media/rtp.hpp"

namespace voice_bridge::webrtc {

namespace {
constexpr uint32_t kSamplesPerMs = media::kSampleRate / 1000;
}

std::shared_ptr<rtc::RtpPacketizationConfig> configure_opus_track(const std::shared_ptr<rtc::Track>& track,
                                                                  uint32_t ssrc,
                                                                  const std::string& cname,
                                                                  int payload_type) {
    auto rtp_config = std::make_shared<rtc::RtpPacketizationConfig>(
        ssrc, cname, static_cast<uint8_t>(payload_type), static_cast<uint32_t>(media::kSampleRate));
    auto packetizer = std::make_shared<rtc::OpusRtpPacketizer>(rtp_config);
    packetizer->addToChain(std::make_shared<rtc::RtcpSrReporter>(rtp_config));
    packetizer->addToChain(std::make_shared<rtc::RtcpReceivingSession>());
    track->setMediaHandler(packetizer);
    return rtp_config;
}

std::shared_ptr<media::FrameQueue> attach_frame_queue(const std::shared_ptr<rtc::Track>& track,
                                                      const std::string& connection_id,
                                                      const std::string& leg) {
    auto queue = std::make_shared<media::FrameQueue>();
    std::weak_ptr<media::FrameQueue> weak_queue = queue;

    track->onMessage([weak_queue](rtc::message_variant message) {
        auto queue = weak_queue.lock();
        if (!queue) {
            return;
        }
        const auto* data = std::get_if<rtc::binary>(&message);
        if (!data) {
            return;
        }
        auto packet = media::parse_rtp(reinterpret_cast<const uint8_t*>(data->data()), data->size());
        if (!packet) {
            return;
        }
        media::MediaFrame frame;
        frame.payload = std::move(packet->payload);
        frame.sequence = packet->sequence;
        frame.timestamp = packet->timestamp;
        queue->push(std::move(frame));
    });
    track->onClosed([weak_queue, connection_id, leg]() {
        logging::info("Audio track closed",
                      {kv("connection_id", connection_id), kv("leg", leg)});
        if (auto queue = weak_queue.lock()) {
            queue->finish();
        }
    });
    return queue;
}

TrackFrameSink::TrackFrameSink(std::shared_ptr<rtc::Track> track)
    : track_(std::move(track)) {}

void TrackFrameSink::write_frame(const std::vector<uint8_t>& payload,
                                 std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!track_->isOpen()) {
        throw std::runtime_error("audio track is not open");
    }
    const auto* begin = reinterpret_cast<const std::byte*>(payload.data());
    rtc::binary frame(begin, begin + payload.size());
    track_->sendFrame(std::move(frame), rtc::FrameInfo(timestamp_));
    timestamp_ += static_cast<uint32_t>(duration.count()) * kSamplesPerMs;
}

}
