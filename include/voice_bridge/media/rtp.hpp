#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace voice_bridge {
namespace media {

struct RtpPacket {
    uint8_t payload_type = 0;
    bool marker = false;
    uint16_t sequence = 0;
    uint32_t timestamp = 0;
    uint32_t ssrc = 0;
    std::vector<uint8_t> payload;
};

// Parses an RTP v2 packet (RFC 3550), skipping CSRCs, the header extension
// and padding. Returns std::nullopt for RTCP or malformed input.
std::optional<RtpPacket> parse_rtp(const uint8_t* data, size_t size);

}
}
