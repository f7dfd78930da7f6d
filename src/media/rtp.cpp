#include "voice_bridge/media/rtp.hpp"

namespace voice_bridge::media {

namespace {

constexpr size_t kFixedHeaderSize = 12;

uint16_t read_u16(const uint8_t* data) {
    return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

uint32_t read_u32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

}

std::optional<RtpPacket> parse_rtp(const uint8_t* data, size_t size) {
    if (!data || size < kFixedHeaderSize) {
        return std::nullopt;
    }
    const uint8_t version = data[0] >> 6;
    if (version != 2) {
        return std::nullopt;
    }
    // RTCP packet types 200-204 share the demuxed port.
    const uint8_t second = data[1];
    if (second >= 200 && second <= 204) {
        return std::nullopt;
    }

    const bool padding = (data[0] & 0x20) != 0;
    const bool extension = (data[0] & 0x10) != 0;
    const size_t csrc_count = data[0] & 0x0F;

    RtpPacket packet;
    packet.marker = (second & 0x80) != 0;
    packet.payload_type = second & 0x7F;
    packet.sequence = read_u16(data + 2);
    packet.timestamp = read_u32(data + 4);
    packet.ssrc = read_u32(data + 8);

    size_t offset = kFixedHeaderSize + csrc_count * 4;
    if (offset > size) {
        return std::nullopt;
    }
    if (extension) {
        if (offset + 4 > size) {
            return std::nullopt;
        }
        const size_t words = read_u16(data + offset + 2);
        offset += 4 + words * 4;
        if (offset > size) {
            return std::nullopt;
        }
    }

    size_t end = size;
    if (padding) {
        const size_t pad = data[size - 1];
        if (pad == 0 || offset + pad > size) {
            return std::nullopt;
        }
        end -= pad;
    }
    packet.payload.assign(data + offset, data + end);
    return packet;
}

}
