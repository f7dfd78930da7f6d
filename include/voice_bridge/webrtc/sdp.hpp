#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace voice_bridge {
namespace webrtc {

class NegotiationError : public std::runtime_error {
public:
    explicit NegotiationError(const std::string& message) : std::runtime_error(message) {}
};

enum class TransportPolicy {
    All,
    RelayOnly
};

const char* to_string(TransportPolicy policy);

struct CandidateCounts {
    int host = 0;
    int srflx = 0;
    int prflx = 0;
    int relay = 0;

    int total() const { return host + srflx + prflx + relay; }
};

struct MediaSection {
    std::string kind;   // audio, video, application
    std::string mid;
    std::optional<int> opus_payload_type;
};

struct SdpSummary {
    std::vector<MediaSection> media;
    CandidateCounts candidates;
    std::string setup_role;   // actpass, active, passive or empty

    int count(const std::string& kind) const;
    const MediaSection* first(const std::string& kind) const;
};

// Structural parse of a session description. Throws NegotiationError when
// the text is not an SDP document with at least one media section.
SdpSummary analyze_sdp(const std::string& sdp);

// An offer reachable only through a relay (no host or srflx candidates but
// at least one relay candidate) forces the local side to relay-only when
// relay credentials are configured.
TransportPolicy select_transport_policy(const SdpSummary& remote, bool have_relay_credentials);

struct AnswerPlan {
    TransportPolicy policy = TransportPolicy::All;
    std::string audio_mid;
    int opus_payload_type = 111;
    std::string local_role;   // DTLS role the answer takes
    bool has_data_channel = false;
};

// Validates a remote offer for the single-channel layout (exactly one audio
// section offering Opus, no video) and derives how the answer mirrors it.
AnswerPlan plan_answer(const std::string& remote_offer, bool have_relay_credentials);

// Checks that the answer we generated took the planned DTLS role and kept a
// single audio section. Throws NegotiationError otherwise.
void check_local_answer(const std::string& local_answer, const AnswerPlan& plan);

// Verifies a remote answer to one of our offers carries one audio section.
SdpSummary check_answer(const std::string& remote_answer);

}
}
