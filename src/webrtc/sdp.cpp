#include "voice_bridge/webrtc/sdp.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace voice_bridge::webrtc {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

void count_candidate(const std::string& line, CandidateCounts& counts) {
    const auto pos = line.find(" typ ");
    if (pos == std::string::npos) {
        return;
    }
    std::istringstream stream(line.substr(pos + 5));
    std::string type;
    stream >> type;
    if (type == "host") {
        ++counts.host;
    } else if (type == "srflx") {
        ++counts.srflx;
    } else if (type == "prflx") {
        ++counts.prflx;
    } else if (type == "relay") {
        ++counts.relay;
    }
}

}

const char* to_string(TransportPolicy policy) {
    return policy == TransportPolicy::RelayOnly ? "relay" : "all";
}

int SdpSummary::count(const std::string& kind) const {
    return static_cast<int>(std::count_if(media.begin(), media.end(),
                                          [&kind](const MediaSection& m) { return m.kind == kind; }));
}

const MediaSection* SdpSummary::first(const std::string& kind) const {
    for (const auto& section : media) {
        if (section.kind == kind) {
            return &section;
        }
    }
    return nullptr;
}

SdpSummary analyze_sdp(const std::string& sdp) {
    std::istringstream stream(sdp);
    std::string line;
    bool saw_version = false;
    SdpSummary summary;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (!saw_version) {
            if (line != "v=0") {
                throw NegotiationError("session description must start with v=0");
            }
            saw_version = true;
            continue;
        }
        if (line.size() < 2 || line[1] != '=') {
            throw NegotiationError("malformed session description line: " + line);
        }

        if (line.rfind("m=", 0) == 0) {
            std::istringstream fields(line.substr(2));
            MediaSection section;
            fields >> section.kind;
            if (section.kind.empty()) {
                throw NegotiationError("media line without media type");
            }
            summary.media.push_back(section);
        } else if (line.rfind("a=mid:", 0) == 0 && !summary.media.empty()) {
            summary.media.back().mid = line.substr(6);
        } else if (line.rfind("a=rtpmap:", 0) == 0 && !summary.media.empty()) {
            const auto space = line.find(' ');
            if (space != std::string::npos &&
                to_lower(line.substr(space + 1)).rfind("opus/48000", 0) == 0 &&
                !summary.media.back().opus_payload_type) {
                try {
                    summary.media.back().opus_payload_type = std::stoi(line.substr(9, space - 9));
                } catch (const std::exception&) {
                    throw NegotiationError("invalid rtpmap payload type: " + line);
                }
            }
        } else if (line.rfind("a=setup:", 0) == 0) {
            summary.setup_role = line.substr(8);
        } else if (line.rfind("a=candidate:", 0) == 0) {
            count_candidate(line, summary.candidates);
        }
    }

    if (!saw_version) {
        throw NegotiationError("empty session description");
    }
    if (summary.media.empty()) {
        throw NegotiationError("session description has no media sections");
    }
    return summary;
}

TransportPolicy select_transport_policy(const SdpSummary& remote, bool have_relay_credentials) {
    const auto& c = remote.candidates;
    const bool relay_only = c.host == 0 && c.srflx == 0 && c.relay > 0;
    if (relay_only && have_relay_credentials) {
        return TransportPolicy::RelayOnly;
    }
    return TransportPolicy::All;
}

AnswerPlan plan_answer(const std::string& remote_offer, bool have_relay_credentials) {
    const auto summary = analyze_sdp(remote_offer);
    const int audio_sections = summary.count("audio");
    if (audio_sections != 1) {
        throw NegotiationError("offer must contain exactly one audio section, found " +
                               std::to_string(audio_sections));
    }
    if (summary.count("video") > 0) {
        throw NegotiationError("video sections are not supported");
    }
    const auto* audio = summary.first("audio");
    if (!audio->opus_payload_type) {
        throw NegotiationError("offer does not include opus/48000");
    }

    AnswerPlan plan;
    plan.policy = select_transport_policy(summary, have_relay_credentials);
    plan.audio_mid = audio->mid.empty() ? "0" : audio->mid;
    plan.opus_payload_type = *audio->opus_payload_type;
    plan.has_data_channel = summary.count("application") > 0;
    plan.local_role = summary.setup_role == "active" ? "passive" : "active";
    return plan;
}

void check_local_answer(const std::string& local_answer, const AnswerPlan& plan) {
    const auto summary = analyze_sdp(local_answer);
    if (summary.count("audio") != 1) {
        throw NegotiationError("generated answer must contain exactly one audio section");
    }
    if (summary.setup_role != plan.local_role) {
        throw NegotiationError("generated answer took DTLS role '" + summary.setup_role +
                               "', expected '" + plan.local_role + "'");
    }
}

SdpSummary check_answer(const std::string& remote_answer) {
    auto summary = analyze_sdp(remote_answer);
    if (summary.count("audio") != 1) {
        throw NegotiationError("answer must contain exactly one audio section");
    }
    if (!summary.first("audio")->opus_payload_type) {
        throw NegotiationError("answer does not accept opus/48000");
    }
    return summary;
}

}
