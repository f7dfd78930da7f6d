#include "voice_bridge/webrtc/session_negotiator.hpp"

#include <condition_variable>
#include <random>
#include <sstream>
#include <variant>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::webrtc {

struct SessionNegotiator::Gathering {
    std::mutex mutex;
    std::condition_variable cv;
    bool complete = false;
};

namespace {

uint32_t random_ssrc() {
    static std::mutex mutex;
    static std::mt19937 generator{std::random_device{}()};
    std::lock_guard<std::mutex> lock(mutex);
    return std::uniform_int_distribution<uint32_t>(1, 0xFFFFFFF0u)(generator);
}

rtc::IceServer make_turn_server(const NegotiatorSettings& settings) {
    std::string address = *settings.turn_server;
    for (const char* prefix : {"turns:", "turn:"}) {
        if (address.rfind(prefix, 0) == 0) {
            address = address.substr(std::string(prefix).size());
        }
    }
    std::string host = address;
    uint16_t port = 3478;
    const auto colon = address.rfind(':');
    if (colon != std::string::npos) {
        host = address.substr(0, colon);
        try {
            port = static_cast<uint16_t>(std::stoi(address.substr(colon + 1)));
        } catch (const std::exception&) {
            throw NegotiationError("invalid TURN server port: " + *settings.turn_server);
        }
    }
    return rtc::IceServer(host, port, *settings.turn_username, *settings.turn_credential,
                          rtc::IceServer::RelayType::TurnUdp);
}

template <typename T>
std::string describe(const T& value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}

bool NegotiatorSettings::have_relay_credentials() const {
    return turn_server && turn_username && turn_credential &&
           !turn_server->empty() && !turn_username->empty() && !turn_credential->empty();
}

NegotiatorSettings NegotiatorSettings::from_config(const Config& config) {
    NegotiatorSettings settings;
    settings.stun_servers = config.stun_servers;
    settings.turn_server = config.turn_server;
    settings.turn_username = config.turn_username;
    settings.turn_credential = config.turn_credential;
    settings.gathering_timeout = std::chrono::milliseconds(config.ice_gathering_timeout_ms);
    settings.opus_payload_type = config.opus_payload_type;
    return settings;
}

void PeerSession::send_control(const std::string& message) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!control_ || !control_->isOpen()) {
        throw std::runtime_error("control channel is not open");
    }
    control_->send(message);
}

bool PeerSession::control_open() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return control_ && control_->isOpen();
}

bool PeerSession::transport_open() const {
    return track && track->isOpen();
}

void PeerSession::close() {
    if (inbound) {
        inbound->close();
    }
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (control_) {
            control_->close();
        }
    }
    if (peer) {
        peer->close();
    }
}

SessionNegotiator::SessionNegotiator(NegotiatorSettings settings)
    : settings_(std::move(settings)) {}

std::shared_ptr<rtc::PeerConnection> SessionNegotiator::make_peer_connection(TransportPolicy policy) const {
    rtc::Configuration config;
    for (const auto& url : settings_.stun_servers) {
        config.iceServers.emplace_back(url);
    }
    if (settings_.have_relay_credentials()) {
        config.iceServers.push_back(make_turn_server(settings_));
    }
    if (policy == TransportPolicy::RelayOnly) {
        config.iceTransportPolicy = rtc::TransportPolicy::Relay;
    }
    config.disableAutoNegotiation = true;
    return std::make_shared<rtc::PeerConnection>(config);
}

std::shared_ptr<SessionNegotiator::Gathering> SessionNegotiator::watch(
    const std::shared_ptr<PeerSession>& session,
    const PeerCallbacks& callbacks) const {
    auto gathering = std::make_shared<Gathering>();
    std::weak_ptr<Gathering> weak_gathering = gathering;
    const auto connection_id = session->connection_id;
    const auto leg = session->leg;

    session->peer->onGatheringStateChange(
        [weak_gathering](rtc::PeerConnection::GatheringState state) {
            if (state != rtc::PeerConnection::GatheringState::Complete) {
                return;
            }
            if (auto gathering = weak_gathering.lock()) {
                {
                    std::lock_guard<std::mutex> lock(gathering->mutex);
                    gathering->complete = true;
                }
                gathering->cv.notify_all();
            }
        });

    auto on_state = callbacks.on_state_change;
    session->peer->onStateChange(
        [connection_id, leg, on_state](rtc::PeerConnection::State state) {
            const auto name = describe(state);
            logging::info("Peer connection state changed",
                          {kv("connection_id", connection_id), kv("leg", leg), kv("state", name)});
            if (on_state) {
                on_state(name);
            }
        });
    return gathering;
}

void SessionNegotiator::add_audio_track(const std::shared_ptr<PeerSession>& session,
                                        const std::string& mid,
                                        int payload_type,
                                        const PeerCallbacks& callbacks) const {
    const auto ssrc = random_ssrc();
    const auto cname = "voice-bridge-" + session->leg;

    rtc::Description::Audio audio(mid, rtc::Description::Direction::SendRecv);
    audio.addOpusCodec(payload_type, std::string(kOpusProfile));
    audio.addSSRC(ssrc, cname, cname, cname + "-audio");

    session->track = session->peer->addTrack(audio);
    configure_opus_track(session->track, ssrc, cname, payload_type);
    session->inbound = attach_frame_queue(session->track, session->connection_id, session->leg);
    session->outbound = std::make_shared<TrackFrameSink>(session->track);

    auto on_open = callbacks.on_track_open;
    const auto connection_id = session->connection_id;
    const auto leg = session->leg;
    session->track->onOpen([on_open, connection_id, leg]() {
        logging::info("Audio track open", {kv("connection_id", connection_id), kv("leg", leg)});
        if (on_open) {
            on_open();
        }
    });
}

void SessionNegotiator::bind_control(const std::shared_ptr<PeerSession>& session,
                                     const std::shared_ptr<rtc::DataChannel>& channel,
                                     const PeerCallbacks& callbacks) {
    {
        std::lock_guard<std::mutex> lock(session->control_mutex_);
        session->control_ = channel;
    }
    auto on_open = callbacks.on_control_open;
    auto on_message = callbacks.on_control_message;
    const auto connection_id = session->connection_id;

    channel->onOpen([on_open, connection_id]() {
        logging::info("Control channel open", {kv("connection_id", connection_id)});
        if (on_open) {
            on_open();
        }
    });
    channel->onMessage([on_message](rtc::message_variant message) {
        if (!on_message) {
            return;
        }
        if (const auto* text = std::get_if<std::string>(&message)) {
            on_message(*text);
        } else if (const auto* data = std::get_if<rtc::binary>(&message)) {
            on_message(std::string(reinterpret_cast<const char*>(data->data()), data->size()));
        }
    });
}

void SessionNegotiator::finish_local_description(PeerSession& session, Gathering& gathering) const {
    {
        std::unique_lock<std::mutex> lock(gathering.mutex);
        session.gathering_complete = gathering.cv.wait_for(
            lock, settings_.gathering_timeout, [&gathering]() { return gathering.complete; });
    }
    const auto local = session.peer->localDescription();
    if (!local) {
        throw NegotiationError("local description was not generated");
    }
    session.local_description = std::string(*local);

    if (!session.gathering_complete) {
        logging::warn("ICE gathering timed out, continuing with partial candidates",
                      {kv("connection_id", session.connection_id),
                       kv("leg", session.leg),
                       kv("candidates", local->candidates().size()),
                       kv("timeout_ms", settings_.gathering_timeout.count())});
    }
}

std::shared_ptr<PeerSession> SessionNegotiator::answer(const std::string& connection_id,
                                                       const std::string& leg,
                                                       const std::string& remote_offer,
                                                       PeerCallbacks callbacks) {
    const auto plan = plan_answer(remote_offer, settings_.have_relay_credentials());

    auto session = std::make_shared<PeerSession>();
    session->connection_id = connection_id;
    session->leg = leg;
    session->policy = plan.policy;
    session->remote_description = remote_offer;
    session->peer = make_peer_connection(plan.policy);

    try {
        auto gathering = watch(session, callbacks);
        // The local track must exist before the offer is applied so the
        // answer reuses its mid instead of adding a second transceiver.
        add_audio_track(session, plan.audio_mid, plan.opus_payload_type, callbacks);
        if (plan.has_data_channel) {
            std::weak_ptr<PeerSession> weak_session = session;
            session->peer->onDataChannel(
                [weak_session, callbacks](std::shared_ptr<rtc::DataChannel> channel) {
                    if (auto session = weak_session.lock()) {
                        bind_control(session, channel, callbacks);
                    }
                });
        }
        session->peer->setRemoteDescription(rtc::Description(remote_offer, rtc::Description::Type::Offer));
        session->peer->setLocalDescription(rtc::Description::Type::Answer);
        finish_local_description(*session, *gathering);
        check_local_answer(session->local_description, plan);
    } catch (const NegotiationError&) {
        session->close();
        throw;
    } catch (const std::exception& ex) {
        session->close();
        throw NegotiationError(std::string("failed to answer offer: ") + ex.what());
    }

    logging::info("SDP answer generated",
                  {kv("connection_id", connection_id),
                   kv("leg", leg),
                   kv("policy", to_string(plan.policy)),
                   kv("mid", plan.audio_mid),
                   kv("payload_type", plan.opus_payload_type),
                   kv("dtls_role", plan.local_role)});
    return session;
}

std::shared_ptr<PeerSession> SessionNegotiator::create_offer(const std::string& connection_id,
                                                             const std::string& leg,
                                                             const std::string& control_label,
                                                             PeerCallbacks callbacks) {
    auto session = std::make_shared<PeerSession>();
    session->connection_id = connection_id;
    session->leg = leg;
    session->peer = make_peer_connection(TransportPolicy::All);

    try {
        auto gathering = watch(session, callbacks);
        add_audio_track(session, "0", settings_.opus_payload_type, callbacks);
        if (!control_label.empty()) {
            bind_control(session, session->peer->createDataChannel(control_label), callbacks);
        }
        session->peer->setLocalDescription(rtc::Description::Type::Offer);
        finish_local_description(*session, *gathering);
    } catch (const NegotiationError&) {
        session->close();
        throw;
    } catch (const std::exception& ex) {
        session->close();
        throw NegotiationError(std::string("failed to create offer: ") + ex.what());
    }

    logging::info("SDP offer created",
                  {kv("connection_id", connection_id),
                   kv("leg", leg),
                   kv("gathering_complete", session->gathering_complete)});
    return session;
}

void SessionNegotiator::apply_answer(PeerSession& session, const std::string& remote_answer) {
    check_answer(remote_answer);
    try {
        session.peer->setRemoteDescription(rtc::Description(remote_answer, rtc::Description::Type::Answer));
    } catch (const std::exception& ex) {
        throw NegotiationError(std::string("failed to apply answer: ") + ex.what());
    }
    session.remote_description = remote_answer;
    logging::info("SDP answer applied",
                  {kv("connection_id", session.connection_id), kv("leg", session.leg)});
}

}
