#include "voice_bridge/call/bridge_service.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <thread>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge::call {

using events::EventType;

namespace {

constexpr const char* kSource = "bridge";

std::string generate_connection_id() {
    static std::mutex mutex;
    static std::mt19937_64 generator{std::random_device{}()};
    uint64_t value = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        value = generator();
    }
    std::ostringstream oss;
    oss << "conn-" << std::hex << std::setw(16) << std::setfill('0') << value;
    return oss.str();
}

media::BridgeSettings bridge_settings(const Config& config) {
    media::BridgeSettings settings;
    settings.dtx_interval = config.dtx_forward_interval;
    settings.duplicate_limit = config.duplicate_frame_limit;
    settings.cue_idle_threshold = std::chrono::milliseconds(config.bgm_silence_threshold_ms);
    return settings;
}

TimerSettings timer_settings(const Config& config) {
    TimerSettings settings;
    settings.max_duration = std::chrono::seconds(config.max_call_duration_sec);
    settings.silence_window = std::chrono::seconds(config.silence_timeout_sec);
    settings.max_retries = config.silence_max_retries;
    return settings;
}

}

std::vector<std::string> required_dependencies(CallDirection direction) {
    std::vector<std::string> dependencies{
        events::deps::kTransportSdpReady,
        events::deps::kTransportAudioReady,
        events::deps::kModelConnectionReady,
        events::deps::kModelAudioReady,
        events::deps::kModelControlChannelReady,
    };
    if (direction == CallDirection::Outbound) {
        dependencies.emplace_back(events::deps::kRemoteCallAccepted);
    }
    return dependencies;
}

BridgeService::BridgeService(const Config& config,
                             events::EventBus& bus,
                             events::ConnectionLifecycle& lifecycle,
                             utils::TimerService& timers,
                             webrtc::SessionNegotiator& negotiator,
                             ModelConnector& models,
                             CallBridgeDelegate& delegate,
                             media::AudioCache* cache)
    : config_(config),
      bus_(bus),
      lifecycle_(lifecycle),
      timers_(timers),
      negotiator_(negotiator),
      models_(models),
      delegate_(delegate),
      cache_(cache),
      codec_bridge_(bridge_settings(config), codec_states_, timers, cache),
      call_timers_(timers, *this, &tool_calls_, timer_settings(config)) {
    if (config_.bgm_path) {
        try {
            cue_clip_ = media::load_cue_frames(*config_.bgm_path, config_.opus_bitrate);
            logging::info("Background audio loaded",
                          {kv("path", config_.bgm_path->string()), kv("frames", cue_clip_->size())});
        } catch (const std::exception& ex) {
            logging::warn("Background audio disabled",
                          {kv("path", config_.bgm_path->string()), kv("error", ex.what())});
        }
    }
    subscriptions_.push_back(bus_.subscribe(EventType::ConnectionReady,
                                            [this](const events::Event& event) { on_ready(event); }));
}

BridgeService::~BridgeService() {
    shutdown();
    for (const auto id : subscriptions_) {
        bus_.unsubscribe(id);
    }
}

void BridgeService::set_notifier(CallNotifier* notifier) {
    notifier_ = notifier;
}

void BridgeService::publish(EventType type, const std::string& connection_id, nlohmann::json data) {
    bus_.publish(events::make_event(type, connection_id, kSource, std::move(data)));
}

void BridgeService::update_metrics() {
    Metrics::instance().set_active_connections(static_cast<int64_t>(registry_.size()));
}

std::shared_ptr<Connection> BridgeService::open_connection(const CallRequest& request,
                                                           CallDirection direction) {
    if (shutting_down_) {
        throw std::runtime_error("bridge is shutting down");
    }
    auto connection = std::make_shared<Connection>();
    connection->id = request.connection_id.empty() ? generate_connection_id() : request.connection_id;
    connection->tenant_id = request.tenant_id;
    connection->agent_id = request.agent_id;
    connection->call_id = request.call_id.empty() ? connection->id : request.call_id;
    connection->direction = direction;
    connection->activity = std::make_shared<media::ActivityTracker>(timers_.now());
    connection->playback = std::make_shared<media::ActivityTracker>(timers_.now());
    connection->gate = std::make_unique<GreetingGate>(
        timers_.now(),
        std::chrono::milliseconds(config_.greeting_gate_timeout_ms),
        std::chrono::milliseconds(config_.interruption_window_ms));

    lifecycle_.register_connection(connection->id, connection->call_id, connection->tenant_id,
                                   required_dependencies(direction));
    try {
        registry_.add(connection);
    } catch (const std::exception&) {
        lifecycle_.terminate_connection(connection->id);
        throw;
    }
    update_metrics();
    logging::info("Call registered",
                  {kv("connection_id", connection->id),
                   kv("direction", to_string(direction)),
                   kv("tenant_id", connection->tenant_id),
                   kv("agent_id", connection->agent_id)});
    return connection;
}

void BridgeService::discard_connection(const std::shared_ptr<Connection>& connection) {
    connection->terminating = true;
    connection->closed = true;
    registry_.remove(connection->id);
    try {
        lifecycle_.terminate_connection(connection->id);
    } catch (const events::ConnectionNotFound&) {
        logging::debug("Discarded call already removed", {kv("connection_id", connection->id)});
    }
    update_metrics();
}

webrtc::PeerCallbacks BridgeService::telephony_callbacks(const std::string& connection_id) {
    webrtc::PeerCallbacks callbacks;
    callbacks.on_track_open = [this, connection_id]() {
        publish(EventType::AudioTrackReady, connection_id, {{"track_type", "telephony"}});
    };
    callbacks.on_state_change = [this, connection_id](const std::string& state) {
        publish(EventType::IceConnectionChanged, connection_id, {{"state", state}, {"leg", "telephony"}});
        if (state == "failed" || state == "closed") {
            spawn([this, connection_id]() { terminate(connection_id, ExitReason::Default); },
                  "telephony-closed");
        }
    };
    return callbacks;
}

CallSetup BridgeService::start_inbound(const CallRequest& request) {
    if (request.sdp.empty()) {
        throw webrtc::NegotiationError("inbound call requires an SDP offer");
    }
    auto connection = open_connection(request, CallDirection::Inbound);
    const auto id = connection->id;
    publish(EventType::SdpOfferReceived, id, {{"sdp", request.sdp}});

    std::shared_ptr<webrtc::PeerSession> peer;
    try {
        peer = negotiator_.answer(id, "telephony", request.sdp, telephony_callbacks(id));
    } catch (const std::exception& ex) {
        logging::error("Inbound negotiation failed", {kv("connection_id", id), kv("error", ex.what())});
        discard_connection(connection);
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        connection->telephony = peer;
    }
    publish(EventType::SdpAnswerGenerated, id, {{"sdp", peer->local_description}});
    call_timers_.start(id, connection->activity);
    spawn([this, connection]() { connect_model(connection); }, "model-connect");
    return {id, peer->local_description};
}

CallSetup BridgeService::start_outbound(const CallRequest& request) {
    auto connection = open_connection(request, CallDirection::Outbound);
    const auto id = connection->id;
    publish(EventType::RemoteCallStarted, id, {{"call_id", connection->call_id}});

    std::shared_ptr<webrtc::PeerSession> peer;
    try {
        peer = negotiator_.create_offer(id, "telephony", "", telephony_callbacks(id));
    } catch (const std::exception& ex) {
        logging::error("Outbound offer failed", {kv("connection_id", id), kv("error", ex.what())});
        discard_connection(connection);
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        connection->telephony = peer;
    }
    spawn([this, connection]() { connect_model(connection); }, "model-connect");
    return {id, peer->local_description};
}

void BridgeService::apply_answer(const std::string& connection_id, const std::string& sdp) {
    auto connection = registry_.find(connection_id);
    if (!connection || connection->terminating) {
        throw events::ConnectionNotFound(connection_id);
    }
    if (connection->direction != CallDirection::Outbound) {
        throw webrtc::NegotiationError("call " + connection_id + " does not expect an answer");
    }
    std::shared_ptr<webrtc::PeerSession> peer;
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        peer = connection->telephony;
    }
    if (!peer) {
        throw webrtc::NegotiationError("call " + connection_id + " has no pending offer");
    }
    negotiator_.apply_answer(*peer, sdp);
    publish(EventType::SdpAnswerGenerated, connection_id, {{"sdp", sdp}, {"origin", "remote"}});
    publish(EventType::RemoteCallAccepted, connection_id, {{"call_id", connection->call_id}});
    call_timers_.start(connection_id, connection->activity);
}

void BridgeService::connect_model(const std::shared_ptr<Connection>& connection) {
    const auto id = connection->id;
    ModelLegHooks hooks;
    hooks.on_audio_open = [this, id]() {
        publish(EventType::ModelAudioReady, id, {{"track_type", "model"}});
    };
    hooks.on_control_open = [this, id]() {
        publish(EventType::ModelControlChannelReady, id);
    };
    hooks.on_control_message = [this, id](const std::string& raw) {
        handle_model_message(id, raw);
    };

    ModelLeg leg;
    try {
        leg = models_.connect(id, std::move(hooks));
    } catch (const std::exception& ex) {
        logging::error("Model connection failed", {kv("connection_id", id), kv("error", ex.what())});
        terminate(id, ExitReason::Default);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        if (connection->terminating) {
            leg.session->close();
            return;
        }
        connection->model = leg;
    }
    publish(EventType::ModelConnectionInitialized, id);
    bridge_media(connection);
}

void BridgeService::bridge_media(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(connection->mutex);
    if (connection->bridged || connection->terminating || !connection->telephony ||
        !connection->model.session || !connection->model.audio) {
        return;
    }
    connection->bridged = true;

    const auto id = connection->id;
    const auto telephony = connection->telephony;
    const auto leg = connection->model;
    std::weak_ptr<Connection> weak = connection;

    media::StreamContext base;
    base.connection_id = id;
    base.activity = connection->activity;
    base.playback = connection->playback;
    base.closed = [weak]() {
        auto c = weak.lock();
        return !c || c->closed.load();
    };
    base.tool_call_in_flight = [this, id]() { return tool_calls_.is_call_in_flight(id); };

    auto to_model = base;
    to_model.suppress_inbound = [this, weak]() {
        auto c = weak.lock();
        return c && c->gate->suppress(timers_.now());
    };
    to_model.on_first_frame = [this, id]() {
        publish(EventType::RemoteAudioReady, id, {{"track_type", "telephony"}});
    };

    auto to_telephony = base;
    to_telephony.on_first_frame = [this, weak]() {
        if (auto c = weak.lock()) {
            c->gate->greeting_audio_started(timers_.now());
        }
    };

    connection->workers.emplace_back([this, to_model, telephony, leg]() {
        try {
            codec_bridge_.forward_to_model(to_model, *telephony->inbound, *leg.session);
        } catch (const std::exception& ex) {
            logging::error("Forwarding task failed",
                           {kv("connection_id", to_model.connection_id), kv("error", ex.what())});
        }
    });
    connection->workers.emplace_back([this, to_telephony, telephony, leg]() {
        try {
            codec_bridge_.forward_to_telephony(to_telephony, *leg.audio, *telephony->outbound);
        } catch (const std::exception& ex) {
            logging::error("Forwarding task failed",
                           {kv("connection_id", to_telephony.connection_id), kv("error", ex.what())});
        }
    });
    if (cue_clip_) {
        connection->injector = std::make_unique<media::BackgroundInjector>(
            cue_clip_, std::chrono::milliseconds(config_.bgm_silence_threshold_ms), timers_);
        auto* injector = connection->injector.get();
        connection->workers.emplace_back([injector, to_telephony, telephony]() {
            injector->run(to_telephony, *telephony->outbound);
        });
    }
    logging::info("Media bridged",
                  {kv("connection_id", id), kv("background_audio", cue_clip_ != nullptr)});
}

void BridgeService::on_ready(const events::Event& event) {
    const auto& id = event.connection_id;
    auto connection = registry_.find(id);
    if (!connection || connection->terminating) {
        return;
    }
    std::shared_ptr<model::ModelSession> session;
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        session = connection->model.session;
    }
    if (!session) {
        logging::warn("Call ready without model session", {kv("connection_id", id)});
        return;
    }
    try {
        delegate_.configure_session(*session, id);
        delegate_.send_greeting(*session, id);
    } catch (const std::exception& ex) {
        logging::warn("Failed to send greeting", {kv("connection_id", id), kv("error", ex.what())});
        return;
    }
    connection->gate->greeting_sent(timers_.now());
    publish(EventType::ModelGreetingSent, id);
}

void BridgeService::handle_model_message(const std::string& connection_id, const std::string& raw) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::exception& ex) {
        logging::warn("Invalid model control message",
                      {kv("connection_id", connection_id), kv("error", ex.what())});
        return;
    }

    std::vector<ToolCall> tool_calls;
    const auto signal = delegate_.classify(message, tool_calls);
    switch (signal) {
        case ModelSignal::AiSpeechStarted:
            call_timers_.pause_silence_timer(connection_id);
            break;
        case ModelSignal::AiSpeechStopped:
            call_timers_.start_silence_timer(connection_id);
            break;
        case ModelSignal::UserSpeechStarted:
            call_timers_.reset_silence_timer(connection_id);
            break;
        case ModelSignal::ToolCallRequested:
            for (const auto& tool_call : tool_calls) {
                start_tool_call(connection_id, tool_call);
            }
            return;
        case ModelSignal::None:
            logging::debug("Model control message",
                           {kv("connection_id", connection_id),
                            kv("type", message.is_object() ? message.value("type", "") : "")});
            return;
    }
    logging::debug("Model signal", {kv("connection_id", connection_id), kv("signal", to_string(signal))});
}

void BridgeService::start_tool_call(const std::string& connection_id, const ToolCall& tool_call) {
    auto connection = registry_.find(connection_id);
    if (!connection || connection->terminating) {
        return;
    }
    auto* notifier = notifier_.load();
    if (!notifier) {
        logging::warn("Tool call dropped, no signaling connection",
                      {kv("connection_id", connection_id), kv("tool", tool_call.name)});
        std::shared_ptr<model::ModelSession> session;
        {
            std::lock_guard<std::mutex> lock(connection->mutex);
            session = connection->model.session;
        }
        if (session) {
            try {
                delegate_.send_tool_result(*session, tool_call,
                                           R"({"error":"tool execution unavailable"})");
            } catch (const std::exception& ex) {
                logging::warn("Failed to report tool failure",
                              {kv("connection_id", connection_id), kv("error", ex.what())});
            }
        }
        return;
    }
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        connection->tool_calls.insert_or_assign(tool_call.call_id,
                                                PendingToolCall{tool_call, tool_calls_.begin(connection_id)});
    }
    logging::info("Tool call started",
                  {kv("connection_id", connection_id),
                   kv("call_id", tool_call.call_id),
                   kv("tool", tool_call.name)});
    notifier->send_tool_call(connection_id, tool_call);
}

void BridgeService::submit_tool_result(const std::string& connection_id,
                                       const std::string& call_id,
                                       const std::string& output) {
    auto connection = registry_.find(connection_id);
    if (!connection || connection->terminating) {
        throw events::ConnectionNotFound(connection_id);
    }
    PendingToolCall pending;
    pending.call.call_id = call_id;
    std::shared_ptr<model::ModelSession> session;
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        const auto it = connection->tool_calls.find(call_id);
        if (it != connection->tool_calls.end()) {
            pending = std::move(it->second);
            connection->tool_calls.erase(it);
        }
        session = connection->model.session;
    }
    if (!session) {
        throw model::ModelSessionError("model session is not connected");
    }
    delegate_.send_tool_result(*session, pending.call, output);
    logging::info("Tool call completed", {kv("connection_id", connection_id), kv("call_id", call_id)});
}

bool BridgeService::terminate(const std::string& connection_id, ExitReason reason, bool with_grace) {
    auto connection = registry_.find(connection_id);
    if (!connection) {
        logging::debug("Terminate for unknown call", {kv("connection_id", connection_id)});
        return false;
    }
    if (connection->terminating.exchange(true)) {
        return false;
    }
    logging::info("Terminating call",
                  {kv("connection_id", connection_id), kv("reason", to_string(reason))});
    try {
        lifecycle_.update_phase(connection_id, events::Phase::Terminating);
    } catch (const events::ConnectionNotFound&) {
        logging::debug("Lifecycle entry already removed", {kv("connection_id", connection_id)});
    }
    call_timers_.stop(connection_id);
    bus_.cancel_waits(connection_id);

    std::shared_ptr<model::ModelSession> session;
    std::shared_ptr<webrtc::PeerSession> telephony;
    media::BackgroundInjector* injector = nullptr;
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        session = connection->model.session;
        telephony = connection->telephony;
        injector = connection->injector.get();
    }
    if (injector) {
        injector->stop();
    }

    if (session && session->is_connected()) {
        try {
            delegate_.send_farewell(*session, connection_id, reason);
            if (with_grace) {
                std::this_thread::sleep_for(std::chrono::milliseconds(config_.exit_grace_ms));
            }
        } catch (const std::exception& ex) {
            logging::warn("Farewell failed", {kv("connection_id", connection_id), kv("error", ex.what())});
        }
    }

    connection->closed = true;
    if (session) {
        session->close();
    }
    if (telephony) {
        telephony->close();
    }

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        workers.swap(connection->workers);
        connection->tool_calls.clear();
    }
    for (auto& worker : workers) {
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else if (worker.joinable()) {
            worker.join();
        }
    }

    if (cache_) {
        try {
            cache_->cleanup(connection_id);
        } catch (const std::exception& ex) {
            logging::warn("Audio cache cleanup failed",
                          {kv("connection_id", connection_id), kv("error", ex.what())});
        }
    }
    codec_states_.remove_connection(connection_id);
    registry_.remove(connection_id);
    try {
        lifecycle_.terminate_connection(connection_id);
    } catch (const events::ConnectionNotFound&) {
        logging::debug("Lifecycle entry already removed", {kv("connection_id", connection_id)});
    }
    update_metrics();

    if (auto* notifier = notifier_.load()) {
        try {
            notifier->send_call_ended(connection_id, reason);
        } catch (const std::exception& ex) {
            logging::warn("Failed to report call end",
                          {kv("connection_id", connection_id), kv("error", ex.what())});
        }
    }
    logging::info("Call terminated", {kv("connection_id", connection_id), kv("reason", to_string(reason))});
    return true;
}

std::shared_ptr<Connection> BridgeService::find(const std::string& connection_id) const {
    return registry_.find(connection_id);
}

size_t BridgeService::active_connections() const {
    return registry_.size();
}

void BridgeService::shutdown() {
    shutting_down_ = true;
    for (const auto& connection : registry_.all()) {
        terminate(connection->id, ExitReason::Default);
    }
    tasks_.close_and_wait();
}

void BridgeService::spawn(std::function<void()> task, const char* name) {
    if (shutting_down_ || !tasks_.spawn(std::move(task), name)) {
        logging::debug("Task skipped during shutdown", {kv("task", name)});
    }
}

void BridgeService::on_inactivity_prompt(const std::string& connection_id, int retry, int max_retries) {
    auto connection = registry_.find(connection_id);
    if (!connection || connection->terminating) {
        return;
    }
    std::shared_ptr<model::ModelSession> session;
    {
        std::lock_guard<std::mutex> lock(connection->mutex);
        session = connection->model.session;
    }
    if (!session) {
        return;
    }
    try {
        delegate_.send_inactivity_prompt(*session, connection_id, config_.silence_prompt_message);
    } catch (const std::exception& ex) {
        logging::warn("Failed to send inactivity prompt",
                      {kv("connection_id", connection_id),
                       kv("retry", retry),
                       kv("max_retries", max_retries),
                       kv("error", ex.what())});
    }
}

void BridgeService::on_termination_requested(const std::string& connection_id, ExitReason reason) {
    spawn([this, connection_id, reason]() { terminate(connection_id, reason, true); }, "call-terminate");
}

}
