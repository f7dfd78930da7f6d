#include "voice_bridge/app.hpp"

#include <chrono>
#include <csignal>
#include <thread>

#include "voice_bridge/events/middleware.hpp"
#include "voice_bridge/logging.hpp"

namespace voice_bridge {

namespace {

std::atomic<bool> g_signalled{false};

void handle_signal(int) {
    g_signalled = true;
}

std::vector<events::Middleware> make_middlewares(const Config& config) {
    events::MiddlewareSettings settings;
    settings.dedup_window = std::chrono::milliseconds(config.event_dedup_window_ms);
    settings.rate_limit = config.event_rate_limit;
    settings.handler_timeout = std::chrono::milliseconds(config.event_handler_timeout_ms);
    if (config.event_middleware_profile == "production") {
        return events::production_middlewares(settings);
    }
    return events::default_middlewares(settings);
}

}

BridgeApp::BridgeApp(Config config)
    : config_(std::move(config)) {}

BridgeApp::~BridgeApp() {
    stop();
}

const Config& BridgeApp::config() const {
    return config_;
}

void BridgeApp::init() {
    bus_ = std::make_unique<events::EventBus>(make_middlewares(config_));
    lifecycle_ = std::make_unique<events::ConnectionLifecycle>(
        *bus_, scheduler_, std::chrono::milliseconds(config_.lifecycle_cleanup_delay_ms));
    negotiator_ = std::make_unique<webrtc::SessionNegotiator>(
        webrtc::NegotiatorSettings::from_config(config_));
    const auto connect_timeout = std::chrono::seconds(config_.model_connect_timeout_sec);
    if (config_.model_provider == "gemini") {
        sdp_client_ = std::make_unique<model::GeminiLiveClient>(
            config_.model_base_url, config_.model_name, config_.model_api_key, connect_timeout);
        connector_ = std::make_unique<model::RealtimeConnector>(
            *negotiator_, *sdp_client_, config_.opus_bitrate, webrtc::kLiveControlLabel);
        delegate_ = std::make_unique<model::GeminiDelegate>(
            config_.model_name, config_.model_voice, config_.model_instructions);
    } else {
        sdp_client_ = std::make_unique<model::RealtimeCallsClient>(
            config_.model_base_url, config_.model_name, config_.model_api_key, connect_timeout);
        connector_ = std::make_unique<model::RealtimeConnector>(
            *negotiator_, *sdp_client_, config_.opus_bitrate, webrtc::kRealtimeControlLabel);
        delegate_ = std::make_unique<model::RealtimeDelegate>(config_.model_voice, config_.model_instructions);
    }
    logging::info("Model backend selected",
                  {kv("provider", config_.model_provider), kv("model", config_.model_name)});
    if (config_.audio_cache_dir) {
        audio_cache_ = std::make_unique<media::FileAudioCache>(*config_.audio_cache_dir);
        logging::info("Audio cache enabled", {kv("dir", config_.audio_cache_dir->string())});
    }
    bridge_ = std::make_unique<call::BridgeService>(
        config_, *bus_, *lifecycle_, scheduler_, *negotiator_, *connector_, *delegate_, audio_cache_.get());

    if (config_.signaling_ws_url) {
        control_client_ = std::make_unique<signaling::ControlClient>(
            *config_.signaling_ws_url, config_.signaling_bridge_id, *bridge_);
        bridge_->set_notifier(control_client_.get());
        control_client_->start();
        logging::info("Signaling client started", {kv("url", control_client_->ws_url())});
    }

    rest_server_ = std::make_unique<RestServer>(config_, *bridge_, *lifecycle_);
    rest_server_->start();
}

void BridgeApp::run() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    while (!quitting_ && !g_signalled) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    logging::info("Shutting down");
    stop();
}

void BridgeApp::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    quitting_ = true;
    if (rest_server_) {
        rest_server_->stop();
    }
    if (bridge_) {
        bridge_->set_notifier(nullptr);
    }
    if (control_client_) {
        control_client_->stop();
    }
    if (bridge_) {
        bridge_->shutdown();
    }
    if (lifecycle_) {
        lifecycle_->close();
    }
    if (bus_) {
        bus_->close();
    }
    scheduler_.stop();
}

}
