#include "voice_bridge/app.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"

#include <rtc/rtc.hpp>

int main() {
    try {
        const auto config = voice_bridge::Config::load();
        config.validate();
        voice_bridge::logging::init(config);
        rtc::InitLogger(rtc::LogLevel::Warning);
        voice_bridge::info(
            "Starting voice-bridge",
            {voice_bridge::kv("model_provider", config.model_provider),
             voice_bridge::kv("model_base_url", config.model_base_url),
             voice_bridge::kv("model", config.model_name),
             voice_bridge::kv("rest_port", config.rest_api_port),
             voice_bridge::kv("relay_configured", config.turn_server.has_value()),
             voice_bridge::kv("middleware_profile", config.event_middleware_profile)});
        voice_bridge::BridgeApp app(config);
        app.init();
        app.run();
    } catch (const std::exception& ex) {
        voice_bridge::error(
            "Startup failed",
            {voice_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
