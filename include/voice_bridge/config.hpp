#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace voice_bridge {

struct Config {
    std::vector<std::string> stun_servers;
    std::optional<std::string> turn_server;
    std::optional<std::string> turn_username;
    std::optional<std::string> turn_credential;
    int ice_gathering_timeout_ms = 5000;

    int opus_bitrate = 32000;
    int opus_payload_type = 111;
    int dtx_forward_interval = 4;
    int duplicate_frame_limit = 3;
    std::optional<std::filesystem::path> bgm_path;
    int bgm_silence_threshold_ms = 1000;

    int max_call_duration_sec = 300;
    int silence_timeout_sec = 20;
    int silence_max_retries = 5;
    std::string silence_prompt_message =
        "The user has been quiet for a while. Briefly check whether they are still there.";
    int exit_grace_ms = 5000;
    int lifecycle_cleanup_delay_ms = 5000;
    int greeting_gate_timeout_ms = 5000;
    int interruption_window_ms = 3000;

    int event_rate_limit = 100;
    int event_dedup_window_ms = 5000;
    int event_handler_timeout_ms = 30000;
    std::string event_middleware_profile = "default";

    // "openai" speaks the realtime calls API, "gemini" the Live API.
    std::string model_provider = "openai";
    std::string model_base_url = "https://api.openai.com";
    std::string model_name = "gpt-realtime";
    std::string model_api_key;
    int model_connect_timeout_sec = 30;
    std::optional<std::string> model_voice;
    std::optional<std::string> model_instructions;

    int rest_api_port = 8000;
    std::optional<std::string> authorization_token;
    std::optional<std::string> signaling_ws_url;
    std::string signaling_bridge_id = "voice-bridge";
    std::optional<std::filesystem::path> audio_cache_dir;

    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;

    static Config load();
    void validate() const;
};

}
