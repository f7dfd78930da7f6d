#include "voice_bridge/config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voice_bridge {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Values already present in the environment win over the .env file.
void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = strip_quotes(trim(line.substr(eq_pos + 1)));
        if (key.empty()) {
            continue;
        }
        setenv(key.c_str(), value.c_str(), 0);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.stun_servers = split_csv(get_env_str(
        "STUN_SERVERS", "stun:stun.l.google.com:19302,stun:stun1.l.google.com:19302"));
    config.turn_server = get_env_optional("TURN_SERVER");
    config.turn_username = get_env_optional("TURN_USERNAME");
    config.turn_credential = get_env_optional("TURN_CREDENTIAL");
    config.ice_gathering_timeout_ms = get_env_int("ICE_GATHERING_TIMEOUT_MS", 5000);

    config.opus_bitrate = get_env_int("OPUS_BITRATE", 32000);
    config.opus_payload_type = get_env_int("OPUS_PAYLOAD_TYPE", 111);
    config.dtx_forward_interval = get_env_int("DTX_FORWARD_INTERVAL", 4);
    config.duplicate_frame_limit = get_env_int("DUPLICATE_FRAME_LIMIT", 3);
    if (const auto bgm = get_env_optional("BGM_PATH")) {
        config.bgm_path = std::filesystem::path(*bgm);
    }
    config.bgm_silence_threshold_ms = get_env_int("BGM_SILENCE_THRESHOLD_MS", 1000);

    config.max_call_duration_sec = get_env_int("MAX_CALL_DURATION_SEC", 300);
    config.silence_timeout_sec = get_env_int("SILENCE_TIMEOUT_SEC", 20);
    config.silence_max_retries = get_env_int("SILENCE_MAX_RETRIES", 5);
    config.silence_prompt_message =
        get_env_str("SILENCE_PROMPT_MESSAGE", config.silence_prompt_message);
    config.exit_grace_ms = get_env_int("EXIT_GRACE_MS", 5000);
    config.lifecycle_cleanup_delay_ms = get_env_int("LIFECYCLE_CLEANUP_DELAY_MS", 5000);
    config.greeting_gate_timeout_ms = get_env_int("GREETING_GATE_TIMEOUT_MS", 5000);
    config.interruption_window_ms = get_env_int("INTERRUPTION_WINDOW_MS", 3000);

    config.event_rate_limit = get_env_int("EVENT_RATE_LIMIT", 100);
    config.event_dedup_window_ms = get_env_int("EVENT_DEDUP_WINDOW_MS", 5000);
    config.event_handler_timeout_ms = get_env_int("EVENT_HANDLER_TIMEOUT_MS", 30000);
    config.event_middleware_profile = get_env_str("EVENT_MIDDLEWARE_PROFILE", "default");

    config.model_provider = get_env_str("MODEL_PROVIDER", "openai");
    const bool gemini = config.model_provider == "gemini";
    config.model_base_url = get_env_str(
        "MODEL_BASE_URL", gemini ? "https://generativelanguage.googleapis.com" : "https://api.openai.com");
    config.model_name = get_env_str("MODEL_NAME", gemini ? "models/gemini-3-flash" : "gpt-realtime");
    config.model_api_key = get_env_required("MODEL_API_KEY");
    config.model_connect_timeout_sec = get_env_int("MODEL_CONNECT_TIMEOUT_SEC", 30);
    config.model_voice = get_env_optional("MODEL_VOICE");
    config.model_instructions = get_env_optional("MODEL_INSTRUCTIONS");

    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.signaling_ws_url = get_env_optional("SIGNALING_WS_URL");
    config.signaling_bridge_id = get_env_str("SIGNALING_BRIDGE_ID", "voice-bridge");
    if (const auto cache_dir = get_env_optional("AUDIO_CACHE_DIR")) {
        config.audio_cache_dir = std::filesystem::path(*cache_dir);
    }

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }

    return config;
}

void Config::validate() const {
    if (model_api_key.empty()) {
        throw std::runtime_error("MODEL_API_KEY is required");
    }
    if (model_provider != "openai" && model_provider != "gemini") {
        throw std::runtime_error("MODEL_PROVIDER must be openai or gemini");
    }
    if (model_base_url.empty()) {
        throw std::runtime_error("MODEL_BASE_URL is required");
    }
    if (turn_server && (!turn_username || !turn_credential)) {
        throw std::runtime_error("TURN_SERVER requires TURN_USERNAME and TURN_CREDENTIAL");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (opus_bitrate <= 0) {
        throw std::runtime_error("OPUS_BITRATE must be positive");
    }
    if (opus_payload_type < 96 || opus_payload_type > 127) {
        throw std::runtime_error("OPUS_PAYLOAD_TYPE must be a dynamic payload type (96-127)");
    }
    if (dtx_forward_interval <= 0) {
        throw std::runtime_error("DTX_FORWARD_INTERVAL must be positive");
    }
    if (duplicate_frame_limit <= 0) {
        throw std::runtime_error("DUPLICATE_FRAME_LIMIT must be positive");
    }
    if (silence_timeout_sec <= 0) {
        throw std::runtime_error("SILENCE_TIMEOUT_SEC must be positive");
    }
    if (silence_max_retries < 0) {
        throw std::runtime_error("SILENCE_MAX_RETRIES must be zero or positive");
    }
    if (event_rate_limit <= 0) {
        throw std::runtime_error("EVENT_RATE_LIMIT must be positive");
    }
    if (event_middleware_profile != "default" && event_middleware_profile != "production") {
        throw std::runtime_error("EVENT_MIDDLEWARE_PROFILE must be default or production");
    }
}

}
