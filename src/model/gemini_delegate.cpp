#include "voice_bridge/model/gemini_delegate.hpp"

#include "voice_bridge/logging.hpp"
#include "voice_bridge/model/sdp_client.hpp"

namespace voice_bridge::model {

namespace live_messages {

nlohmann::json setup(const std::string& model,
                     const std::optional<std::string>& voice,
                     const std::optional<std::string>& instructions) {
    nlohmann::json generation{{"responseModalities", nlohmann::json::array({"audio"})}};
    if (voice) {
        generation["speechConfig"] = {
            {"voiceConfig", {{"prebuiltVoiceConfig", {{"voiceName", *voice}}}}},
        };
    }
    nlohmann::json body{{"model", gemini_model_path(model)}, {"generationConfig", generation}};
    if (instructions) {
        body["systemInstruction"] = {
            {"role", "system"},
            {"parts", nlohmann::json::array({{{"text", *instructions}}})},
        };
    }
    return {{"setup", body}};
}

nlohmann::json user_turn(const std::string& text) {
    return {
        {"clientContent", {
            {"turns", nlohmann::json::array({{
                {"role", "user"},
                {"parts", nlohmann::json::array({{{"text", text}}})},
            }})},
            {"turnComplete", true},
        }},
    };
}

nlohmann::json tool_response(const call::ToolCall& call, const std::string& output) {
    auto response = nlohmann::json::parse(output, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        response = {{"result", output}};
    }
    return {
        {"toolResponse", {
            {"functionResponses", nlohmann::json::array({{
                {"id", call.call_id},
                {"name", call.name},
                {"response", response},
            }})},
        }},
    };
}

}

namespace {

std::string arguments_text(const nlohmann::json& entry) {
    const auto args = entry.find("args");
    if (args == entry.end() || args->is_null()) {
        return "{}";
    }
    if (args->is_string()) {
        return args->get<std::string>();
    }
    return args->dump();
}

std::string string_field(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string();
}

bool flag(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

}

GeminiDelegate::GeminiDelegate(std::string model,
                               std::optional<std::string> voice,
                               std::optional<std::string> instructions,
                               std::string greeting_prompt)
    : model_(std::move(model)),
      voice_(std::move(voice)),
      instructions_(std::move(instructions)),
      greeting_prompt_(std::move(greeting_prompt)) {}

// The setup message is mandatory here; the backend ignores client content
// until it arrives.
void GeminiDelegate::configure_session(ModelSession& session, const std::string& connection_id) {
    session.send_control_message(live_messages::setup(model_, voice_, instructions_));
    logging::debug("Model session configured",
                   {kv("connection_id", connection_id), kv("model", gemini_model_path(model_))});
}

void GeminiDelegate::send_greeting(ModelSession& session, const std::string& connection_id) {
    session.send_control_message(live_messages::user_turn(greeting_prompt_));
    logging::info("Greeting requested", {kv("connection_id", connection_id)});
}

void GeminiDelegate::send_inactivity_prompt(ModelSession& session,
                                            const std::string& connection_id,
                                            const std::string& message) {
    if (message.empty()) {
        return;
    }
    session.send_control_message(live_messages::user_turn(message));
    logging::info("Inactivity prompt sent", {kv("connection_id", connection_id)});
}

void GeminiDelegate::send_farewell(ModelSession& session,
                                   const std::string& connection_id,
                                   call::ExitReason reason) {
    const std::string text = call::farewell_message(reason);
    session.send_control_message(live_messages::user_turn("Say exactly: " + text));
    logging::info("Farewell sent",
                  {kv("connection_id", connection_id), kv("reason", call::to_string(reason))});
}

void GeminiDelegate::send_tool_result(ModelSession& session,
                                      const call::ToolCall& call,
                                      const std::string& output) {
    session.send_control_message(live_messages::tool_response(call, output));
}

call::ModelSignal GeminiDelegate::classify(const nlohmann::json& message,
                                           std::vector<call::ToolCall>& tool_calls) const {
    if (!message.is_object()) {
        return call::ModelSignal::None;
    }

    const auto tool_call = message.find("toolCall");
    if (tool_call != message.end() && tool_call->is_object()) {
        const auto calls = tool_call->find("functionCalls");
        if (calls != tool_call->end() && calls->is_array()) {
            for (const auto& entry : *calls) {
                if (!entry.is_object()) {
                    continue;
                }
                call::ToolCall parsed;
                parsed.call_id = string_field(entry, "id");
                parsed.name = string_field(entry, "name");
                parsed.arguments = arguments_text(entry);
                if (parsed.call_id.empty()) {
                    continue;
                }
                tool_calls.push_back(std::move(parsed));
            }
        }
        return tool_calls.empty() ? call::ModelSignal::None : call::ModelSignal::ToolCallRequested;
    }

    const auto content = message.find("serverContent");
    if (content == message.end() || !content->is_object()) {
        return call::ModelSignal::None;
    }
    if (flag(*content, "interrupted")) {
        return call::ModelSignal::UserSpeechStarted;
    }
    if (flag(*content, "turnComplete") || flag(*content, "generationComplete")) {
        return call::ModelSignal::AiSpeechStopped;
    }
    if (content->contains("modelTurn")) {
        return call::ModelSignal::AiSpeechStarted;
    }
    return call::ModelSignal::None;
}

}
