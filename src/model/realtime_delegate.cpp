#include "voice_bridge/model/realtime_delegate.hpp"

#include "voice_bridge/logging.hpp"

namespace voice_bridge::model {

namespace messages {

nlohmann::json response_create(const std::optional<std::string>& instructions) {
    nlohmann::json message{{"type", "response.create"}};
    if (instructions) {
        message["response"] = {{"instructions", *instructions}};
    }
    return message;
}

nlohmann::json text_item(const std::string& role, const std::string& text) {
    const auto content_type = role == "assistant" ? "output_text" : "input_text";
    return {
        {"type", "conversation.item.create"},
        {"item", {
            {"type", "message"},
            {"role", role},
            {"content", nlohmann::json::array({{{"type", content_type}, {"text", text}}})},
        }},
    };
}

nlohmann::json function_call_output(const std::string& call_id, const std::string& output) {
    return {
        {"type", "conversation.item.create"},
        {"item", {
            {"type", "function_call_output"},
            {"call_id", call_id},
            {"output", output},
        }},
    };
}

nlohmann::json session_update(const std::optional<std::string>& voice,
                              const std::optional<std::string>& instructions) {
    nlohmann::json session{{"type", "realtime"}};
    if (instructions) {
        session["instructions"] = *instructions;
    }
    if (voice) {
        session["audio"] = {{"output", {{"voice", *voice}}}};
    }
    return {{"type", "session.update"}, {"session", session}};
}

}

RealtimeDelegate::RealtimeDelegate(std::optional<std::string> voice,
                                   std::optional<std::string> instructions)
    : voice_(std::move(voice)),
      instructions_(std::move(instructions)) {}

void RealtimeDelegate::configure_session(ModelSession& session, const std::string& connection_id) {
    if (!voice_ && !instructions_) {
        return;
    }
    session.send_control_message(messages::session_update(voice_, instructions_));
    logging::debug("Model session configured", {kv("connection_id", connection_id)});
}

void RealtimeDelegate::send_greeting(ModelSession& session, const std::string& connection_id) {
    session.send_control_message(messages::response_create());
    logging::info("Greeting requested", {kv("connection_id", connection_id)});
}

void RealtimeDelegate::send_inactivity_prompt(ModelSession& session,
                                              const std::string& connection_id,
                                              const std::string& message) {
    session.send_control_message(messages::text_item("system", message));
    session.send_control_message(messages::response_create());
    logging::info("Inactivity prompt sent", {kv("connection_id", connection_id)});
}

void RealtimeDelegate::send_farewell(ModelSession& session,
                                     const std::string& connection_id,
                                     call::ExitReason reason) {
    const std::string text = call::farewell_message(reason);
    session.send_control_message(messages::text_item("assistant", text));
    session.send_control_message(messages::response_create("Say exactly: " + text));
    logging::info("Farewell sent",
                  {kv("connection_id", connection_id), kv("reason", call::to_string(reason))});
}

void RealtimeDelegate::send_tool_result(ModelSession& session,
                                        const call::ToolCall& call,
                                        const std::string& output) {
    session.send_control_message(messages::function_call_output(call.call_id, output));
    session.send_control_message(messages::response_create());
}

call::ModelSignal RealtimeDelegate::classify(const nlohmann::json& message,
                                             std::vector<call::ToolCall>& tool_calls) const {
    if (!message.is_object()) {
        return call::ModelSignal::None;
    }
    const auto type = message.value("type", "");
    if (type == "output_audio_buffer.started") {
        return call::ModelSignal::AiSpeechStarted;
    }
    if (type == "output_audio_buffer.stopped") {
        return call::ModelSignal::AiSpeechStopped;
    }
    if (type == "input_audio_buffer.speech_started") {
        return call::ModelSignal::UserSpeechStarted;
    }
    if (type == "response.function_call_arguments.done") {
        call::ToolCall tool_call;
        tool_call.call_id = message.value("call_id", "");
        tool_call.name = message.value("name", "");
        tool_call.arguments = message.value("arguments", "");
        if (tool_call.call_id.empty()) {
            return call::ModelSignal::None;
        }
        tool_calls.push_back(std::move(tool_call));
        return call::ModelSignal::ToolCallRequested;
    }
    return call::ModelSignal::None;
}

}
