#include "voice_bridge/signaling/messages.hpp"

#include <chrono>

namespace voice_bridge::signaling {

namespace {

std::string optional_string(const nlohmann::json& body, const char* field) {
    const auto it = body.find(field);
    if (it == body.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw InvalidRequest(std::string(field) + " must be a string");
    }
    return it->get<std::string>();
}

int64_t epoch_ms(std::chrono::system_clock::time_point at) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
}

}

std::string require_string(const nlohmann::json& body, const char* field) {
    if (!body.is_object()) {
        throw InvalidRequest("request body must be an object");
    }
    auto value = optional_string(body, field);
    if (value.empty()) {
        throw InvalidRequest(std::string(field) + " is required");
    }
    return value;
}

call::CallRequest parse_call_request(const nlohmann::json& body, bool require_sdp) {
    if (!body.is_object()) {
        throw InvalidRequest("request body must be an object");
    }
    call::CallRequest request;
    request.connection_id = optional_string(body, "connection_id");
    request.tenant_id = optional_string(body, "tenant_id");
    request.agent_id = optional_string(body, "agent_id");
    request.call_id = optional_string(body, "call_id");
    request.sdp = optional_string(body, "sdp");
    if (require_sdp && request.sdp.empty()) {
        throw InvalidRequest("sdp is required");
    }
    return request;
}

nlohmann::json setup_message(const char* type, const call::CallSetup& setup) {
    return {{"type", type}, {"connection_id", setup.connection_id}, {"sdp", setup.sdp}};
}

nlohmann::json tool_call_message(const std::string& connection_id, const call::ToolCall& call) {
    return {
        {"type", "tool_call"},
        {"connection_id", connection_id},
        {"call_id", call.call_id},
        {"name", call.name},
        {"arguments", call.arguments},
    };
}

nlohmann::json call_ended_message(const std::string& connection_id, call::ExitReason reason) {
    return {{"type", "call_ended"}, {"connection_id", connection_id}, {"reason", call::to_string(reason)}};
}

nlohmann::json error_message(const std::string& connection_id,
                             const std::string& request_type,
                             const std::string& message) {
    nlohmann::json payload{{"type", "error"}, {"request_type", request_type}, {"message", message}};
    if (!connection_id.empty()) {
        payload["connection_id"] = connection_id;
    }
    return payload;
}

nlohmann::json connection_state_json(const events::ConnectionState& state) {
    nlohmann::json dependencies = nlohmann::json::object();
    for (const auto& entry : state.dependencies) {
        dependencies[entry.first] = entry.second;
    }
    return {
        {"connection_id", state.connection_id},
        {"call_id", state.call_id},
        {"tenant_id", state.tenant_id},
        {"phase", events::to_string(state.phase)},
        {"dependencies", dependencies},
        {"created_at_ms", epoch_ms(state.created_at)},
        {"updated_at_ms", epoch_ms(state.updated_at)},
    };
}

}
