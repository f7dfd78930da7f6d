#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/call/bridge_service.hpp"
#include "voice_bridge/events/lifecycle.hpp"

namespace voice_bridge {
namespace signaling {

class InvalidRequest : public std::runtime_error {
public:
    explicit InvalidRequest(const std::string& message) : std::runtime_error(message) {}
};

// Reads {connection_id?, tenant_id, agent_id, call_id?, sdp?}. Throws
// InvalidRequest when a field has the wrong type or sdp is required but
// missing.
call::CallRequest parse_call_request(const nlohmann::json& body, bool require_sdp);

std::string require_string(const nlohmann::json& body, const char* field);

nlohmann::json setup_message(const char* type, const call::CallSetup& setup);
nlohmann::json tool_call_message(const std::string& connection_id, const call::ToolCall& call);
nlohmann::json call_ended_message(const std::string& connection_id, call::ExitReason reason);
nlohmann::json error_message(const std::string& connection_id,
                             const std::string& request_type,
                             const std::string& message);
nlohmann::json connection_state_json(const events::ConnectionState& state);

}
}
