#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_bridge/call/exit_reason.hpp"
#include "voice_bridge/model/model_session.hpp"

namespace voice_bridge {
namespace call {

enum class ModelSignal {
    None,
    AiSpeechStarted,
    AiSpeechStopped,
    UserSpeechStarted,
    ToolCallRequested
};

const char* to_string(ModelSignal signal);

struct ToolCall {
    std::string call_id;
    std::string name;
    std::string arguments;
};

// Backend-specific conversation behaviour, implemented once per AI backend
// and injected into the bridge service.
class CallBridgeDelegate {
public:
    virtual ~CallBridgeDelegate() = default;

    virtual void configure_session(model::ModelSession& session, const std::string& connection_id) = 0;
    virtual void send_greeting(model::ModelSession& session, const std::string& connection_id) = 0;
    virtual void send_inactivity_prompt(model::ModelSession& session,
                                        const std::string& connection_id,
                                        const std::string& message) = 0;
    virtual void send_farewell(model::ModelSession& session,
                               const std::string& connection_id,
                               ExitReason reason) = 0;
    // call is the request as classify reported it; backends that key
    // results by function name need more than the id.
    virtual void send_tool_result(model::ModelSession& session,
                                  const ToolCall& call,
                                  const std::string& output) = 0;

    // Maps a control message from the backend to a call signal. Appends to
    // tool_calls for ToolCallRequested; one message may carry several.
    virtual ModelSignal classify(const nlohmann::json& message,
                                 std::vector<ToolCall>& tool_calls) const = 0;
};

}
}
