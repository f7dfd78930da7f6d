#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_bridge/call/call_delegate.hpp"

namespace voice_bridge {
namespace model {

namespace live_messages {
nlohmann::json setup(const std::string& model,
                     const std::optional<std::string>& voice,
                     const std::optional<std::string>& instructions);
nlohmann::json user_turn(const std::string& text);
// output is forwarded as an object when it parses as one, otherwise wrapped
// as {"result": output}.
nlohmann::json tool_response(const call::ToolCall& call, const std::string& output);
}

inline constexpr const char* kDefaultGreetingPrompt =
    "Greet the caller briefly and ask how you can help.";

// Conversation behaviour for the Live API over a WebRTC data channel. The
// backend speaks only after a completed user turn, so greeting, prompts and
// farewell are all sent as user turns.
class GeminiDelegate : public call::CallBridgeDelegate {
public:
    GeminiDelegate(std::string model,
                   std::optional<std::string> voice,
                   std::optional<std::string> instructions,
                   std::string greeting_prompt = kDefaultGreetingPrompt);

    void configure_session(ModelSession& session, const std::string& connection_id) override;
    void send_greeting(ModelSession& session, const std::string& connection_id) override;
    void send_inactivity_prompt(ModelSession& session,
                                const std::string& connection_id,
                                const std::string& message) override;
    void send_farewell(ModelSession& session,
                       const std::string& connection_id,
                       call::ExitReason reason) override;
    void send_tool_result(ModelSession& session,
                          const call::ToolCall& call,
                          const std::string& output) override;
    call::ModelSignal classify(const nlohmann::json& message,
                               std::vector<call::ToolCall>& tool_calls) const override;

private:
    std::string model_;
    std::optional<std::string> voice_;
    std::optional<std::string> instructions_;
    std::string greeting_prompt_;
};

}
}
