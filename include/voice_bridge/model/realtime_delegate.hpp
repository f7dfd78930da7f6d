#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_bridge/call/call_delegate.hpp"

namespace voice_bridge {
namespace model {

namespace messages {
nlohmann::json response_create(const std::optional<std::string>& instructions = std::nullopt);
nlohmann::json text_item(const std::string& role, const std::string& text);
nlohmann::json function_call_output(const std::string& call_id, const std::string& output);
nlohmann::json session_update(const std::optional<std::string>& voice,
                              const std::optional<std::string>& instructions);
}

// Conversation behaviour for the realtime speech API message vocabulary.
class RealtimeDelegate : public call::CallBridgeDelegate {
public:
    RealtimeDelegate(std::optional<std::string> voice, std::optional<std::string> instructions);

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
    std::optional<std::string> voice_;
    std::optional<std::string> instructions_;
};

}
}
