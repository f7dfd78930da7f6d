#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "voice_bridge/call/bridge_service.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {
namespace signaling {

// Persistent websocket to the signaling collaborator. Receives call tasks,
// runs them against the bridge and reports results and call events back.
// Reconnects every 5 seconds while running.
class ControlClient : public call::CallNotifier {
public:
    ControlClient(std::string base_url, std::string bridge_id, call::BridgeService& bridge);
    ~ControlClient() override;

    void start();
    void stop();

    void send_json(const nlohmann::json& payload);

    // Executes one task and returns the reply to send (null for none).
    nlohmann::json handle_task(const nlohmann::json& task);

    void send_tool_call(const std::string& connection_id, const call::ToolCall& call) override;
    void send_call_ended(const std::string& connection_id, call::ExitReason reason) override;

    std::string ws_url() const;

private:
    void run_loop();

    std::string base_url_;
    std::string bridge_id_;
    call::BridgeService& bridge_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex ws_mutex_;
    struct WsState;
    std::unique_ptr<WsState> ws_state_;
    utils::TaskGroup tasks_;
};

}
}
