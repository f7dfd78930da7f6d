#include "voice_bridge/signaling/control_client.hpp"

#include <chrono>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/signaling/messages.hpp"
#include "voice_bridge/utils/async.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::signaling {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;

constexpr std::chrono::seconds kReconnectDelay{5};

}

struct ControlClient::WsState {
    std::shared_ptr<WsClient> client;
    websocketpp::connection_hdl connection;
};

ControlClient::ControlClient(std::string base_url, std::string bridge_id, call::BridgeService& bridge)
    : base_url_(std::move(base_url)),
      bridge_id_(std::move(bridge_id)),
      bridge_(bridge) {}

ControlClient::~ControlClient() {
    stop();
}

void ControlClient::start() {
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread([this]() { run_loop(); });
}

void ControlClient::send_json(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!ws_state_ || !ws_state_->client || ws_state_->connection.expired()) {
        logging::warn("Signaling message dropped, not connected",
                      {kv("type", payload.value("type", ""))});
        return;
    }
    websocketpp::lib::error_code ec;
    ws_state_->client->send(ws_state_->connection, payload.dump(),
                            websocketpp::frame::opcode::text, ec);
    if (ec) {
        logging::warn("Failed to send signaling message",
                      {kv("type", payload.value("type", "")), kv("error", ec.message())});
    }
}

void ControlClient::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_ && ws_state_->client && !ws_state_->connection.expired()) {
            websocketpp::lib::error_code ec;
            ws_state_->client->close(ws_state_->connection,
                                     websocketpp::close::status::going_away,
                                     "shutdown", ec);
        }
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    tasks_.close_and_wait();
}

nlohmann::json ControlClient::handle_task(const nlohmann::json& task) {
    const auto type = task.is_object() ? task.value("type", "") : std::string();
    const auto connection_id = task.is_object() ? task.value("connection_id", "") : std::string();
    try {
        if (type == "inbound_call") {
            return setup_message("answer", bridge_.start_inbound(parse_call_request(task, true)));
        }
        if (type == "outbound_call") {
            return setup_message("offer", bridge_.start_outbound(parse_call_request(task, false)));
        }
        if (type == "remote_answer") {
            bridge_.apply_answer(require_string(task, "connection_id"), require_string(task, "sdp"));
            return nullptr;
        }
        if (type == "terminate") {
            const auto reason = call::parse_exit_reason(task.value("reason", "default"));
            if (!bridge_.terminate(require_string(task, "connection_id"),
                                   reason.value_or(call::ExitReason::Default))) {
                return error_message(connection_id, type, "call is not active");
            }
            return nullptr;
        }
        if (type == "tool_result") {
            const auto& output = task.contains("output") ? task.at("output") : nlohmann::json();
            bridge_.submit_tool_result(require_string(task, "connection_id"),
                                       require_string(task, "call_id"),
                                       output.is_string() ? output.get<std::string>() : output.dump());
            return nullptr;
        }
        logging::warn("Unknown signaling task", {kv("type", type)});
        return error_message(connection_id, type, "unknown task type");
    } catch (const std::exception& ex) {
        logging::error("Signaling task failed",
                       {kv("type", type), kv("connection_id", connection_id), kv("error", ex.what())});
        return error_message(connection_id, type, ex.what());
    }
}

void ControlClient::send_tool_call(const std::string& connection_id, const call::ToolCall& call) {
    send_json(tool_call_message(connection_id, call));
}

void ControlClient::send_call_ended(const std::string& connection_id, call::ExitReason reason) {
    send_json(call_ended_message(connection_id, reason));
}

std::string ControlClient::ws_url() const {
    return utils::to_websocket_url(base_url_) + "/ws/" + bridge_id_;
}

void ControlClient::run_loop() {
    while (running_) {
        auto client = std::make_shared<WsClient>();
        client->clear_access_channels(websocketpp::log::alevel::all);
        client->clear_error_channels(websocketpp::log::elevel::all);
        client->init_asio();

        client->set_open_handler([this](websocketpp::connection_hdl) {
            logging::info("Signaling connected", {kv("url", ws_url())});
        });
        client->set_message_handler([this](websocketpp::connection_hdl,
                                           WsClient::message_ptr msg) {
            nlohmann::json task;
            try {
                task = nlohmann::json::parse(msg->get_payload());
            } catch (const nlohmann::json::exception& ex) {
                logging::warn("Invalid signaling message", {kv("error", ex.what())});
                return;
            }
            // Tasks may block on negotiation; keep the socket loop free.
            const bool accepted = tasks_.spawn([this, task]() {
                const auto reply = handle_task(task);
                if (!reply.is_null()) {
                    send_json(reply);
                }
            }, "signaling-task");
            if (!accepted) {
                logging::warn("Signaling task dropped during shutdown",
                              {kv("type", task.is_object() ? task.value("type", "") : std::string())});
            }
        });
        client->set_close_handler([](websocketpp::connection_hdl) {
            logging::info("Signaling connection closed");
        });
        client->set_fail_handler([](websocketpp::connection_hdl) {
            logging::warn("Signaling connection failed");
        });

        websocketpp::lib::error_code ec;
        auto conn = client->get_connection(ws_url(), ec);
        if (ec) {
            logging::error("Invalid signaling url", {kv("url", ws_url()), kv("error", ec.message())});
            std::this_thread::sleep_for(kReconnectDelay);
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            ws_state_ = std::make_unique<WsState>();
            ws_state_->client = client;
            ws_state_->connection = conn->get_handle();
        }
        client->connect(conn);
        client->run();

        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            ws_state_.reset();
        }
        if (running_) {
            std::this_thread::sleep_for(kReconnectDelay);
        }
    }
}

}
