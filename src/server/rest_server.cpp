#include "voice_bridge/server/rest_server.hpp"

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/signaling/messages.hpp"

namespace voice_bridge {

RestServer::RestServer(const Config& config,
                       call::BridgeService& bridge,
                       events::ConnectionLifecycle& lifecycle)
    : config_(config),
      bridge_(bridge),
      lifecycle_(lifecycle),
      server_(std::make_unique<httplib::Server>()) {
    register_routes();
}

httplib::Server& RestServer::server() {
    return *server_;
}

void RestServer::register_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}, {"active_connections", bridge_.active_connections()}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Get("/connections", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        nlohmann::json items = nlohmann::json::array();
        for (const auto& state : lifecycle_.all_connections()) {
            items.push_back(signaling::connection_state_json(state));
        }
        write_json(res, {200, {{"connections", items}}});
    });

    server_->Post("/calls/inbound", [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res, "inbound call", [this](const nlohmann::json& body) {
            const auto setup = bridge_.start_inbound(signaling::parse_call_request(body, true));
            return RestResponse{200, {{"connection_id", setup.connection_id}, {"sdp", setup.sdp}}};
        });
    });

    server_->Post("/calls/outbound", [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res, "outbound call", [this](const nlohmann::json& body) {
            const auto setup = bridge_.start_outbound(signaling::parse_call_request(body, false));
            return RestResponse{200, {{"connection_id", setup.connection_id}, {"sdp", setup.sdp}}};
        });
    });

    server_->Post(R"(/calls/([A-Za-z0-9_.-]+)/answer)",
                  [this](const httplib::Request& req, httplib::Response& res) {
        const auto connection_id = req.matches[1].str();
        handle(req, res, "remote answer", [this, connection_id](const nlohmann::json& body) {
            bridge_.apply_answer(connection_id, signaling::require_string(body, "sdp"));
            return RestResponse{200, {{"connection_id", connection_id}, {"status", "accepted"}}};
        });
    });

    server_->Delete(R"(/calls/([A-Za-z0-9_.-]+))",
                    [this](const httplib::Request& req, httplib::Response& res) {
        const auto connection_id = req.matches[1].str();
        handle(req, res, "terminate", [this, connection_id](const nlohmann::json&) {
            if (!bridge_.terminate(connection_id, call::ExitReason::Default)) {
                return RestResponse{404, {{"message", "call not found"}}};
            }
            return RestResponse{200, {{"connection_id", connection_id}, {"status", "terminated"}}};
        });
    });
}

void RestServer::handle(const httplib::Request& req,
                        httplib::Response& res,
                        const char* name,
                        const std::function<RestResponse(const nlohmann::json&)>& handler) const {
    if (!authorize_request(req, res)) {
        return;
    }
    nlohmann::json body = nlohmann::json::object();
    if (!req.body.empty()) {
        try {
            body = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::exception& ex) {
            logging::error("Failed to parse request body",
                           {kv("request", name), kv("error", ex.what())});
            write_json(res, {400, {{"message", "invalid request body"}}});
            return;
        }
    }
    try {
        write_json(res, handler(body));
    } catch (const signaling::InvalidRequest& ex) {
        write_json(res, {400, {{"message", ex.what()}}});
    } catch (const webrtc::NegotiationError& ex) {
        logging::warn("Negotiation rejected", {kv("request", name), kv("error", ex.what())});
        write_json(res, {400, {{"message", ex.what()}}});
    } catch (const events::ConnectionNotFound& ex) {
        write_json(res, {404, {{"message", ex.what()}}});
    } catch (const std::exception& ex) {
        logging::error("Request failed", {kv("request", name), kv("error", ex.what())});
        write_json(res, {500, {{"message", ex.what()}}});
    }
}

void RestServer::start() {
    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error("REST server failed to listen", {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
