#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_bridge/call/bridge_service.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/events/lifecycle.hpp"

namespace voice_bridge {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

class RestServer {
public:
    RestServer(const Config& config, call::BridgeService& bridge, events::ConnectionLifecycle& lifecycle);

    void start();
    void stop();

    // Routes are registered on construction of the underlying server and can
    // be exercised without listening.
    httplib::Server& server();

private:
    void register_routes();
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;
    void handle(const httplib::Request& request,
                httplib::Response& response,
                const char* name,
                const std::function<RestResponse(const nlohmann::json&)>& handler) const;

    const Config& config_;
    call::BridgeService& bridge_;
    events::ConnectionLifecycle& lifecycle_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
