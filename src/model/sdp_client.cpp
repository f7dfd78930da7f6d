#include "voice_bridge/model/sdp_client.hpp"

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::model {

SdpPostClient::SdpPostClient(const std::string& base_url,
                             const std::string& endpoint,
                             std::string query,
                             httplib::Headers headers,
                             std::chrono::seconds timeout)
    : headers_(std::move(headers)),
      timeout_(timeout) {
    const auto parts = utils::parse_url(base_url);
    scheme_ = parts.scheme;
    host_ = parts.host;
    port_ = parts.port;
    request_path_ = utils::join_path(parts.path, endpoint) + "?" + query;
    headers_.emplace("Accept", "application/sdp");
}

std::string SdpPostClient::exchange(const std::string& offer) {
    httplib::Result response;
    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        httplib::SSLClient client(host_, port_);
        apply_timeouts(client);
        response = client.Post(request_path_, headers_, offer, "application/sdp");
#else
        throw ModelSessionError("HTTPS model endpoint requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    } else {
        httplib::Client client(host_, port_);
        apply_timeouts(client);
        response = client.Post(request_path_, headers_, offer, "application/sdp");
    }

    if (!response) {
        throw ModelSessionError("SDP exchange failed: " + httplib::to_string(response.error()));
    }
    if (response->status == 401 || response->status == 403) {
        throw ModelPermissionError("model endpoint rejected credentials: " + response->body);
    }
    if (response->status != 200 && response->status != 201) {
        throw ModelSessionError("SDP exchange returned HTTP " + std::to_string(response->status) +
                                ": " + response->body);
    }
    if (response->body.empty()) {
        throw ModelSessionError("SDP exchange returned an empty answer");
    }
    logging::debug("SDP exchange completed",
                   {kv("host", host_), kv("status", response->status)});
    return response->body;
}

RealtimeCallsClient::RealtimeCallsClient(const std::string& base_url,
                                         const std::string& model,
                                         const std::string& api_key,
                                         std::chrono::seconds timeout)
    : SdpPostClient(base_url,
                    "/v1/realtime/calls",
                    "model=" + utils::url_encode(model),
                    {{"Authorization", "Bearer " + api_key}},
                    timeout) {}

std::string gemini_model_path(const std::string& model) {
    if (model.rfind("models/", 0) == 0) {
        return model;
    }
    return "models/" + model;
}

GeminiLiveClient::GeminiLiveClient(const std::string& base_url,
                                   const std::string& model,
                                   const std::string& api_key,
                                   std::chrono::seconds timeout)
    : SdpPostClient(base_url,
                    "/v1beta/" + gemini_model_path(model) + ":bidiGenerateContent",
                    "key=" + utils::url_encode(api_key),
                    {},
                    timeout) {}

}
