#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <httplib.h>

#include "voice_bridge/model/model_session.hpp"

namespace voice_bridge {
namespace model {

class ModelPermissionError : public ModelSessionError {
public:
    explicit ModelPermissionError(const std::string& message) : ModelSessionError(message) {}
};

// Trades a local offer for the backend's answer over the signaling channel
// the backend provides.
class SdpExchanger {
public:
    virtual ~SdpExchanger() = default;

    virtual std::string exchange(const std::string& offer) = 0;
};

// Posts the offer as application/sdp to one backend endpoint; the answer is
// the response body.
class SdpPostClient : public SdpExchanger {
public:
    std::string exchange(const std::string& offer) override;

    const std::string& request_path() const { return request_path_; }

protected:
    SdpPostClient(const std::string& base_url,
                  const std::string& endpoint,
                  std::string query,
                  httplib::Headers headers,
                  std::chrono::seconds timeout);

private:
    template <typename T>
    void apply_timeouts(T& client) const {
        client.set_connection_timeout(timeout_.count(), 0);
        client.set_read_timeout(timeout_.count(), 0);
        client.set_write_timeout(timeout_.count(), 0);
    }

    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string request_path_;
    httplib::Headers headers_;
    std::chrono::seconds timeout_;
};

// POST {base}/v1/realtime/calls?model=<model> with a bearer token.
class RealtimeCallsClient : public SdpPostClient {
public:
    RealtimeCallsClient(const std::string& base_url,
                        const std::string& model,
                        const std::string& api_key,
                        std::chrono::seconds timeout);
};

// "gemini-3-flash" and "models/gemini-3-flash" name the same model.
std::string gemini_model_path(const std::string& model);

// POST {base}/v1beta/<model>:bidiGenerateContent?key=<key>.
class GeminiLiveClient : public SdpPostClient {
public:
    GeminiLiveClient(const std::string& base_url,
                     const std::string& model,
                     const std::string& api_key,
                     std::chrono::seconds timeout);
};

}
}
