#pragma once

#include <string>

namespace voice_bridge::utils {

struct UrlParts {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
};

UrlParts parse_url(const std::string& url);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

// Joins a base path ("/api/") and a request path ("/v1/x") with exactly one slash.
std::string join_path(const std::string& base_path, const std::string& path);

// http(s):// becomes ws(s)://; a bare host gets ws://.
std::string to_websocket_url(const std::string& url);

std::string url_encode(const std::string& value);

}
