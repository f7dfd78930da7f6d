#include "voice_bridge/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voice_bridge::utils {

UrlParts parse_url(const std::string& url) {
    UrlParts parts;
    std::string working = url;
    parts.scheme = "http";

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        parts.scheme = working.substr(0, scheme_pos);
        std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        working = working.substr(scheme_pos + 3);
    }

    const auto path_pos = working.find('/');
    if (path_pos != std::string::npos) {
        parts.path = working.substr(path_pos);
        working = working.substr(0, path_pos);
    } else {
        parts.path = "/";
    }

    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        parts.host = working.substr(0, port_pos);
        try {
            parts.port = std::stoi(working.substr(port_pos + 1));
        } catch (const std::exception&) {
            throw std::runtime_error("invalid port in url: " + url);
        }
    } else {
        parts.host = working;
        const bool secure = parts.scheme == "https" || parts.scheme == "wss";
        parts.port = secure ? 443 : 80;
    }
    return parts;
}

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path) {
    std::ostringstream out;
    out << scheme << "://" << host;
    const bool default_port = (scheme == "https" && port == 443) ||
                              (scheme == "http" && port == 80);
    if (!default_port && port > 0) {
        out << ":" << port;
    }
    if (!path.empty() && path.front() != '/') {
        out << '/';
    }
    out << path;
    return out.str();
}

std::string join_path(const std::string& base_path, const std::string& path) {
    if (base_path.empty() || base_path == "/") {
        return path.empty() || path.front() == '/' ? path : "/" + path;
    }
    if (path.empty()) {
        return base_path;
    }
    if (base_path.back() == '/' && path.front() == '/') {
        return base_path + path.substr(1);
    }
    if (base_path.back() != '/' && path.front() != '/') {
        return base_path + "/" + path;
    }
    return base_path + path;
}

std::string to_websocket_url(const std::string& url) {
    if (url.rfind("ws://", 0) == 0 || url.rfind("wss://", 0) == 0) {
        return url;
    }
    if (url.rfind("https://", 0) == 0) {
        return "wss://" + url.substr(8);
    }
    if (url.rfind("http://", 0) == 0) {
        return "ws://" + url.substr(7);
    }
    return "ws://" + url;
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

}
