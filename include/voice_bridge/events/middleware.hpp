#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "voice_bridge/events/bus.hpp"

namespace voice_bridge {
namespace events {

using FailureReporter = std::function<void(const Event&, const std::string&)>;

Middleware recovery_middleware(FailureReporter reporter = nullptr);
Middleware validation_middleware();
Middleware logging_middleware();
Middleware metrics_middleware();
Middleware deduplication_middleware(std::chrono::milliseconds window);
Middleware rate_limit_middleware(int events_per_second);
Middleware timeout_middleware(std::chrono::milliseconds timeout);

// Returns an empty string for a valid event, otherwise the reason it is rejected.
std::string validate_event(const Event& event);

struct MiddlewareSettings {
    std::chrono::milliseconds dedup_window{5000};
    int rate_limit = 100;
    std::chrono::milliseconds handler_timeout{30000};
};

std::vector<Middleware> default_middlewares(const MiddlewareSettings& settings = {});
std::vector<Middleware> production_middlewares(const MiddlewareSettings& settings = {});

}
}
