#include "voice_bridge/events/middleware.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge::events {

namespace {

using SteadyClock = std::chrono::steady_clock;

bool has_string(const nlohmann::json& data, const char* key) {
    if (!data.is_object()) {
        return false;
    }
    const auto it = data.find(key);
    return it != data.end() && it->is_string() && !it->get<std::string>().empty();
}

}

Middleware recovery_middleware(FailureReporter reporter) {
    return [reporter](Handler next) -> Handler {
        return [next = std::move(next), reporter](const Event& event) {
            try {
                next(event);
            } catch (const std::exception& ex) {
                logging::error(
                    "Recovered from event dispatch failure",
                    {kv("type", to_string(event.type)),
                     kv("connection_id", event.connection_id),
                     kv("error", ex.what())});
                if (reporter) {
                    reporter(event, ex.what());
                }
            }
        };
    };
}

std::string validate_event(const Event& event) {
    if (event.connection_id.empty()) {
        return "connection_id is required";
    }
    switch (event.type) {
        case EventType::SdpOfferReceived:
        case EventType::SdpAnswerGenerated:
            if (!has_string(event.data, "sdp")) {
                return "sdp event requires sdp data";
            }
            break;
        case EventType::AudioTrackReady:
        case EventType::ModelAudioReady:
            if (!has_string(event.data, "track_type")) {
                return "audio track event requires track_type";
            }
            break;
        case EventType::RemoteCallStarted:
        case EventType::RemoteCallAccepted:
            if (!has_string(event.data, "call_id")) {
                return "remote call event requires call_id";
            }
            break;
        default:
            break;
    }
    return "";
}

Middleware validation_middleware() {
    return [](Handler next) -> Handler {
        return [next = std::move(next)](const Event& event) {
            const auto reason = validate_event(event);
            if (!reason.empty()) {
                logging::warn(
                    "Event rejected by validation",
                    {kv("type", to_string(event.type)),
                     kv("connection_id", event.connection_id),
                     kv("reason", reason)});
                return;
            }
            next(event);
        };
    };
}

Middleware logging_middleware() {
    return [](Handler next) -> Handler {
        return [next = std::move(next)](const Event& event) {
            logging::debug(
                "Dispatching event",
                {kv("type", to_string(event.type)),
                 kv("connection_id", event.connection_id),
                 kv("source", event.source)});
            next(event);
        };
    };
}

Middleware metrics_middleware() {
    return [](Handler next) -> Handler {
        return [next = std::move(next)](const Event& event) {
            const auto start = SteadyClock::now();
            Metrics::instance().increment_event(to_string(event.type));
            next(event);
            const auto elapsed =
                std::chrono::duration<double>(SteadyClock::now() - start).count();
            Metrics::instance().observe_handler_time(to_string(event.type), elapsed);
        };
    };
}

Middleware deduplication_middleware(std::chrono::milliseconds window) {
    struct State {
        std::mutex mutex;
        std::unordered_map<std::string, SteadyClock::time_point> last_seen;
    };
    auto state = std::make_shared<State>();

    return [state, window](Handler next) -> Handler {
        return [next = std::move(next), state, window](const Event& event) {
            const auto key = std::string(to_string(event.type)) + ":" + event.connection_id;
            const auto now = SteadyClock::now();
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                const auto it = state->last_seen.find(key);
                if (it != state->last_seen.end() && now - it->second < window) {
                    logging::info(
                        "Duplicate event within window",
                        {kv("type", to_string(event.type)),
                         kv("connection_id", event.connection_id),
                         kv("window_ms", window.count())});
                    return;
                }
                state->last_seen[key] = now;
                if (state->last_seen.size() > 1024) {
                    for (auto entry = state->last_seen.begin(); entry != state->last_seen.end();) {
                        if (now - entry->second >= window) {
                            entry = state->last_seen.erase(entry);
                        } else {
                            ++entry;
                        }
                    }
                }
            }
            next(event);
        };
    };
}

Middleware rate_limit_middleware(int events_per_second) {
    struct Bucket {
        std::mutex mutex;
        double tokens = 0.0;
        SteadyClock::time_point refilled_at = SteadyClock::now();
    };
    const double capacity = std::max(1, events_per_second);
    auto bucket = std::make_shared<Bucket>();
    bucket->tokens = capacity;

    return [bucket, capacity](Handler next) -> Handler {
        return [next = std::move(next), bucket, capacity](const Event& event) {
            {
                std::lock_guard<std::mutex> lock(bucket->mutex);
                const auto now = SteadyClock::now();
                const double elapsed =
                    std::chrono::duration<double>(now - bucket->refilled_at).count();
                bucket->tokens = std::min(capacity, bucket->tokens + elapsed * capacity);
                bucket->refilled_at = now;
                if (bucket->tokens < 1.0) {
                    logging::info(
                        "Event dropped due to rate limiting",
                        {kv("type", to_string(event.type)),
                         kv("connection_id", event.connection_id)});
                    return;
                }
                bucket->tokens -= 1.0;
            }
            next(event);
        };
    };
}

Middleware timeout_middleware(std::chrono::milliseconds timeout) {
    return [timeout](Handler next) -> Handler {
        return [next = std::move(next), timeout](const Event& event) {
            auto done = std::make_shared<std::promise<void>>();
            auto finished = done->get_future();
            std::thread worker([next, event, done]() {
                try {
                    next(event);
                } catch (const std::exception& ex) {
                    logging::error(
                        "Event handler failed after dispatch",
                        {kv("type", to_string(event.type)),
                         kv("connection_id", event.connection_id),
                         kv("error", ex.what())});
                }
                done->set_value();
            });
            worker.detach();
            if (finished.wait_for(timeout) == std::future_status::timeout) {
                logging::warn(
                    "Event handler timeout",
                    {kv("type", to_string(event.type)),
                     kv("connection_id", event.connection_id),
                     kv("timeout_ms", timeout.count())});
            }
        };
    };
}

std::vector<Middleware> default_middlewares(const MiddlewareSettings& settings) {
    return {
        recovery_middleware(),
        validation_middleware(),
        logging_middleware(),
        metrics_middleware(),
        deduplication_middleware(settings.dedup_window),
    };
}

std::vector<Middleware> production_middlewares(const MiddlewareSettings& settings) {
    return {
        recovery_middleware(),
        validation_middleware(),
        timeout_middleware(settings.handler_timeout),
        rate_limit_middleware(settings.rate_limit),
        deduplication_middleware(settings.dedup_window),
        metrics_middleware(),
        logging_middleware(),
    };
}

}
