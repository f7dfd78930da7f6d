#include "voice_bridge/call/connection.hpp"

namespace voice_bridge::call {

const char* to_string(CallDirection direction) {
    return direction == CallDirection::Inbound ? "inbound" : "outbound";
}

GreetingGate::GreetingGate(Clock::time_point created,
                           std::chrono::milliseconds failsafe,
                           std::chrono::milliseconds interruption_window)
    : created_ms_(to_ms(created)),
      failsafe_(failsafe),
      interruption_window_(interruption_window) {}

int64_t GreetingGate::to_ms(Clock::time_point at) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
}

void GreetingGate::greeting_sent(Clock::time_point at) {
    int64_t expected = kUnset;
    sent_ms_.compare_exchange_strong(expected, to_ms(at));
}

void GreetingGate::greeting_audio_started(Clock::time_point at) {
    int64_t expected = kUnset;
    audio_ms_.compare_exchange_strong(expected, to_ms(at));
}

bool GreetingGate::suppress(Clock::time_point now) const {
    const auto now_ms = to_ms(now);
    const auto failsafe = failsafe_.count();
    const auto sent = sent_ms_.load();
    if (sent == kUnset) {
        return now_ms - created_ms_ < failsafe;
    }
    const auto audio = audio_ms_.load();
    if (audio == kUnset) {
        return now_ms - sent < failsafe;
    }
    return now_ms - audio < interruption_window_.count();
}

void ConnectionRegistry::add(std::shared_ptr<Connection> connection) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto id = connection->id;
    if (!connections_.emplace(id, std::move(connection)).second) {
        throw std::runtime_error("connection already exists: " + id);
    }
}

std::shared_ptr<Connection> ConnectionRegistry::find(const std::string& connection_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = connections_.find(connection_id);
    return it == connections_.end() ? nullptr : it->second;
}

std::shared_ptr<Connection> ConnectionRegistry::remove(const std::string& connection_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return nullptr;
    }
    auto connection = std::move(it->second);
    connections_.erase(it);
    return connection;
}

std::vector<std::shared_ptr<Connection>> ConnectionRegistry::all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Connection>> result;
    result.reserve(connections_.size());
    for (const auto& entry : connections_) {
        result.push_back(entry.second);
    }
    return result;
}

size_t ConnectionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.size();
}

}
