#include "voice_bridge/events/lifecycle.hpp"

#include <algorithm>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::events {

const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::Created:
            return "created";
        case Phase::Initializing:
            return "initializing";
        case Phase::Ready:
            return "ready";
        case Phase::Terminating:
            return "terminating";
        case Phase::Terminated:
            return "terminated";
    }
    return "unknown";
}

bool ConnectionState::all_dependencies_ready() const {
    return std::all_of(dependencies.begin(), dependencies.end(),
                       [](const auto& entry) { return entry.second; });
}

ConnectionLifecycle::ConnectionLifecycle(EventBus& bus,
                                         utils::TimerService& timers,
                                         std::chrono::milliseconds cleanup_delay)
    : bus_(bus),
      timers_(timers),
      cleanup_delay_(cleanup_delay) {
    subscribe_dependency(EventType::AudioTrackReady, deps::kTransportAudioReady);
    subscribe_dependency(EventType::SdpAnswerGenerated, deps::kTransportSdpReady);
    subscribe_dependency(EventType::ModelConnectionInitialized, deps::kModelConnectionReady);
    subscribe_dependency(EventType::ModelAudioReady, deps::kModelAudioReady);
    subscribe_dependency(EventType::ModelControlChannelReady, deps::kModelControlChannelReady);
    subscribe_dependency(EventType::RemoteAudioReady, deps::kRemoteAudioReady);
    subscribe_dependency(EventType::RemoteCallAccepted, deps::kRemoteCallAccepted);
    logging::info("Lifecycle event subscriptions set up");
}

ConnectionLifecycle::~ConnectionLifecycle() {
    close();
}

void ConnectionLifecycle::subscribe_dependency(EventType type, const char* dependency) {
    const std::string name(dependency);
    subscriptions_.push_back(bus_.subscribe(type, [this, name](const Event& event) {
        try {
            mark_dependency_ready(event.connection_id, name);
        } catch (const ConnectionNotFound&) {
            logging::debug(
                "Dependency event for unknown connection",
                {kv("connection_id", event.connection_id),
                 kv("dependency", name)});
        }
    }));
}

void ConnectionLifecycle::register_connection(const std::string& connection_id,
                                              const std::string& call_id,
                                              const std::string& tenant_id,
                                              const std::vector<std::string>& dependencies) {
    bool ready_now = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (closed_) {
            throw std::runtime_error("lifecycle is closed");
        }
        if (connections_.count(connection_id) != 0) {
            throw std::runtime_error("connection already registered: " + connection_id);
        }
        auto entry = std::make_unique<Entry>();
        auto& state = entry->state;
        state.connection_id = connection_id;
        state.call_id = call_id;
        state.tenant_id = tenant_id;
        state.phase = Phase::Created;
        for (const auto& dependency : dependencies) {
            state.dependencies[dependency] = false;
        }
        state.created_at = std::chrono::system_clock::now();
        state.updated_at = state.created_at;
        if (state.dependencies.empty()) {
            state.phase = Phase::Ready;
            ready_now = true;
        }
        connections_.emplace(connection_id, std::move(entry));
    }

    logging::info(
        "Connection registered",
        {kv("connection_id", connection_id),
         kv("call_id", call_id),
         kv("dependencies", dependencies.size())});
    bus_.publish(make_event(EventType::ConnectionCreated, connection_id, "lifecycle",
                            {{"call_id", call_id}, {"tenant_id", tenant_id}}));
    if (ready_now) {
        bus_.publish(make_event(EventType::ConnectionReady, connection_id, "lifecycle"));
    }
}

bool ConnectionLifecycle::update_phase(const std::string& connection_id, Phase phase) {
    if (phase == Phase::Terminated) {
        return terminate_connection(connection_id);
    }
    Phase previous;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const auto it = connections_.find(connection_id);
        if (it == connections_.end()) {
            throw ConnectionNotFound(connection_id);
        }
        auto& state = it->second->state;
        previous = state.phase;
        if (phase <= previous) {
            if (phase < previous) {
                logging::warn(
                    "Ignoring phase regression",
                    {kv("connection_id", connection_id),
                     kv("from", to_string(previous)),
                     kv("to", to_string(phase))});
            }
            return false;
        }
        if (phase == Phase::Ready && !state.all_dependencies_ready()) {
            logging::warn(
                "Ignoring ready transition with pending dependencies",
                {kv("connection_id", connection_id)});
            return false;
        }
        state.phase = phase;
        state.updated_at = std::chrono::system_clock::now();
    }

    logging::info(
        "Connection phase updated",
        {kv("connection_id", connection_id),
         kv("from", to_string(previous)),
         kv("to", to_string(phase))});
    if (phase == Phase::Ready) {
        bus_.publish(make_event(EventType::ConnectionReady, connection_id, "lifecycle"));
    }
    return true;
}

bool ConnectionLifecycle::mark_dependency_ready(const std::string& connection_id,
                                                const std::string& dependency) {
    bool became_ready = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const auto it = connections_.find(connection_id);
        if (it == connections_.end()) {
            throw ConnectionNotFound(connection_id);
        }
        auto& state = it->second->state;
        if (state.phase >= Phase::Ready) {
            return false;
        }
        const auto dep = state.dependencies.find(dependency);
        if (dep == state.dependencies.end()) {
            logging::warn(
                "Unknown dependency ignored",
                {kv("connection_id", connection_id),
                 kv("dependency", dependency)});
            return false;
        }
        if (dep->second) {
            return false;
        }
        dep->second = true;
        if (state.phase == Phase::Created) {
            state.phase = Phase::Initializing;
        }
        state.updated_at = std::chrono::system_clock::now();
        if (state.all_dependencies_ready()) {
            state.phase = Phase::Ready;
            became_ready = true;
        }
    }

    logging::info(
        "Dependency ready",
        {kv("connection_id", connection_id),
         kv("dependency", dependency)});
    if (became_ready) {
        logging::info(
            "Connection ready",
            {kv("connection_id", connection_id)});
        bus_.publish(make_event(EventType::ConnectionReady, connection_id, "lifecycle"));
    }
    return true;
}

ConnectionState ConnectionLifecycle::get_state(const std::string& connection_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        throw ConnectionNotFound(connection_id);
    }
    return it->second->state;
}

bool ConnectionLifecycle::contains(const std::string& connection_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.count(connection_id) != 0;
}

bool ConnectionLifecycle::terminate_connection(const std::string& connection_id) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const auto it = connections_.find(connection_id);
        if (it == connections_.end()) {
            throw ConnectionNotFound(connection_id);
        }
        auto& entry = *it->second;
        if (entry.state.phase == Phase::Terminated) {
            return false;
        }
        entry.state.phase = Phase::Terminated;
        entry.state.updated_at = std::chrono::system_clock::now();
        entry.cleanup_timer = timers_.schedule_after(
            cleanup_delay_, [this, connection_id]() { remove_entry(connection_id); });
    }

    logging::info(
        "Connection terminated",
        {kv("connection_id", connection_id)});
    bus_.publish(make_event(EventType::ConnectionTerminated, connection_id, "lifecycle"));
    return true;
}

void ConnectionLifecycle::remove_entry(const std::string& connection_id) {
    std::unique_ptr<Entry> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        const auto it = connections_.find(connection_id);
        if (it == connections_.end()) {
            return;
        }
        removed = std::move(it->second);
        connections_.erase(it);
    }
    logging::debug(
        "Connection state removed",
        {kv("connection_id", connection_id)});
}

std::vector<ConnectionState> ConnectionLifecycle::all_connections() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ConnectionState> result;
    result.reserve(connections_.size());
    for (const auto& entry : connections_) {
        result.push_back(entry.second->state);
    }
    return result;
}

void ConnectionLifecycle::close() {
    std::unordered_map<std::string, std::unique_ptr<Entry>> drained;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        drained.swap(connections_);
    }
    for (const auto id : subscriptions_) {
        bus_.unsubscribe(id);
    }
    subscriptions_.clear();
    drained.clear();
}

}
