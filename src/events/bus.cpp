#include "voice_bridge/events/bus.hpp"

#include <algorithm>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::events {

EventBus::EventBus(std::vector<Middleware> middlewares)
    : middlewares_(std::move(middlewares)) {}

EventBus::~EventBus() {
    close();
    inflight_.close_and_wait();
}

SubscriptionId EventBus::subscribe(EventType type, Handler handler) {
    const auto id = next_id_++;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    subscribers_[type].push_back({id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& entry : subscribers_) {
        auto& list = entry.second;
        const auto it = std::find_if(list.begin(), list.end(),
                                     [id](const Subscription& sub) { return sub.id == id; });
        if (it != list.end()) {
            list.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::use(Middleware middleware) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    middlewares_.push_back(std::move(middleware));
}

void EventBus::publish(const Event& event) {
    std::vector<Subscription> subscriptions;
    std::vector<Middleware> middlewares;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        const auto it = subscribers_.find(event.type);
        if (it != subscribers_.end()) {
            subscriptions = it->second;
        }
        middlewares = middlewares_;
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++total_events_;
        ++events_by_type_[to_string(event.type)];
    }

    // The hold travels with every copy of the chain, so a handler detached
    // by the timeout middleware keeps the bus alive until it returns.
    Handler chain = [this, subscriptions = std::move(subscriptions), hold = inflight_.hold()](const Event& e) {
        dispatch(e, subscriptions);
    };
    for (auto it = middlewares.rbegin(); it != middlewares.rend(); ++it) {
        chain = (*it)(std::move(chain));
    }
    chain(event);
}

void EventBus::dispatch(const Event& event, const std::vector<Subscription>& subscriptions) {
    for (const auto& subscription : subscriptions) {
        try {
            subscription.handler(event);
        } catch (const std::exception& ex) {
            report_failure(event, ex.what());
        }
    }
    notify_waiters(event);
}

void EventBus::report_failure(const Event& event, const std::string& what) {
    logging::error(
        "Event handler failed",
        {kv("type", to_string(event.type)),
         kv("connection_id", event.connection_id),
         kv("error", what)});
    if (event.type == EventType::HandlerFailure) {
        return;
    }
    publish(make_event(EventType::HandlerFailure, event.connection_id, "event_bus",
                       {{"failed_type", to_string(event.type)}, {"error", what}}));
}

void EventBus::notify_waiters(const Event& event) {
    std::vector<std::shared_ptr<Waiter>> matched;
    {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        auto it = waiters_.begin();
        while (it != waiters_.end()) {
            const auto& waiter = *it;
            if (waiter->type == event.type &&
                (waiter->connection_id.empty() || waiter->connection_id == event.connection_id)) {
                matched.push_back(waiter);
                it = waiters_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& waiter : matched) {
        {
            std::lock_guard<std::mutex> lock(waiter->mutex);
            waiter->event = event;
        }
        waiter->cv.notify_all();
    }
}

std::optional<Event> EventBus::wait_for(EventType type,
                                        const std::string& connection_id,
                                        std::chrono::milliseconds timeout) {
    auto waiter = std::make_shared<Waiter>();
    waiter->type = type;
    waiter->connection_id = connection_id;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (closed_) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> waiters_lock(waiters_mutex_);
        waiters_.push_back(waiter);
    }

    std::optional<Event> result;
    {
        std::unique_lock<std::mutex> lock(waiter->mutex);
        waiter->cv.wait_for(lock, timeout, [&waiter]() {
            return waiter->event.has_value() || waiter->released;
        });
        result = waiter->event;
    }

    std::lock_guard<std::mutex> lock(waiters_mutex_);
    waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
    if (!result) {
        logging::debug(
            "One-shot wait ended without event",
            {kv("type", to_string(type)),
             kv("connection_id", connection_id)});
    }
    return result;
}

void EventBus::release(const std::shared_ptr<Waiter>& waiter) {
    {
        std::lock_guard<std::mutex> lock(waiter->mutex);
        waiter->released = true;
    }
    waiter->cv.notify_all();
}

void EventBus::cancel_waits(const std::string& connection_id) {
    std::vector<std::shared_ptr<Waiter>> cancelled;
    {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        auto it = waiters_.begin();
        while (it != waiters_.end()) {
            if ((*it)->connection_id == connection_id) {
                cancelled.push_back(*it);
                it = waiters_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& waiter : cancelled) {
        release(waiter);
    }
}

void EventBus::close() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        subscribers_.clear();
    }
    std::vector<std::shared_ptr<Waiter>> pending;
    {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        pending.swap(waiters_);
    }
    for (const auto& waiter : pending) {
        release(waiter);
    }
}

bool EventBus::closed() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return closed_;
}

BusStats EventBus::stats() const {
    BusStats result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : subscribers_) {
            result.active_handlers += entry.second.size();
            if (!entry.second.empty()) {
                result.subscriber_count[to_string(entry.first)] = entry.second.size();
            }
        }
    }
    std::lock_guard<std::mutex> lock(stats_mutex_);
    result.total_events = total_events_;
    result.events_by_type = events_by_type_;
    return result;
}

}
