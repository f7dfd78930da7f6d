#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "voice_bridge/events/event.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {
namespace events {

using Handler = std::function<void(const Event&)>;
using Middleware = std::function<Handler(Handler)>;
using SubscriptionId = uint64_t;

struct BusStats {
    uint64_t total_events = 0;
    std::map<std::string, uint64_t> events_by_type;
    size_t active_handlers = 0;
    std::map<std::string, size_t> subscriber_count;
};

// Synchronous publish/subscribe hub. Each publish runs the middleware chain
// once on the caller's thread, then invokes the handlers subscribed to the
// event type in subscription order. A handler that throws is reported as a
// handler.failure event and never reaches the publisher or its siblings.
class EventBus {
public:
    explicit EventBus(std::vector<Middleware> middlewares = {});
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(EventType type, Handler handler);
    bool unsubscribe(SubscriptionId id);
    void use(Middleware middleware);

    void publish(const Event& event);

    // Blocks until an event of the given type (for the given connection, or
    // any connection when empty) is dispatched, the timeout expires, or the
    // wait is cancelled.
    std::optional<Event> wait_for(EventType type,
                                  const std::string& connection_id,
                                  std::chrono::milliseconds timeout);
    void cancel_waits(const std::string& connection_id);

    void close();
    bool closed() const;
    BusStats stats() const;

private:
    struct Subscription {
        SubscriptionId id = 0;
        Handler handler;
    };

    struct Waiter {
        EventType type;
        std::string connection_id;
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<Event> event;
        bool released = false;
    };

    void dispatch(const Event& event, const std::vector<Subscription>& subscriptions);
    void notify_waiters(const Event& event);
    void report_failure(const Event& event, const std::string& what);
    static void release(const std::shared_ptr<Waiter>& waiter);

    mutable std::shared_mutex mutex_;
    std::map<EventType, std::vector<Subscription>> subscribers_;
    std::vector<Middleware> middlewares_;
    bool closed_ = false;

    std::mutex waiters_mutex_;
    std::vector<std::shared_ptr<Waiter>> waiters_;

    mutable std::mutex stats_mutex_;
    uint64_t total_events_ = 0;
    std::map<std::string, uint64_t> events_by_type_;

    std::atomic<SubscriptionId> next_id_{1};
    utils::TaskGroup inflight_;
};

}
}
