#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "voice_bridge/call/exit_reason.hpp"
#include "voice_bridge/call/function_call_tracker.hpp"
#include "voice_bridge/media/activity.hpp"
#include "voice_bridge/utils/timer.hpp"

namespace voice_bridge {
namespace call {

class TimerListener {
public:
    virtual ~TimerListener() = default;

    // retry is the number of prompts already sent before this one.
    virtual void on_inactivity_prompt(const std::string& connection_id, int retry, int max_retries) = 0;
    virtual void on_termination_requested(const std::string& connection_id, ExitReason reason) = 0;
};

struct TimerSettings {
    std::chrono::seconds max_duration{300};
    std::chrono::seconds silence_window{20};
    int max_retries = 5;
};

// Max-duration and silence timers per connection. Listener callbacks run on
// the timer thread without any coordinator lock held.
class TimerCoordinator {
public:
    TimerCoordinator(utils::TimerService& timers,
                     TimerListener& listener,
                     const ToolCallMonitor* tools,
                     TimerSettings settings);
    ~TimerCoordinator();

    TimerCoordinator(const TimerCoordinator&) = delete;
    TimerCoordinator& operator=(const TimerCoordinator&) = delete;

    // Arms the max-duration timer.
    void start(const std::string& connection_id, std::shared_ptr<media::ActivityTracker> activity);

    // AI finished speaking: the silence window starts now.
    void start_silence_timer(const std::string& connection_id);
    // AI started speaking: disarm, keep the retry count.
    void pause_silence_timer(const std::string& connection_id);
    // User started speaking: disarm and zero the retry count.
    void reset_silence_timer(const std::string& connection_id);

    void stop(const std::string& connection_id);

    bool contains(const std::string& connection_id) const;
    int silence_retries(const std::string& connection_id) const;
    bool silence_armed(const std::string& connection_id) const;

private:
    struct Entry {
        std::shared_ptr<media::ActivityTracker> activity;
        int retries = 0;
        utils::TimerHandle max_duration_timer;
        utils::TimerHandle silence_timer;
    };

    void arm_silence(Entry& entry, const std::string& connection_id, std::chrono::milliseconds delay);
    void handle_silence_timeout(const std::string& connection_id);
    void handle_max_duration(const std::string& connection_id);

    utils::TimerService& timers_;
    TimerListener& listener_;
    const ToolCallMonitor* tools_;
    TimerSettings settings_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Entry>> entries_;
};

}
}
