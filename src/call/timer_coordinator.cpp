#include "voice_bridge/call/timer_coordinator.hpp"

#include <vector>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::call {

TimerCoordinator::TimerCoordinator(utils::TimerService& timers,
                                   TimerListener& listener,
                                   const ToolCallMonitor* tools,
                                   TimerSettings settings)
    : timers_(timers),
      listener_(listener),
      tools_(tools),
      settings_(settings) {
    if (settings_.max_duration.count() <= 0) {
        settings_.max_duration = std::chrono::seconds(300);
    }
}

TimerCoordinator::~TimerCoordinator() {
    std::map<std::string, std::unique_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.swap(entries_);
    }
}

void TimerCoordinator::start(const std::string& connection_id,
                             std::shared_ptr<media::ActivityTracker> activity) {
    std::unique_ptr<Entry> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = entries_[connection_id];
        previous = std::move(slot);
        slot = std::make_unique<Entry>();
        slot->activity = std::move(activity);
        slot->max_duration_timer = timers_.schedule_after(
            std::chrono::duration_cast<std::chrono::milliseconds>(settings_.max_duration),
            [this, connection_id]() { handle_max_duration(connection_id); });
    }
    logging::info("Call timers started",
                  {kv("connection_id", connection_id),
                   kv("max_duration_sec", settings_.max_duration.count()),
                   kv("silence_window_sec", settings_.silence_window.count())});
}

void TimerCoordinator::arm_silence(Entry& entry,
                                   const std::string& connection_id,
                                   std::chrono::milliseconds delay) {
    entry.silence_timer = timers_.schedule_after(
        delay, [this, connection_id]() { handle_silence_timeout(connection_id); });
}

void TimerCoordinator::start_silence_timer(const std::string& connection_id) {
    utils::TimerHandle previous;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(connection_id);
    if (it == entries_.end()) {
        return;
    }
    auto& entry = *it->second;
    entry.activity->touch(timers_.now());
    previous = std::move(entry.silence_timer);
    arm_silence(entry, connection_id,
                std::chrono::duration_cast<std::chrono::milliseconds>(settings_.silence_window));
    logging::debug("Silence timer armed",
                   {kv("connection_id", connection_id), kv("retries", entry.retries)});
}

void TimerCoordinator::pause_silence_timer(const std::string& connection_id) {
    utils::TimerHandle previous;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(connection_id);
    if (it == entries_.end()) {
        return;
    }
    previous = std::move(it->second->silence_timer);
    logging::debug("Silence timer paused",
                   {kv("connection_id", connection_id), kv("retries", it->second->retries)});
}

void TimerCoordinator::reset_silence_timer(const std::string& connection_id) {
    utils::TimerHandle previous;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(connection_id);
    if (it == entries_.end()) {
        return;
    }
    previous = std::move(it->second->silence_timer);
    it->second->retries = 0;
    logging::debug("Silence timer reset", {kv("connection_id", connection_id)});
}

void TimerCoordinator::stop(const std::string& connection_id) {
    std::unique_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(connection_id);
        if (it == entries_.end()) {
            return;
        }
        entry = std::move(it->second);
        entries_.erase(it);
    }
    logging::debug("Call timers stopped", {kv("connection_id", connection_id)});
}

bool TimerCoordinator::contains(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(connection_id) != 0;
}

int TimerCoordinator::silence_retries(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(connection_id);
    return it == entries_.end() ? 0 : it->second->retries;
}

bool TimerCoordinator::silence_armed(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(connection_id);
    return it != entries_.end() && it->second->silence_timer.pending();
}

void TimerCoordinator::handle_silence_timeout(const std::string& connection_id) {
    enum class Action { None, Prompt, Terminate } action = Action::None;
    int retry = 0;
    const auto window = std::chrono::duration_cast<std::chrono::milliseconds>(settings_.silence_window);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(connection_id);
        if (it == entries_.end()) {
            return;
        }
        auto& entry = *it->second;
        const auto idle = entry.activity->idle_for(timers_.now());

        if (idle < window) {
            logging::debug("Recent activity, silence timer re-armed",
                           {kv("connection_id", connection_id), kv("idle_ms", idle.count())});
            arm_silence(entry, connection_id, window - idle);
            return;
        }
        if (tools_ && tools_->is_call_in_flight(connection_id)) {
            logging::info("Tool call in flight, silence timer re-armed",
                          {kv("connection_id", connection_id)});
            arm_silence(entry, connection_id, window);
            return;
        }
        retry = entry.retries;
        if (retry < settings_.max_retries) {
            ++entry.retries;
            action = Action::Prompt;
            entry.activity->touch(timers_.now());
            arm_silence(entry, connection_id, window);
        } else {
            action = Action::Terminate;
        }
    }

    if (action == Action::Prompt) {
        logging::info("Silence detected, prompting caller",
                      {kv("connection_id", connection_id),
                       kv("retry", retry + 1),
                       kv("max_retries", settings_.max_retries)});
        listener_.on_inactivity_prompt(connection_id, retry, settings_.max_retries);
    } else if (action == Action::Terminate) {
        logging::info("Silence retries exhausted, ending call",
                      {kv("connection_id", connection_id), kv("retries", retry)});
        listener_.on_termination_requested(connection_id, ExitReason::Silence);
    }
}

void TimerCoordinator::handle_max_duration(const std::string& connection_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.count(connection_id) == 0) {
            return;
        }
    }
    logging::info("Max call duration reached",
                  {kv("connection_id", connection_id),
                   kv("max_duration_sec", settings_.max_duration.count())});
    listener_.on_termination_requested(connection_id, ExitReason::Timeout);
}

}
