#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace voice_bridge {
namespace utils {

namespace detail {

struct TimerToken {
    std::mutex run_mutex;
    std::function<void()> task;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> fired{false};
    std::atomic<std::thread::id> running_thread{};
};

}

// Owning handle for one scheduled callback. Destroying or reassigning the
// handle cancels the callback; if it is already running on another thread,
// cancel() blocks until it returns.
class TimerHandle {
public:
    TimerHandle() = default;
    explicit TimerHandle(std::shared_ptr<detail::TimerToken> token);
    TimerHandle(const TimerHandle&) = delete;
    TimerHandle& operator=(const TimerHandle&) = delete;
    TimerHandle(TimerHandle&& other) noexcept;
    TimerHandle& operator=(TimerHandle&& other) noexcept;
    ~TimerHandle();

    void cancel();
    bool pending() const;

private:
    std::shared_ptr<detail::TimerToken> token_;
};

class TimerService {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~TimerService() = default;

    virtual Clock::time_point now() const = 0;
    virtual TimerHandle schedule_after(std::chrono::milliseconds delay,
                                       std::function<void()> task) = 0;

protected:
    static std::shared_ptr<detail::TimerToken> make_token(std::function<void()> task);
    static void fire(const std::shared_ptr<detail::TimerToken>& token);
};

// Single worker thread draining a deadline-ordered queue.
class Scheduler : public TimerService {
public:
    Scheduler();
    ~Scheduler() override;

    Clock::time_point now() const override;
    TimerHandle schedule_after(std::chrono::milliseconds delay,
                               std::function<void()> task) override;
    void stop();

private:
    void run_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<Clock::time_point, std::shared_ptr<detail::TimerToken>> queue_;
    bool stopping_ = false;
    std::thread worker_;
};

}
}
