#include "voice_bridge/utils/timer.hpp"

#include "voice_bridge/logging.hpp"

namespace voice_bridge::utils {

TimerHandle::TimerHandle(std::shared_ptr<detail::TimerToken> token)
    : token_(std::move(token)) {}

TimerHandle::TimerHandle(TimerHandle&& other) noexcept
    : token_(std::move(other.token_)) {}

TimerHandle& TimerHandle::operator=(TimerHandle&& other) noexcept {
    if (this != &other) {
        cancel();
        token_ = std::move(other.token_);
    }
    return *this;
}

TimerHandle::~TimerHandle() {
    cancel();
}

void TimerHandle::cancel() {
    if (!token_) {
        return;
    }
    auto token = std::move(token_);
    token->cancelled = true;
    if (token->running_thread.load() == std::this_thread::get_id()) {
        return;
    }
    std::lock_guard<std::mutex> lock(token->run_mutex);
    token->task = nullptr;
}

bool TimerHandle::pending() const {
    return token_ && !token_->cancelled && !token_->fired;
}

std::shared_ptr<detail::TimerToken> TimerService::make_token(std::function<void()> task) {
    auto token = std::make_shared<detail::TimerToken>();
    token->task = std::move(task);
    return token;
}

void TimerService::fire(const std::shared_ptr<detail::TimerToken>& token) {
    std::lock_guard<std::mutex> lock(token->run_mutex);
    if (token->cancelled || !token->task) {
        return;
    }
    token->fired = true;
    token->running_thread = std::this_thread::get_id();
    try {
        token->task();
    } catch (const std::exception& ex) {
        logging::error(
            "Timer callback failed",
            {kv("error", ex.what())});
    }
    token->running_thread = std::thread::id{};
    token->task = nullptr;
}

Scheduler::Scheduler() {
    worker_ = std::thread([this]() { run_loop(); });
}

Scheduler::~Scheduler() {
    stop();
}

TimerService::Clock::time_point Scheduler::now() const {
    return Clock::now();
}

TimerHandle Scheduler::schedule_after(std::chrono::milliseconds delay,
                                      std::function<void()> task) {
    auto token = make_token(std::move(task));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.emplace(Clock::now() + delay, token);
    }
    cv_.notify_one();
    return TimerHandle(token);
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

void Scheduler::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }
        const auto deadline = queue_.begin()->first;
        if (deadline > Clock::now()) {
            cv_.wait_until(lock, deadline);
            continue;
        }
        auto token = std::move(queue_.begin()->second);
        queue_.erase(queue_.begin());
        lock.unlock();
        if (!token->cancelled) {
            fire(token);
        }
        lock.lock();
    }
}

}
