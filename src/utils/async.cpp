#include "voice_bridge/utils/async.hpp"

#include <system_error>
#include <thread>

#include "voice_bridge/logging.hpp"


namespace voice_bridge::utils {

void run_async(std::function<void()> task, std::string name) {
    std::thread worker([task = std::move(task), name = std::move(name)]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error(
                "Async task failed",
                {kv("task", name),
                 kv("error", ex.what())});
        }
    });
    worker.detach();
}

TaskGroup::~TaskGroup() {
    close_and_wait();
}

bool TaskGroup::spawn(std::function<void()> task, std::string name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            logging::debug("Async task refused, group closed", {kv("task", name)});
            return false;
        }
        ++active_;
    }
    try {
        run_async([this, task = std::move(task)]() {
            struct Release {
                TaskGroup* group;
                ~Release() { group->release(); }
            } release{this};
            task();
        }, std::move(name));
    } catch (const std::system_error&) {
        release();
        throw;
    }
    return true;
}

std::shared_ptr<void> TaskGroup::hold() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++active_;
    }
    return std::shared_ptr<void>(nullptr, [this](void*) { release(); });
}

void TaskGroup::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (--active_ == 0) {
        idle_.notify_all();
    }
}

void TaskGroup::close_and_wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_ = true;
    idle_.wait(lock, [this]() { return active_ == 0; });
}

bool TaskGroup::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t TaskGroup::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

}
