#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace voice_bridge {
namespace utils {

// Runs the task on a detached thread. Exceptions are logged under the given name.
void run_async(std::function<void()> task, std::string name = "async");

// Detached work that an owner must outlive. Tasks and holds keep the group
// busy; close_and_wait() refuses new tasks and blocks until the group is idle.
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // Returns false, without running the task, once the group is closed.
    bool spawn(std::function<void()> task, std::string name = "async");

    // Keeps the group busy until the returned token is destroyed.
    std::shared_ptr<void> hold();

    void close_and_wait();
    bool closed() const;
    size_t active() const;

private:
    void release();

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    size_t active_ = 0;
    bool closed_ = false;
};

}
}
