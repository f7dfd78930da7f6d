#include "voice_bridge/call/function_call_tracker.hpp"

namespace voice_bridge::call {

FunctionCallTracker::Guard::Guard(FunctionCallTracker* tracker, std::string connection_id)
    : tracker_(tracker),
      connection_id_(std::move(connection_id)) {}

FunctionCallTracker::Guard::Guard(Guard&& other) noexcept
    : tracker_(other.tracker_),
      connection_id_(std::move(other.connection_id_)) {
    other.tracker_ = nullptr;
}

FunctionCallTracker::Guard& FunctionCallTracker::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        tracker_ = other.tracker_;
        connection_id_ = std::move(other.connection_id_);
        other.tracker_ = nullptr;
    }
    return *this;
}

FunctionCallTracker::Guard::~Guard() {
    release();
}

void FunctionCallTracker::Guard::release() {
    if (tracker_) {
        tracker_->finish(connection_id_);
        tracker_ = nullptr;
    }
}

FunctionCallTracker::Guard FunctionCallTracker::begin(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[connection_id];
    return Guard(this, connection_id);
}

bool FunctionCallTracker::is_call_in_flight(const std::string& connection_id) const {
    return in_flight(connection_id) > 0;
}

int FunctionCallTracker::in_flight(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counts_.find(connection_id);
    return it == counts_.end() ? 0 : it->second;
}

void FunctionCallTracker::finish(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counts_.find(connection_id);
    if (it == counts_.end()) {
        return;
    }
    if (--it->second <= 0) {
        counts_.erase(it);
    }
}

}
