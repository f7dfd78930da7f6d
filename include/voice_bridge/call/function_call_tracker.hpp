#pragma once

#include <map>
#include <mutex>
#include <string>

namespace voice_bridge {
namespace call {

class ToolCallMonitor {
public:
    virtual ~ToolCallMonitor() = default;

    virtual bool is_call_in_flight(const std::string& connection_id) const = 0;
};

// Counts tool invocations that are waiting for a result. A call counts as
// in flight for as long as its Guard is alive.
class FunctionCallTracker : public ToolCallMonitor {
public:
    class Guard {
    public:
        Guard() = default;
        Guard(FunctionCallTracker* tracker, std::string connection_id);
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        ~Guard();

        void release();

    private:
        FunctionCallTracker* tracker_ = nullptr;
        std::string connection_id_;
    };

    Guard begin(const std::string& connection_id);

    bool is_call_in_flight(const std::string& connection_id) const override;
    int in_flight(const std::string& connection_id) const;

private:
    void finish(const std::string& connection_id);

    mutable std::mutex mutex_;
    std::map<std::string, int> counts_;
};

}
}
