#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace voice_bridge {

class Metrics {
public:
    static Metrics& instance();

    void increment_event(const std::string& type);
    void observe_handler_time(const std::string& type, double seconds);
    void increment_frames(const std::string& direction, const std::string& outcome);
    void set_active_connections(int64_t count);
    uint64_t frame_count(const std::string& direction, const std::string& outcome) const;
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& type);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> event_totals_;
    std::map<std::pair<std::string, std::string>, uint64_t> frame_totals_;
    std::unordered_map<std::string, HistogramSeries> handler_histograms_;
    std::vector<double> histogram_bounds_;
    int64_t active_connections_ = 0;
};

}
