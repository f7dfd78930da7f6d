#include "voice_bridge/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace voice_bridge {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.0005, 0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5,
                         1.0, 2.5, 5.0, 10.0, 30.0};
}

void Metrics::increment_event(const std::string& type) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++event_totals_[type];
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& type) {
    auto& series = handler_histograms_[type];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_handler_time(const std::string& type, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(type);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

void Metrics::increment_frames(const std::string& direction, const std::string& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++frame_totals_[{direction, outcome}];
}

void Metrics::set_active_connections(int64_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_connections_ = count;
}

uint64_t Metrics::frame_count(const std::string& direction, const std::string& outcome) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = frame_totals_.find({direction, outcome});
    return it == frame_totals_.end() ? 0 : it->second;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP bridge_active_connections Connections currently bridged\n";
    out << "# TYPE bridge_active_connections gauge\n";
    out << "bridge_active_connections " << active_connections_ << "\n";

    out << "# HELP bridge_events_total Events published on the event bus\n";
    out << "# TYPE bridge_events_total counter\n";
    std::vector<std::string> types;
    types.reserve(event_totals_.size());
    for (const auto& item : event_totals_) {
        types.push_back(item.first);
    }
    std::sort(types.begin(), types.end());
    for (const auto& type : types) {
        out << "bridge_events_total{type=\"" << type << "\"} " << event_totals_.at(type) << "\n";
    }

    out << "# HELP bridge_frames_total Audio frames handled by the codec bridge\n";
    out << "# TYPE bridge_frames_total counter\n";
    for (const auto& item : frame_totals_) {
        out << "bridge_frames_total{direction=\"" << item.first.first << "\",outcome=\""
            << item.first.second << "\"} " << item.second << "\n";
    }

    out << "# HELP bridge_event_handler_seconds Time spent dispatching an event\n";
    out << "# TYPE bridge_event_handler_seconds histogram\n";
    types.clear();
    types.reserve(handler_histograms_.size());
    for (const auto& item : handler_histograms_) {
        types.push_back(item.first);
    }
    std::sort(types.begin(), types.end());
    for (const auto& type : types) {
        const auto& series = handler_histograms_.at(type);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "bridge_event_handler_seconds_bucket{type=\"" << type
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "bridge_event_handler_seconds_bucket{type=\"" << type
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "bridge_event_handler_seconds_count{type=\"" << type << "\"} "
            << series.count << "\n";
        out << "bridge_event_handler_seconds_sum{type=\"" << type << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
