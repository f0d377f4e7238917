#include "utils/EventLog.h"
#include <algorithm>
#include <iostream>

const char* eventCategoryName(EventCategory category) {
    switch (category) {
        case EventCategory::Build: return "build";
        case EventCategory::Rewire: return "rewire";
        case EventCategory::Sweep: return "sweep";
        case EventCategory::Converged: return "converged";
        case EventCategory::Cancelled: return "cancelled";
        case EventCategory::Metric: return "metric";
        case EventCategory::Trial: return "trial";
    }
    return "unknown";
}

void EventLog::log(EventCategory category, std::uint64_t iteration, const std::string& message) {
    if (!enabled_) return;

    TraceEvent ev{category, iteration, message};
    if (echo_) {
        std::cerr << "[TRACE] " << eventCategoryName(category) << " @" << iteration
                  << ": " << message << "\n";
    }
    if (sink_) sink_(ev);
    events_.push_back(std::move(ev));
}

std::size_t EventLog::count(EventCategory category) const {
    return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(),
        [category](const TraceEvent& e) { return e.category == category; }));
}
