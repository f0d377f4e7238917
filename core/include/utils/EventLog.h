#ifndef CAVESIM_EVENT_LOG_H
#define CAVESIM_EVENT_LOG_H

#include <cstdint>
#include <functional>
#include <utility>
#include <string>
#include <vector>

enum class EventCategory : std::uint8_t {
    Build = 0,
    Rewire = 1,
    Sweep = 2,
    Converged = 3,
    Cancelled = 4,
    Metric = 5,
    Trial = 6
};

const char* eventCategoryName(EventCategory category);

struct TraceEvent {
    EventCategory category = EventCategory::Build;
    std::uint64_t iteration = 0;
    std::string message;
};

/**
 * Optional structured trace of a run. Disabled by default: log() is a no-op
 * until enable(true). When enabled, events are kept in memory, forwarded to
 * the sink if one is set, and echoed to stderr when echo is on.
 */
class EventLog {
public:
    using Sink = std::function<void(const TraceEvent&)>;

    void enable(bool on) { enabled_ = on; }
    bool enabled() const { return enabled_; }
    void setEcho(bool on) { echo_ = on; }
    void setSink(Sink sink) { sink_ = std::move(sink); }

    void log(EventCategory category, std::uint64_t iteration, const std::string& message);

    const std::vector<TraceEvent>& events() const { return events_; }
    std::size_t count(EventCategory category) const;
    void clear() { events_.clear(); }

private:
    bool enabled_ = false;
    bool echo_ = false;
    Sink sink_;
    std::vector<TraceEvent> events_;
};

#endif // CAVESIM_EVENT_LOG_H
