#include "../include/event_ledger.hpp"
#include <cmath>

EventLedger::EventLedger(double window_seconds, float distance_px)
    : window_(window_seconds), distance_px_(distance_px) {
}

bool EventLedger::isDuplicate(const std::string& line_name, const cv::Point2f& position,
                              Timestamp now, bool untracked_only) const {
    for (const auto& event : events_) {
        if (event.line_name != line_name) continue;
        if (untracked_only && event.track_id != kNoTrackId) continue;
        if (now - event.timestamp > window_) continue;
        if (std::fabs(event.position.x - position.x) <= distance_px_) {
            return true;
        }
    }
    return false;
}

void EventLedger::record(const CrossingEvent& event) {
    events_.push_back(event);
}

size_t EventLedger::prune(Timestamp now) {
    size_t removed = 0;
    // Appended in time order, so stale events sit at the front
    while (!events_.empty() && now - events_.front().timestamp > window_) {
        events_.pop_front();
        ++removed;
    }
    return removed;
}
