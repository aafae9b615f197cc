#ifndef EVENT_LEDGER_HPP
#define EVENT_LEDGER_HPP

#include <chrono>
#include <deque>
#include <string>
#include <opencv2/core.hpp>
#include "common.hpp"

struct CrossingEvent {
    Timestamp timestamp;
    cv::Point2f position;
    std::string line_name;
    std::string counter_name;
    int track_id;  // kNoTrackId for counts made without an identity

    CrossingEvent() : track_id(kNoTrackId) {}
};

// Short-lived record of recent counts, used to suppress repeated
// detections of the same object lingering inside a line's band. In auto
// mode tracked counts are recorded too, so a car whose ids drop out for a
// few frames is not counted a second time.
class EventLedger {
public:
    EventLedger(double window_seconds, float distance_px);

    // True if an event on the same line lies within distance_px horizontally
    // and no more than window_seconds before `now`. With untracked_only set,
    // events recorded for a track id are ignored.
    bool isDuplicate(const std::string& line_name, const cv::Point2f& position, Timestamp now,
                     bool untracked_only = false) const;

    void record(const CrossingEvent& event);

    // Removes events older than the window; returns how many
    size_t prune(Timestamp now);

    void clear() { events_.clear(); }
    size_t size() const { return events_.size(); }
    const std::deque<CrossingEvent>& events() const { return events_; }

private:
    std::chrono::duration<double> window_;
    float distance_px_;
    std::deque<CrossingEvent> events_;
};

#endif // EVENT_LEDGER_HPP
