#ifndef VEHICLE_COUNTER_HPP
#define VEHICLE_COUNTER_HPP

#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "common.hpp"
#include "config.hpp"
#include "counters.hpp"
#include "event_ledger.hpp"
#include "line_registry.hpp"
#include "logging.h"
#include "roi_filter.hpp"
#include "track_store.hpp"

// One counting session: turns per-frame detections into directional counts
// at the configured lines.
//
// All public members lock the same mutex, so reset() never interleaves with
// a partially applied frame. Feeding frames from several threads at once is
// still meaningless for counting and is not supported.
//
// The logger is called with the mutex held, so it sees messages in frame
// order and needs no locking of its own. It must not call back into the
// session.
//
// In auto mode tracked and id-less frames share one event ledger, so a car
// is not counted again while the tracker drops its id near the line.
//
// Track ids the detector reuses after eviction start over as new, uncounted
// tracks. That can produce an extra count (or lose one) around the timeout
// boundary and is accepted.
class VehicleCounter {
public:
    // Lines in `config` are optional here; they are held until the first
    // frame reveals the frame height. Throws ConfigError on invalid options.
    explicit VehicleCounter(const CounterConfig& config = CounterConfig(), ILogger* logger = nullptr);

    // Places the lines at round(frame_height * ratio). frame_height <= 0
    // defers placement to the first processed frame. Moving a line that is
    // already placed discards all track history and pending events; repeating
    // the same configuration changes nothing.
    void configure(int frame_height, const std::vector<LineSpec>& specs);
    void configure(const std::vector<LineSpec>& specs) { configure(0, specs); }

    // Processes one frame. Throws NotConfiguredError if no lines were given
    // or they cannot be placed yet.
    FrameResult process(const std::vector<Detection>& detections, const cv::Size& frame_size);
    FrameResult process(const std::vector<Detection>& detections, const cv::Size& frame_size,
                        Timestamp now);

    // Zeroes every counter and forgets all tracks and events
    void reset();

    CountSnapshot getCounts() const;
    std::vector<LineHint> getLines() const;

    size_t trackCount() const;
    bool isTrackCounted(int track_id) const;
    size_t pendingEventCount() const;
    CountingMode mode() const { return config_.mode; }

private:
    mutable std::mutex mutex_;
    CounterConfig config_;
    ILogger* logger_;
    LineRegistry registry_;
    TrackStore tracks_;
    EventLedger events_;
    Counters counters_;
    RoiFilter roi_;

    // Helpers below expect mutex_ to be held
    void placeLines(int frame_height);
    void logLinePlacement();
    bool isAdmissible(const Detection& det) const;
    void countTracked(const Detection& det, const cv::Point2f& center, Timestamp now, DrawHint& hint);
    void countUntracked(const cv::Point2f& center, const cv::Size& frame_size, Timestamp now,
                        DrawHint& hint);
    CrossingDirection fallbackDirection(const CountingLine& line, float x, int frame_width) const;
    std::vector<LineHint> lineHints() const;
    void logCount(const std::string& who, const std::string& counter, CrossingDirection direction,
                  const CountingLine& line);
};

#endif // VEHICLE_COUNTER_HPP
