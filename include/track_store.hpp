#ifndef TRACK_STORE_HPP
#define TRACK_STORE_HPP

#include <chrono>
#include <map>
#include <vector>
#include <opencv2/core.hpp>
#include "common.hpp"

// Last position of a track outside one line's tolerance band
struct BandAnchor {
    bool valid;
    float y;

    BandAnchor() : valid(false), y(0) {}
};

struct TrackState {
    int id;
    cv::Point2f last_center;
    bool counted;  // global: once counted at any line, never again
    Timestamp last_seen;
    std::vector<BandAnchor> anchors;  // indexed like LineRegistry::lines()

    TrackState(int id, const cv::Point2f& center, Timestamp seen)
        : id(id), last_center(center), counted(false), last_seen(seen) {}
};

class TrackStore {
public:
    TrackStore() {}

    // Records a sighting. Returns true and writes the position from the
    // previous sighting into `previous` if the track was already known,
    // false on a first sighting.
    bool upsert(int track_id, const cv::Point2f& position, Timestamp time,
                cv::Point2f* previous = nullptr);

    void markCounted(int track_id);
    bool isCounted(int track_id) const;

    // Drops every track with now - last_seen > timeout; returns how many
    size_t evictStale(Timestamp now, std::chrono::duration<double> timeout);

    TrackState* find(int track_id);
    const TrackState* find(int track_id) const;

    void clear() { tracks_.clear(); }
    size_t size() const { return tracks_.size(); }
    bool empty() const { return tracks_.empty(); }

private:
    std::map<int, TrackState> tracks_;
};

#endif // TRACK_STORE_HPP
