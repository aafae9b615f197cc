#include "../include/track_store.hpp"

bool TrackStore::upsert(int track_id, const cv::Point2f& position, Timestamp time,
                        cv::Point2f* previous) {
    auto it = tracks_.find(track_id);
    if (it == tracks_.end()) {
        tracks_.emplace(track_id, TrackState(track_id, position, time));
        return false;
    }

    TrackState& track = it->second;
    if (previous) *previous = track.last_center;
    track.last_center = position;
    track.last_seen = time;
    return true;
}

void TrackStore::markCounted(int track_id) {
    auto it = tracks_.find(track_id);
    if (it != tracks_.end()) {
        it->second.counted = true;
    }
}

bool TrackStore::isCounted(int track_id) const {
    auto it = tracks_.find(track_id);
    return it != tracks_.end() && it->second.counted;
}

size_t TrackStore::evictStale(Timestamp now, std::chrono::duration<double> timeout) {
    size_t removed = 0;
    for (auto it = tracks_.begin(); it != tracks_.end();) {
        if (now - it->second.last_seen > timeout) {
            it = tracks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

TrackState* TrackStore::find(int track_id) {
    auto it = tracks_.find(track_id);
    return it == tracks_.end() ? nullptr : &it->second;
}

const TrackState* TrackStore::find(int track_id) const {
    auto it = tracks_.find(track_id);
    return it == tracks_.end() ? nullptr : &it->second;
}
