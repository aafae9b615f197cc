#include "../include/vehicle_counter.hpp"
#include "../include/crossing_detector.hpp"
#include "../include/errors.hpp"
#include <algorithm>

static std::string makeLabel(const Detection& det) {
    const std::string confidence = std::to_string(det.confidence).substr(0, 4);
    if (det.hasTrackId()) {
        return "ID:" + std::to_string(det.track_id) + " " + confidence;
    }
    return "Vehicle " + confidence;
}

VehicleCounter::VehicleCounter(const CounterConfig& config, ILogger* logger)
    : config_(config),
      logger_(logger ? logger : &defaultLogger()),
      events_(config.event_dedup_window_seconds, static_cast<float>(config.event_dedup_distance_px)),
      roi_(config.roi_margin_ratio, config.roi_polygon) {
    validateOptions(config_);
    if (!config_.lines.empty()) {
        configure(0, config_.lines);
    }
}

void VehicleCounter::configure(int frame_height, const std::vector<LineSpec>& specs) {
    std::lock_guard<std::mutex> lock(mutex_);

    const bool was_placed = registry_.isResolved();
    const bool moved = registry_.configure(frame_height, specs);
    config_.lines = specs;

    if (moved) {
        // Positions sampled against the old lines would produce phantom crossings
        tracks_.clear();
        events_.clear();
        logger_->log(ILogger::Severity::kINFO, "Counting lines moved, track history cleared");
    }
    for (const auto& name : registry_.counterNames()) {
        counters_.declare(name);
    }
    if (registry_.isResolved() && (moved || !was_placed)) {
        logLinePlacement();
    }
}

void VehicleCounter::placeLines(int frame_height) {
    registry_.resolve(frame_height);
    logLinePlacement();
}

void VehicleCounter::logLinePlacement() {
    for (const auto& line : registry_.lines()) {
        logger_->log(ILogger::Severity::kINFO,
                     "Counting line '" + line.name + "' set at y=" + std::to_string(line.position_y));
    }
}

FrameResult VehicleCounter::process(const std::vector<Detection>& detections,
                                    const cv::Size& frame_size) {
    return process(detections, frame_size, Clock::now());
}

FrameResult VehicleCounter::process(const std::vector<Detection>& detections,
                                    const cv::Size& frame_size, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!registry_.hasSpecs()) {
        throw NotConfiguredError("process() called before configure()");
    }
    if (!registry_.isResolved()) {
        placeLines(frame_size.height);
    }

    // Eviction first: an id returning after the timeout must start as a new track
    const size_t evicted =
        tracks_.evictStale(now, std::chrono::duration<double>(config_.track_timeout_seconds));
    events_.prune(now);
    if (evicted > 0) {
        logger_->log(ILogger::Severity::kVERBOSE, "Evicted " + std::to_string(evicted) + " stale track(s)");
    }

    bool tracked = config_.mode == CountingMode::kTracked;
    if (config_.mode == CountingMode::kAuto) {
        tracked = std::any_of(detections.begin(), detections.end(),
                              [](const Detection& det) { return det.hasTrackId(); });
    }

    FrameResult result;
    result.annotations.reserve(detections.size());
    for (size_t i = 0; i < detections.size(); ++i) {
        const Detection& det = detections[i];

        std::string reason;
        if (!isWellFormed(det, &reason)) {
            logger_->log(ILogger::Severity::kWARNING,
                         "Skipping detection #" + std::to_string(i) + ": " + reason);
            continue;
        }

        DrawHint hint;
        hint.box = det.box();
        hint.center = det.center();
        hint.track_id = det.track_id;
        hint.label = makeLabel(det);
        hint.eligible = isAdmissible(det) && roi_.isEligible(hint.center, frame_size);

        if (tracked) {
            // Detections without an identity are only drawn in tracked mode
            if (det.hasTrackId()) {
                if (hint.eligible) {
                    countTracked(det, hint.center, now, hint);
                } else {
                    hint.counted = tracks_.isCounted(det.track_id);
                }
            }
        } else if (hint.eligible) {
            countUntracked(hint.center, frame_size, now, hint);
        }

        result.annotations.push_back(hint);
    }

    result.counts = counters_.snapshot();
    result.lines = lineHints();
    return result;
}

bool VehicleCounter::isAdmissible(const Detection& det) const {
    if (det.confidence < config_.min_confidence) return false;
    if (!config_.eligible_class_ids.empty() &&
        config_.eligible_class_ids.find(det.class_id) == config_.eligible_class_ids.end()) {
        return false;
    }
    return true;
}

void VehicleCounter::countTracked(const Detection& det, const cv::Point2f& center, Timestamp now,
                                  DrawHint& hint) {
    cv::Point2f previous;
    const bool known = tracks_.upsert(det.track_id, center, now, &previous);
    TrackState* track = tracks_.find(det.track_id);

    // In auto mode id-less frames count through the ledger, so both sides share it
    const bool link_ledger = config_.mode == CountingMode::kAuto;
    const std::vector<CountingLine>& lines = registry_.lines();
    if (track->anchors.size() != lines.size()) {
        track->anchors.assign(lines.size(), BandAnchor());
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        const CountingLine& line = lines[i];
        BandAnchor& anchor = track->anchors[i];

        bool has_reference = known;
        float reference_y = previous.y;
        if (config_.anchor_outside_band) {
            has_reference = anchor.valid;
            reference_y = anchor.y;
        }

        CrossingDirection direction = CrossingDirection::kIncreasingY;
        if (!track->counted && has_reference &&
            detectCrossing(reference_y, center.y, line, &direction)) {
            tracks_.markCounted(det.track_id);
            if (link_ledger && events_.isDuplicate(line.name, center, now, true)) {
                // Already counted from a frame where the tracker gave no ids
                logger_->log(ILogger::Severity::kVERBOSE, "Track " + std::to_string(det.track_id) +
                                                          " matches a recent untracked count, skipped");
            } else {
                const std::string& counter = line.counterFor(direction);
                counters_.increment(counter);
                if (link_ledger) {
                    CrossingEvent event;
                    event.timestamp = now;
                    event.position = center;
                    event.line_name = line.name;
                    event.counter_name = counter;
                    event.track_id = det.track_id;
                    events_.record(event);
                }
                logCount("ID:" + std::to_string(det.track_id), counter, direction, line);
            }
        }

        if (!line.inBand(center.y)) {
            anchor.valid = true;
            anchor.y = center.y;
        }
    }

    hint.counted = track->counted;
}

void VehicleCounter::countUntracked(const cv::Point2f& center, const cv::Size& frame_size,
                                    Timestamp now, DrawHint& hint) {
    for (const auto& line : registry_.lines()) {
        // Proximity, not crossing: there is no trustworthy previous position
        if (!line.inBand(center.y)) continue;

        if (events_.isDuplicate(line.name, center, now)) {
            hint.counted = true;
            return;
        }

        CrossingEvent event;
        event.timestamp = now;
        event.position = center;
        event.line_name = line.name;
        const CrossingDirection direction = fallbackDirection(line, center.x, frame_size.width);
        event.counter_name = line.counterFor(direction);
        counters_.increment(event.counter_name);
        events_.record(event);
        hint.counted = true;
        logCount("untracked object at x=" + std::to_string(static_cast<int>(center.x)),
                 event.counter_name, direction, line);
        return;
    }
}

CrossingDirection VehicleCounter::fallbackDirection(const CountingLine& line, float x, int frame_width) const {
    CrossingDirection direction = line.fallback_direction;
    if (line.fallback_rule == FallbackRule::kHorizontalSplit && x >= frame_width * 0.5f) {
        direction = opposite(direction);
    }
    return direction;
}

void VehicleCounter::logCount(const std::string& who, const std::string& counter, CrossingDirection direction,
                              const CountingLine& line) {
    const ILogger::Severity severity = config_.debug ? ILogger::Severity::kINFO : ILogger::Severity::kVERBOSE;
    logger_->log(severity, "Vehicle " + who + " counted going " + counter + " (" + toString(direction) +
                           ") at line '" + line.name + "'. Total: " + std::to_string(counters_.total()));
}

std::vector<LineHint> VehicleCounter::lineHints() const {
    std::vector<LineHint> hints;
    for (const auto& line : registry_.lines()) {
        LineHint hint;
        hint.name = line.name;
        hint.position_y = line.position_y;
        hint.tolerance = line.tolerance;
        hints.push_back(hint);
    }
    return hints;
}

void VehicleCounter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.reset();
    tracks_.clear();
    events_.clear();
    logger_->log(ILogger::Severity::kINFO, "Counter reset");
}

CountSnapshot VehicleCounter::getCounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_.snapshot();
}

std::vector<LineHint> VehicleCounter::getLines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lineHints();
}

size_t VehicleCounter::trackCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracks_.size();
}

bool VehicleCounter::isTrackCounted(int track_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracks_.isCounted(track_id);
}

size_t VehicleCounter::pendingEventCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}
