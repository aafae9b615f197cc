#ifndef COMMON_HPP
#define COMMON_HPP

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;

constexpr int kNoTrackId = -1;

// One detector output for one object in one frame
struct Detection {
    float x1, y1, x2, y2;  // Bounding box in pixels
    float confidence;
    int class_id;
    int track_id;          // kNoTrackId when the detector has no identity

    Detection()
        : x1(0), y1(0), x2(0), y2(0), confidence(0), class_id(0), track_id(kNoTrackId) {}
    Detection(float x1, float y1, float x2, float y2, float confidence,
              int class_id, int track_id = kNoTrackId)
        : x1(x1), y1(y1), x2(x2), y2(y2), confidence(confidence),
          class_id(class_id), track_id(track_id) {}

    bool hasTrackId() const { return track_id >= 0; }
    cv::Point2f center() const { return cv::Point2f((x1 + x2) * 0.5f, (y1 + y2) * 0.5f); }
    cv::Rect2f box() const { return cv::Rect2f(x1, y1, x2 - x1, y2 - y1); }
};

// Rejects boxes that are empty, inverted or non-finite and confidences outside [0,1].
// On failure `reason` names the first broken field.
bool isWellFormed(const Detection& det, std::string* reason = nullptr);

struct CountSnapshot {
    std::map<std::string, int> counters;
    int total;

    CountSnapshot() : total(0) {}
};

// Per-object overlay request for the presentation layer
struct DrawHint {
    cv::Rect2f box;
    cv::Point2f center;
    std::string label;
    int track_id;
    bool eligible;  // passed class, confidence and ROI filters
    bool counted;   // this object has contributed to a counter

    DrawHint() : track_id(kNoTrackId), eligible(false), counted(false) {}
};

struct LineHint {
    std::string name;
    int position_y;
    int tolerance;
};

struct FrameResult {
    CountSnapshot counts;
    std::vector<DrawHint> annotations;
    std::vector<LineHint> lines;
};

#endif // COMMON_HPP
