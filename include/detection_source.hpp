#ifndef DETECTION_SOURCE_HPP
#define DETECTION_SOURCE_HPP

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "common.hpp"
#include "logging.h"

enum class FrameStatus {
    kFrame,       // `frame` holds the next batch
    kEndOfStream  // no more frames; not an error
};

struct FrameDetections {
    int index;
    double timestamp_seconds;  // relative to the start of the stream
    std::vector<Detection> detections;

    FrameDetections() : index(0), timestamp_seconds(0.0) {}
};

// Supplier of per-frame detections, e.g. a live detector or a recording
class DetectionSource {
public:
    virtual ~DetectionSource() {}
    virtual FrameStatus next(FrameDetections& frame) = 0;
    virtual cv::Size frameSize() const = 0;
};

// Replays detections recorded in a YAML/JSON document:
//
//   frame_width: 640
//   frame_height: 480
//   fps: 30
//   frames:
//     - timestamp: 0.0
//       detections:
//         - { box: [x1, y1, x2, y2], confidence: 0.9, class_id: 2, track_id: 1 }
//
// A detection without a usable `box` is dropped with a warning; the rest of
// its frame is kept.
class DetectionReplay : public DetectionSource {
public:
    explicit DetectionReplay(ILogger* logger = nullptr);

    bool open(const std::string& path);
    bool openFromString(const std::string& content);

    FrameStatus next(FrameDetections& frame) override;
    cv::Size frameSize() const override { return frame_size_; }

    double fps() const { return fps_; }
    int frameCount() const { return static_cast<int>(frames_.size()); }
    void rewind() { cursor_ = 0; }

private:
    ILogger* logger_;
    cv::Size frame_size_;
    double fps_;
    std::vector<FrameDetections> frames_;
    size_t cursor_;

    bool load(const cv::FileStorage& fs, const std::string& origin);
    bool parseDetection(const cv::FileNode& node, int frame_index, Detection& det);
};

#endif // DETECTION_SOURCE_HPP
