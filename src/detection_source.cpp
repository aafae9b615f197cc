#include "../include/detection_source.hpp"

static bool isNumber(const cv::FileNode& node) {
    return node.isInt() || node.isReal();
}

static double numberOr(const cv::FileNode& node, double default_value) {
    return isNumber(node) ? static_cast<double>(node) : default_value;
}

DetectionReplay::DetectionReplay(ILogger* logger)
    : logger_(logger ? logger : &defaultLogger()), fps_(30.0), cursor_(0) {
}

bool DetectionReplay::open(const std::string& path) {
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            logger_->log(ILogger::Severity::kERROR, "Cannot open detection file " + path);
            return false;
        }
        return load(fs, path);
    } catch (const cv::Exception& e) {
        logger_->log(ILogger::Severity::kERROR, "Cannot parse " + path + ": " + e.what());
        return false;
    }
}

bool DetectionReplay::openFromString(const std::string& content) {
    try {
        cv::FileStorage fs(content, cv::FileStorage::READ | cv::FileStorage::MEMORY);
        if (!fs.isOpened()) {
            logger_->log(ILogger::Severity::kERROR, "Cannot read in-memory detections");
            return false;
        }
        return load(fs, "<memory>");
    } catch (const cv::Exception& e) {
        logger_->log(ILogger::Severity::kERROR, std::string("Cannot parse detections: ") + e.what());
        return false;
    }
}

bool DetectionReplay::load(const cv::FileStorage& fs, const std::string& origin) {
    frames_.clear();
    cursor_ = 0;

    frame_size_ = cv::Size(static_cast<int>(numberOr(fs["frame_width"], 0)),
                           static_cast<int>(numberOr(fs["frame_height"], 0)));
    fps_ = numberOr(fs["fps"], 30.0);
    if (fps_ <= 0) fps_ = 30.0;

    const cv::FileNode frames = fs["frames"];
    if (!frames.isSeq()) {
        logger_->log(ILogger::Severity::kERROR, origin + ": 'frames' list is missing");
        return false;
    }

    int index = 0;
    for (const auto& node : frames) {
        FrameDetections frame;
        frame.index = index;
        frame.timestamp_seconds = numberOr(node["timestamp"], index / fps_);

        const cv::FileNode detections = node["detections"];
        if (detections.isSeq()) {
            for (const auto& item : detections) {
                Detection det;
                if (parseDetection(item, index, det)) {
                    frame.detections.push_back(det);
                }
            }
        }
        frames_.push_back(frame);
        ++index;
    }
    return true;
}

bool DetectionReplay::parseDetection(const cv::FileNode& node, int frame_index, Detection& det) {
    const cv::FileNode box = node["box"];
    if (!box.isSeq() || box.size() != 4 ||
        !isNumber(box[0]) || !isNumber(box[1]) || !isNumber(box[2]) || !isNumber(box[3])) {
        logger_->log(ILogger::Severity::kWARNING,
                     "Frame " + std::to_string(frame_index) + ": detection without a valid box skipped");
        return false;
    }

    det.x1 = static_cast<float>(static_cast<double>(box[0]));
    det.y1 = static_cast<float>(static_cast<double>(box[1]));
    det.x2 = static_cast<float>(static_cast<double>(box[2]));
    det.y2 = static_cast<float>(static_cast<double>(box[3]));
    det.confidence = static_cast<float>(numberOr(node["confidence"], 1.0));
    det.class_id = node["class_id"].isInt() ? static_cast<int>(node["class_id"]) : 0;
    det.track_id = node["track_id"].isInt() ? static_cast<int>(node["track_id"]) : kNoTrackId;
    return true;
}

FrameStatus DetectionReplay::next(FrameDetections& frame) {
    if (cursor_ >= frames_.size()) {
        return FrameStatus::kEndOfStream;
    }
    frame = frames_[cursor_++];
    return FrameStatus::kFrame;
}
