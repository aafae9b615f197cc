#include "../include/roi_filter.hpp"
#include "../include/errors.hpp"
#include <opencv2/imgproc.hpp>
#include <string>

RoiFilter::RoiFilter(double margin_ratio, const std::vector<cv::Point2f>& polygon)
    : margin_ratio_(margin_ratio), polygon_(polygon) {
    if (!(margin_ratio >= 0.0 && margin_ratio < 0.5)) {
        throw ConfigError("roi_margin_ratio " + std::to_string(margin_ratio) + " is outside [0, 0.5)");
    }
    if (!polygon_.empty() && polygon_.size() < 3) {
        throw ConfigError("roi_polygon needs at least 3 points");
    }
}

bool RoiFilter::isEligible(float x, float y, int frame_width, int frame_height) const {
    if (frame_width <= 0 || frame_height <= 0) return false;

    const double margin_x = frame_width * margin_ratio_;
    const double margin_y = frame_height * margin_ratio_;
    if (x < margin_x || x > frame_width - margin_x ||
        y < margin_y || y > frame_height - margin_y) {
        return false;
    }

    if (!polygon_.empty()) {
        cv::Point2f normalized(x / frame_width, y / frame_height);
        // >= 0: inside or on the edge
        if (cv::pointPolygonTest(polygon_, normalized, false) < 0) {
            return false;
        }
    }
    return true;
}
