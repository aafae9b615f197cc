#ifndef ROI_FILTER_HPP
#define ROI_FILTER_HPP

#include <vector>
#include <opencv2/core.hpp>

// Decides which object centers may take part in counting. A margin along
// every frame edge is excluded so partially visible objects entering or
// leaving the frame are ignored; an optional polygon (normalized 0-1
// coordinates) narrows the area further.
class RoiFilter {
public:
    // Throws ConfigError if margin_ratio is outside [0, 0.5) or a non-empty
    // polygon has fewer than three vertices.
    explicit RoiFilter(double margin_ratio = 0.05,
                       const std::vector<cv::Point2f>& polygon = std::vector<cv::Point2f>());

    bool isEligible(float x, float y, int frame_width, int frame_height) const;
    bool isEligible(const cv::Point2f& center, const cv::Size& frame_size) const {
        return isEligible(center.x, center.y, frame_size.width, frame_size.height);
    }

    double marginRatio() const { return margin_ratio_; }

private:
    double margin_ratio_;
    std::vector<cv::Point2f> polygon_;
};

#endif // ROI_FILTER_HPP
