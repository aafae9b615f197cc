#include "../include/crossing_detector.hpp"

bool detectCrossing(float previous_y, float current_y, const CountingLine& line,
                    CrossingDirection* direction) {
    CrossingDirection found;
    if (previous_y < line.lowerEdge() && current_y > line.upperEdge()) {
        found = CrossingDirection::kIncreasingY;
    } else if (previous_y > line.upperEdge() && current_y < line.lowerEdge()) {
        found = CrossingDirection::kDecreasingY;
    } else {
        return false;
    }
    if (direction) *direction = found;
    return true;
}

bool detectCrossing(const cv::Point2f* previous, const cv::Point2f& current,
                    const CountingLine& line, CrossingDirection* direction) {
    if (!previous) return false;
    return detectCrossing(previous->y, current.y, line, direction);
}
