#ifndef CROSSING_DETECTOR_HPP
#define CROSSING_DETECTOR_HPP

#include <opencv2/core.hpp>
#include "line_registry.hpp"

// A crossing is reported only when the two samples lie on opposite sides of
// the whole tolerance band, so jitter inside the band never registers.
// Returns false (no crossing) otherwise; `direction` is left untouched then.
bool detectCrossing(float previous_y, float current_y, const CountingLine& line,
                    CrossingDirection* direction);

// Same test with an optional previous sample; nullptr means first sighting.
bool detectCrossing(const cv::Point2f* previous, const cv::Point2f& current,
                    const CountingLine& line, CrossingDirection* direction);

#endif // CROSSING_DETECTOR_HPP
