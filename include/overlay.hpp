#ifndef OVERLAY_HPP
#define OVERLAY_HPP

#include <opencv2/core.hpp>
#include "common.hpp"

// Draws lines, tolerance bands, boxes and the counter panel for one
// processed frame. Pure presentation: reads FrameResult only.
void drawOverlay(cv::Mat& img, const FrameResult& result, bool draw_bands = true);

#endif // OVERLAY_HPP
