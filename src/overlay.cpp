#include "../include/overlay.hpp"
#include <opencv2/imgproc.hpp>

void drawOverlay(cv::Mat& img, const FrameResult& result, bool draw_bands) {
    if (img.empty()) return;

    // Counting lines, with the band edges as thin lines
    const cv::Scalar green(0, 255, 0);
    for (const auto& line : result.lines) {
        cv::line(img, cv::Point(0, line.position_y), cv::Point(img.cols, line.position_y), green, 3);
        if (draw_bands && line.tolerance > 0) {
            cv::line(img, cv::Point(0, line.position_y - line.tolerance),
                     cv::Point(img.cols, line.position_y - line.tolerance), green, 1);
            cv::line(img, cv::Point(0, line.position_y + line.tolerance),
                     cv::Point(img.cols, line.position_y + line.tolerance), green, 1);
        }
        cv::putText(img, line.name, cv::Point(10, line.position_y - 10),
                    cv::FONT_HERSHEY_SIMPLEX, 0.7, green, 2);
    }

    // Counted objects in orange, ignored ones in grey
    const cv::Scalar blue(255, 0, 0), orange(0, 165, 255), grey(128, 128, 128), red(0, 0, 255);
    for (const auto& hint : result.annotations) {
        const cv::Scalar color = hint.counted ? orange : (hint.eligible ? blue : grey);
        cv::Rect rect(cvRound(hint.box.x), cvRound(hint.box.y),
                      cvRound(hint.box.width), cvRound(hint.box.height));
        cv::rectangle(img, rect, color, 2);

        int baseline = 0;
        cv::Size text_size = cv::getTextSize(hint.label, cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);
        cv::rectangle(img, cv::Point(rect.x, rect.y - text_size.height - 5),
                      cv::Point(rect.x + text_size.width, rect.y), color, -1);
        cv::putText(img, hint.label, cv::Point(rect.x, rect.y - 5),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 0), 1);

        cv::circle(img, cv::Point(cvRound(hint.center.x), cvRound(hint.center.y)), 5, red, -1);
    }

    // Counter panel (top left), one row per counter plus the total
    const int text_y = 30, text_height = 25;
    const int rows = static_cast<int>(result.counts.counters.size()) + 1;
    cv::Mat overlay = img.clone();
    cv::rectangle(overlay, cv::Point(10, 10), cv::Point(300, text_y + text_height * rows),
                  cv::Scalar(0, 0, 0), -1);
    cv::addWeighted(overlay, 0.7, img, 0.3, 0, img);

    cv::putText(img, "Total: " + std::to_string(result.counts.total), cv::Point(20, text_y),
                cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(0, 255, 255), 2);
    int row = 1;
    for (const auto& counter : result.counts.counters) {
        cv::putText(img, counter.first + ": " + std::to_string(counter.second),
                    cv::Point(20, text_y + text_height * row), cv::FONT_HERSHEY_SIMPLEX, 0.7, green, 2);
        ++row;
    }
}
