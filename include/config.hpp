#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <set>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "line_registry.hpp"

enum class CountingMode {
    kTracked,    // count by persistent track id
    kUntracked,  // proximity to a line plus a spatio-temporal event window
    kAuto        // per frame: tracked if any detection carries an id
};

const char* toString(CountingMode mode);

struct CounterConfig {
    CountingMode mode;
    std::vector<LineSpec> lines;
    int tolerance_px;  // band for lines that do not set their own
    double track_timeout_seconds;
    double roi_margin_ratio;
    std::vector<cv::Point2f> roi_polygon;  // normalized, empty = whole frame
    double event_dedup_window_seconds;
    int event_dedup_distance_px;
    std::set<int> eligible_class_ids;  // empty = every class
    float min_confidence;
    bool anchor_outside_band;
    bool debug;

    CounterConfig()
        : mode(CountingMode::kTracked), tolerance_px(15), track_timeout_seconds(2.0),
          roi_margin_ratio(0.05), event_dedup_window_seconds(1.0), event_dedup_distance_px(50),
          min_confidence(0.3f), anchor_outside_band(false), debug(false) {}
};

// Checks every option except the lines; throws ConfigError.
void validateOptions(const CounterConfig& config);

// Reads a YAML or JSON document. Missing keys keep their defaults, `lines`
// is mandatory. Throws ConfigError on unreadable input or invalid values.
CounterConfig loadConfig(const std::string& path);
CounterConfig loadConfigFromString(const std::string& content);
CounterConfig parseConfig(const cv::FileNode& root);

#endif // CONFIG_HPP
