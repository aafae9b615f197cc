#include "../include/config.hpp"
#include "../include/errors.hpp"

const char* toString(CountingMode mode) {
    switch (mode) {
        case CountingMode::kTracked:   return "tracked";
        case CountingMode::kUntracked: return "untracked";
        case CountingMode::kAuto:      return "auto";
    }
    return "unknown";
}

static std::string readString(const cv::FileNode& node, const std::string& key,
                              const std::string& default_value) {
    const cv::FileNode value = node[key];
    if (value.empty() || value.isNone()) return default_value;
    if (!value.isString()) {
        throw ConfigError("'" + key + "' must be a string");
    }
    return static_cast<std::string>(value);
}

static double readNumber(const cv::FileNode& node, const std::string& key, double default_value) {
    const cv::FileNode value = node[key];
    if (value.empty() || value.isNone()) return default_value;
    if (!value.isReal() && !value.isInt()) {
        throw ConfigError("'" + key + "' must be a number");
    }
    return static_cast<double>(value);
}

static double readListNumber(const cv::FileNode& value, const std::string& what) {
    if (!value.isReal() && !value.isInt()) {
        throw ConfigError(what + " must be a number");
    }
    return static_cast<double>(value);
}

static int readInt(const cv::FileNode& node, const std::string& key, int default_value) {
    const cv::FileNode value = node[key];
    if (value.empty() || value.isNone()) return default_value;
    if (!value.isInt()) {
        throw ConfigError("'" + key + "' must be an integer");
    }
    return static_cast<int>(value);
}

static CrossingDirection parseDirection(const std::string& text) {
    if (text == "increasing_y") return CrossingDirection::kIncreasingY;
    if (text == "decreasing_y") return CrossingDirection::kDecreasingY;
    throw ConfigError("unknown direction '" + text + "' (expected increasing_y or decreasing_y)");
}

static FallbackRule parseFallbackRule(const std::string& text) {
    if (text == "default") return FallbackRule::kDefaultDirection;
    if (text == "horizontal") return FallbackRule::kHorizontalSplit;
    throw ConfigError("unknown fallback_rule '" + text + "' (expected default or horizontal)");
}

static CountingMode parseMode(const std::string& text) {
    if (text == "tracked") return CountingMode::kTracked;
    if (text == "untracked") return CountingMode::kUntracked;
    if (text == "auto") return CountingMode::kAuto;
    throw ConfigError("unknown mode '" + text + "' (expected tracked, untracked or auto)");
}

static LineSpec parseLine(const cv::FileNode& node, size_t index, int default_tolerance) {
    if (!node.isMap()) {
        throw ConfigError("lines[" + std::to_string(index) + "] must be a mapping");
    }
    if (node["ratio"].empty()) {
        throw ConfigError("lines[" + std::to_string(index) + "] has no ratio");
    }

    LineSpec spec;
    spec.name = readString(node, "name", "line_" + std::to_string(index + 1));
    spec.ratio = static_cast<float>(readNumber(node, "ratio", 0.5));
    spec.tolerance = readInt(node, "tolerance_px", default_tolerance);
    spec.increasing_counter = readString(node, "increasing_y", "down");
    spec.decreasing_counter = readString(node, "decreasing_y", "up");
    spec.fallback_rule = parseFallbackRule(readString(node, "fallback_rule", "default"));
    spec.fallback_direction = parseDirection(readString(node, "fallback_direction", "increasing_y"));
    return spec;
}

static LineSpec lineFromRatio(double ratio, size_t index, int tolerance) {
    LineSpec spec;
    spec.name = "line_" + std::to_string(index + 1);
    spec.ratio = static_cast<float>(ratio);
    spec.tolerance = tolerance;
    return spec;
}

CounterConfig parseConfig(const cv::FileNode& root) {
    if (!root.isMap()) {
        throw ConfigError("configuration root must be a mapping");
    }

    CounterConfig config;
    config.mode = parseMode(readString(root, "mode", toString(config.mode)));
    config.tolerance_px = readInt(root, "tolerance_px", config.tolerance_px);
    config.track_timeout_seconds = readNumber(root, "track_timeout_seconds", config.track_timeout_seconds);
    config.roi_margin_ratio = readNumber(root, "roi_margin_ratio", config.roi_margin_ratio);
    config.event_dedup_window_seconds =
        readNumber(root, "event_dedup_window_seconds", config.event_dedup_window_seconds);
    config.event_dedup_distance_px = readInt(root, "event_dedup_distance_px", config.event_dedup_distance_px);
    config.min_confidence = static_cast<float>(readNumber(root, "min_confidence", config.min_confidence));
    config.anchor_outside_band = readInt(root, "anchor_outside_band", 0) != 0;
    config.debug = readInt(root, "debug", 0) != 0;

    const cv::FileNode classes = root["eligible_class_ids"];
    if (!classes.empty() && !classes.isNone()) {
        if (!classes.isSeq()) throw ConfigError("'eligible_class_ids' must be a list");
        for (const auto& id : classes) {
            if (!id.isInt()) throw ConfigError("'eligible_class_ids' entries must be integers");
            config.eligible_class_ids.insert(static_cast<int>(id));
        }
    }

    const cv::FileNode polygon = root["roi_polygon"];
    if (!polygon.empty() && !polygon.isNone()) {
        if (!polygon.isSeq()) throw ConfigError("'roi_polygon' must be a list of [x, y] points");
        for (const auto& point : polygon) {
            if (!point.isSeq() || point.size() != 2) {
                throw ConfigError("'roi_polygon' points must be [x, y] pairs");
            }
            config.roi_polygon.emplace_back(
                static_cast<float>(readListNumber(point[0], "'roi_polygon' coordinates")),
                static_cast<float>(readListNumber(point[1], "'roi_polygon' coordinates")));
        }
    }

    const cv::FileNode lines = root["lines"];
    if (!lines.empty() && !lines.isNone()) {
        if (!lines.isSeq()) throw ConfigError("'lines' must be a list");
        size_t index = 0;
        for (const auto& line : lines) {
            config.lines.push_back(parseLine(line, index++, config.tolerance_px));
        }
    } else if (!root["line_ratios"].empty()) {
        const cv::FileNode ratios = root["line_ratios"];
        if (!ratios.isSeq()) throw ConfigError("'line_ratios' must be a list");
        size_t index = 0;
        for (const auto& ratio : ratios) {
            const double value = readListNumber(ratio, "'line_ratios' entries");
            config.lines.push_back(lineFromRatio(value, index++, config.tolerance_px));
        }
    } else if (!root["line_ratio"].empty()) {
        config.lines.push_back(lineFromRatio(readNumber(root, "line_ratio", 0.5), 0, config.tolerance_px));
    }

    LineRegistry::validate(config.lines);
    validateOptions(config);
    return config;
}

void validateOptions(const CounterConfig& config) {
    if (config.tolerance_px < 0) {
        throw ConfigError("tolerance_px must not be negative");
    }
    if (!(config.track_timeout_seconds > 0.0)) {
        throw ConfigError("track_timeout_seconds must be positive");
    }
    if (!(config.roi_margin_ratio >= 0.0 && config.roi_margin_ratio < 0.5)) {
        throw ConfigError("roi_margin_ratio " + std::to_string(config.roi_margin_ratio) +
                          " is outside [0, 0.5)");
    }
    if (!config.roi_polygon.empty() && config.roi_polygon.size() < 3) {
        throw ConfigError("roi_polygon needs at least 3 points");
    }
    for (const auto& point : config.roi_polygon) {
        if (!(point.x >= 0.0f && point.x <= 1.0f && point.y >= 0.0f && point.y <= 1.0f)) {
            throw ConfigError("roi_polygon coordinates must be normalized to [0, 1]");
        }
    }
    if (!(config.event_dedup_window_seconds > 0.0)) {
        throw ConfigError("event_dedup_window_seconds must be positive");
    }
    if (config.event_dedup_distance_px < 0) {
        throw ConfigError("event_dedup_distance_px must not be negative");
    }
    if (!(config.min_confidence >= 0.0f && config.min_confidence <= 1.0f)) {
        throw ConfigError("min_confidence must be within [0, 1]");
    }
}

CounterConfig loadConfig(const std::string& path) {
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            throw ConfigError("cannot open configuration file " + path);
        }
        return parseConfig(fs.root());
    } catch (const cv::Exception& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
}

CounterConfig loadConfigFromString(const std::string& content) {
    try {
        cv::FileStorage fs(content, cv::FileStorage::READ | cv::FileStorage::MEMORY);
        if (!fs.isOpened()) {
            throw ConfigError("cannot read in-memory configuration");
        }
        return parseConfig(fs.root());
    } catch (const cv::Exception& e) {
        throw ConfigError(std::string("cannot parse configuration: ") + e.what());
    }
}
