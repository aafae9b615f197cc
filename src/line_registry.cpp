#include "../include/line_registry.hpp"
#include "../include/errors.hpp"
#include <cmath>
#include <set>

const char* toString(CrossingDirection direction) {
    return direction == CrossingDirection::kIncreasingY ? "increasing_y" : "decreasing_y";
}

CrossingDirection opposite(CrossingDirection direction) {
    return direction == CrossingDirection::kIncreasingY ? CrossingDirection::kDecreasingY
                                                        : CrossingDirection::kIncreasingY;
}

bool CountingLine::operator==(const CountingLine& other) const {
    return name == other.name && position_y == other.position_y &&
           tolerance == other.tolerance &&
           increasing_counter == other.increasing_counter &&
           decreasing_counter == other.decreasing_counter &&
           fallback_rule == other.fallback_rule &&
           fallback_direction == other.fallback_direction;
}

LineRegistry::LineRegistry() : frame_height_(0), resolved_(false) {
}

void LineRegistry::validate(const std::vector<LineSpec>& specs) {
    if (specs.empty()) {
        throw ConfigError("at least one counting line is required");
    }
    std::set<std::string> names;
    for (const auto& spec : specs) {
        if (spec.name.empty()) {
            throw ConfigError("counting line without a name");
        }
        if (!names.insert(spec.name).second) {
            throw ConfigError("duplicate counting line name '" + spec.name + "'");
        }
        // Written so that NaN fails as well
        if (!(spec.ratio >= 0.0f && spec.ratio <= 1.0f)) {
            throw ConfigError("line '" + spec.name + "': ratio " + std::to_string(spec.ratio) +
                              " is outside [0, 1]");
        }
        if (spec.tolerance < 0) {
            throw ConfigError("line '" + spec.name + "': tolerance must not be negative");
        }
        if (spec.increasing_counter.empty() || spec.decreasing_counter.empty()) {
            throw ConfigError("line '" + spec.name + "': both directions need a counter name");
        }
    }
}

std::vector<CountingLine> LineRegistry::build(int frame_height, const std::vector<LineSpec>& specs) {
    std::vector<CountingLine> lines;
    lines.reserve(specs.size());
    for (const auto& spec : specs) {
        CountingLine line;
        line.name = spec.name;
        line.position_y = static_cast<int>(std::lround(frame_height * static_cast<double>(spec.ratio)));
        line.tolerance = spec.tolerance;
        line.increasing_counter = spec.increasing_counter;
        line.decreasing_counter = spec.decreasing_counter;
        line.fallback_rule = spec.fallback_rule;
        line.fallback_direction = spec.fallback_direction;
        lines.push_back(line);
    }
    return lines;
}

bool LineRegistry::configure(int frame_height, const std::vector<LineSpec>& specs) {
    validate(specs);

    // A reconfiguration without a height reuses the one already seen
    const int height = frame_height > 0 ? frame_height : frame_height_;
    if (height <= 0) {
        specs_ = specs;
        lines_.clear();
        resolved_ = false;
        return false;
    }

    std::vector<CountingLine> lines = build(height, specs);
    const bool moved = resolved_ && lines != lines_;
    specs_ = specs;
    lines_ = lines;
    frame_height_ = height;
    resolved_ = true;
    return moved;
}

void LineRegistry::resolve(int frame_height) {
    if (resolved_) return;
    if (specs_.empty()) {
        throw NotConfiguredError("no counting lines configured");
    }
    if (frame_height <= 0) {
        throw NotConfiguredError("frame height unknown, counting lines cannot be placed");
    }
    lines_ = build(frame_height, specs_);
    frame_height_ = frame_height;
    resolved_ = true;
}

std::vector<std::string> LineRegistry::counterNames() const {
    std::vector<std::string> names;
    std::set<std::string> seen;
    for (const auto& spec : specs_) {
        if (seen.insert(spec.increasing_counter).second) names.push_back(spec.increasing_counter);
        if (seen.insert(spec.decreasing_counter).second) names.push_back(spec.decreasing_counter);
    }
    return names;
}
