#ifndef LINE_REGISTRY_HPP
#define LINE_REGISTRY_HPP

#include <string>
#include <vector>

enum class CrossingDirection {
    kIncreasingY,  // moving down the frame
    kDecreasingY   // moving up the frame
};

// How the untracked mode picks a counter for an object sitting in a line's band
enum class FallbackRule {
    kDefaultDirection,  // always fallback_direction
    kHorizontalSplit    // left half: fallback_direction, right half: the opposite
};

const char* toString(CrossingDirection direction);
CrossingDirection opposite(CrossingDirection direction);

struct LineSpec {
    std::string name;
    float ratio;                     // position as a fraction of frame height
    int tolerance;                   // half-width of the band in pixels
    std::string increasing_counter;  // counter for kIncreasingY crossings
    std::string decreasing_counter;  // counter for kDecreasingY crossings
    FallbackRule fallback_rule;
    CrossingDirection fallback_direction;

    LineSpec()
        : name("line"), ratio(0.5f), tolerance(15),
          increasing_counter("down"), decreasing_counter("up"),
          fallback_rule(FallbackRule::kDefaultDirection),
          fallback_direction(CrossingDirection::kIncreasingY) {}
    LineSpec(const std::string& name, float ratio, int tolerance,
             const std::string& increasing_counter, const std::string& decreasing_counter)
        : name(name), ratio(ratio), tolerance(tolerance),
          increasing_counter(increasing_counter), decreasing_counter(decreasing_counter),
          fallback_rule(FallbackRule::kDefaultDirection),
          fallback_direction(CrossingDirection::kIncreasingY) {}
};

struct CountingLine {
    std::string name;
    int position_y;
    int tolerance;
    std::string increasing_counter;
    std::string decreasing_counter;
    FallbackRule fallback_rule;
    CrossingDirection fallback_direction;

    const std::string& counterFor(CrossingDirection direction) const {
        return direction == CrossingDirection::kIncreasingY ? increasing_counter : decreasing_counter;
    }
    float lowerEdge() const { return static_cast<float>(position_y - tolerance); }
    float upperEdge() const { return static_cast<float>(position_y + tolerance); }
    bool inBand(float y) const { return y >= lowerEdge() && y <= upperEdge(); }

    bool operator==(const CountingLine& other) const;
    bool operator!=(const CountingLine& other) const { return !(*this == other); }
};

// Ordered set of counting lines. Pixel positions are derived once from the
// frame height; until that height is known the specs are held unresolved.
class LineRegistry {
public:
    LineRegistry();

    // Throws ConfigError on an empty list, a ratio outside [0,1], a negative
    // tolerance, a missing counter name or a duplicate line name.
    static void validate(const std::vector<LineSpec>& specs);

    // Resolves positions immediately when frame_height > 0, otherwise defers
    // to resolve(). Returns true if previously resolved lines were moved or
    // replaced, meaning any positions measured against them are stale.
    bool configure(int frame_height, const std::vector<LineSpec>& specs);

    // Lazy resolution from the first frame. No-op once resolved.
    void resolve(int frame_height);

    bool hasSpecs() const { return !specs_.empty(); }
    bool isResolved() const { return resolved_; }
    int frameHeight() const { return frame_height_; }
    const std::vector<CountingLine>& lines() const { return lines_; }
    std::vector<std::string> counterNames() const;

private:
    std::vector<LineSpec> specs_;
    std::vector<CountingLine> lines_;
    int frame_height_;
    bool resolved_;

    static std::vector<CountingLine> build(int frame_height, const std::vector<LineSpec>& specs);
};

#endif // LINE_REGISTRY_HPP
