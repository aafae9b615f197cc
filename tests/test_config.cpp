#include <gtest/gtest.h>
#include "../include/config.hpp"
#include "../include/errors.hpp"

TEST(Config, ParsesEveryOption) {
    const CounterConfig config = loadConfigFromString(R"(%YAML:1.0
---
mode: "untracked"
tolerance_px: 20
track_timeout_seconds: 3.0
roi_margin_ratio: 0.1
event_dedup_window_seconds: 2.5
event_dedup_distance_px: 80
min_confidence: 0.5
eligible_class_ids: [ 2, 5, 7 ]
anchor_outside_band: 1
debug: 1
roi_polygon: [ [ 0.0, 0.0 ], [ 1.0, 0.0 ], [ 1.0, 1.0 ] ]
lines:
  - name: "north"
    ratio: 0.3
    increasing_y: "southbound"
    decreasing_y: "northbound"
    fallback_rule: "horizontal"
    fallback_direction: "decreasing_y"
  - name: "south"
    ratio: 0.7
    tolerance_px: 10
)");

    EXPECT_EQ(config.mode, CountingMode::kUntracked);
    EXPECT_EQ(config.tolerance_px, 20);
    EXPECT_DOUBLE_EQ(config.track_timeout_seconds, 3.0);
    EXPECT_DOUBLE_EQ(config.roi_margin_ratio, 0.1);
    EXPECT_DOUBLE_EQ(config.event_dedup_window_seconds, 2.5);
    EXPECT_EQ(config.event_dedup_distance_px, 80);
    EXPECT_FLOAT_EQ(config.min_confidence, 0.5f);
    EXPECT_EQ(config.eligible_class_ids, (std::set<int>{ 2, 5, 7 }));
    EXPECT_TRUE(config.anchor_outside_band);
    EXPECT_TRUE(config.debug);
    EXPECT_EQ(config.roi_polygon.size(), 3u);

    ASSERT_EQ(config.lines.size(), 2u);
    const LineSpec& north = config.lines[0];
    EXPECT_EQ(north.name, "north");
    EXPECT_FLOAT_EQ(north.ratio, 0.3f);
    EXPECT_EQ(north.tolerance, 20);  // inherited from tolerance_px
    EXPECT_EQ(north.increasing_counter, "southbound");
    EXPECT_EQ(north.decreasing_counter, "northbound");
    EXPECT_EQ(north.fallback_rule, FallbackRule::kHorizontalSplit);
    EXPECT_EQ(north.fallback_direction, CrossingDirection::kDecreasingY);

    const LineSpec& south = config.lines[1];
    EXPECT_EQ(south.tolerance, 10);
    EXPECT_EQ(south.increasing_counter, "down");
    EXPECT_EQ(south.decreasing_counter, "up");
    EXPECT_EQ(south.fallback_rule, FallbackRule::kDefaultDirection);
}

TEST(Config, MissingKeysKeepDefaults) {
    const CounterConfig config = loadConfigFromString("%YAML:1.0\nlines:\n  - { ratio: 0.5 }\n");
    const CounterConfig defaults;
    EXPECT_EQ(config.mode, CountingMode::kTracked);
    EXPECT_EQ(config.tolerance_px, 15);
    EXPECT_DOUBLE_EQ(config.track_timeout_seconds, defaults.track_timeout_seconds);
    EXPECT_DOUBLE_EQ(config.roi_margin_ratio, 0.05);
    EXPECT_TRUE(config.eligible_class_ids.empty());
    EXPECT_FALSE(config.anchor_outside_band);
    ASSERT_EQ(config.lines.size(), 1u);
    EXPECT_EQ(config.lines[0].name, "line_1");
    EXPECT_EQ(config.lines[0].tolerance, 15);
}

TEST(Config, LineRatioShorthands) {
    const CounterConfig one = loadConfigFromString("%YAML:1.0\nline_ratio: 0.4\n");
    ASSERT_EQ(one.lines.size(), 1u);
    EXPECT_FLOAT_EQ(one.lines[0].ratio, 0.4f);

    const CounterConfig two = loadConfigFromString("%YAML:1.0\ntolerance_px: 8\nline_ratios: [ 0.3, 0.7 ]\n");
    ASSERT_EQ(two.lines.size(), 2u);
    EXPECT_EQ(two.lines[1].name, "line_2");
    EXPECT_FLOAT_EQ(two.lines[1].ratio, 0.7f);
    EXPECT_EQ(two.lines[1].tolerance, 8);
}

TEST(Config, RejectsMissingLines) {
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nmode: \"tracked\"\n"), ConfigError);
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nlines:\n  - { name: \"a\" }\n"), ConfigError);
}

TEST(Config, RejectsOutOfRangeValuesInsteadOfClamping) {
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nline_ratio: 1.5\n"), ConfigError);
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nline_ratio: 0.5\nroi_margin_ratio: 0.6\n"), ConfigError);
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nline_ratio: 0.5\ntrack_timeout_seconds: 0\n"), ConfigError);
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nline_ratio: 0.5\nmin_confidence: 2.0\n"), ConfigError);
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nline_ratio: 0.5\nevent_dedup_window_seconds: -1.0\n"),
                 ConfigError);
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nline_ratio: 0.5\nroi_polygon: [ [ 0.0, 0.0 ], [ 1.0, 1.0 ] ]\n"),
                 ConfigError);
}

TEST(Config, RejectsUnknownKeywordsAndWrongTypes) {
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nline_ratio: 0.5\nmode: \"sometimes\"\n"), ConfigError);
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nline_ratio: 0.5\ntolerance_px: \"wide\"\n"), ConfigError);
    EXPECT_THROW(loadConfigFromString(
                     "%YAML:1.0\nlines:\n  - { ratio: 0.5, fallback_rule: \"random\" }\n"),
                 ConfigError);
    EXPECT_THROW(loadConfigFromString(
                     "%YAML:1.0\nlines:\n  - { ratio: 0.5, fallback_direction: \"sideways\" }\n"),
                 ConfigError);
}

TEST(Config, NonNumericListEntriesAreRejected) {
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nline_ratios: [ \"0.5\" ]\n"), ConfigError);
    EXPECT_THROW(loadConfigFromString("%YAML:1.0\nline_ratios: [ 0.3, { at: 0.7 } ]\n"), ConfigError);
    EXPECT_THROW(loadConfigFromString(
                     "%YAML:1.0\nline_ratio: 0.5\n"
                     "roi_polygon: [ [ 0.0, 0.0 ], [ \"left\", 0.0 ], [ 1.0, 1.0 ] ]\n"),
                 ConfigError);
}

TEST(Config, UnreadableInputIsAConfigError) {
    EXPECT_THROW(loadConfig("/nonexistent/vehicle_counter.yml"), ConfigError);
    EXPECT_THROW(loadConfigFromString("this is not a storage document"), ConfigError);
}

TEST(Config, ValidateOptionsAcceptsDefaults) {
    EXPECT_NO_THROW(validateOptions(CounterConfig()));
}
