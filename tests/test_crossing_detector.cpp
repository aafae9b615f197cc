#include <gtest/gtest.h>
#include "../include/crossing_detector.hpp"

static CountingLine lineAt(int y, int tolerance) {
    CountingLine line;
    line.name = "main";
    line.position_y = y;
    line.tolerance = tolerance;
    line.increasing_counter = "down";
    line.decreasing_counter = "up";
    line.fallback_rule = FallbackRule::kDefaultDirection;
    line.fallback_direction = CrossingDirection::kIncreasingY;
    return line;
}

TEST(CrossingDetector, ClearingTheWholeBandDownwardIsIncreasingY) {
    const CountingLine line = lineAt(240, 15);
    CrossingDirection direction = CrossingDirection::kDecreasingY;
    ASSERT_TRUE(detectCrossing(240 - 15 - 1, 240 + 15 + 1, line, &direction));
    EXPECT_EQ(direction, CrossingDirection::kIncreasingY);
}

TEST(CrossingDetector, ClearingTheWholeBandUpwardIsDecreasingY) {
    const CountingLine line = lineAt(240, 15);
    CrossingDirection direction = CrossingDirection::kIncreasingY;
    ASSERT_TRUE(detectCrossing(256, 224, line, &direction));
    EXPECT_EQ(direction, CrossingDirection::kDecreasingY);
}

TEST(CrossingDetector, MovementInsideTheBandIsIgnored) {
    const CountingLine line = lineAt(240, 15);
    EXPECT_FALSE(detectCrossing(240 - 15 + 1, 240 + 15 - 1, line, nullptr));
    EXPECT_FALSE(detectCrossing(254, 226, line, nullptr));
}

TEST(CrossingDetector, BandEdgesThemselvesDoNotCount) {
    const CountingLine line = lineAt(240, 15);
    EXPECT_FALSE(detectCrossing(225, 256, line, nullptr));
    EXPECT_FALSE(detectCrossing(224, 255, line, nullptr));
}

TEST(CrossingDetector, LeavingOnlyOneSideIsNotACrossing) {
    const CountingLine line = lineAt(240, 15);
    EXPECT_FALSE(detectCrossing(200, 245, line, nullptr));
    EXPECT_FALSE(detectCrossing(245, 300, line, nullptr));
    EXPECT_FALSE(detectCrossing(200, 210, line, nullptr));
}

TEST(CrossingDetector, FirstSightingHasNoPreviousPosition) {
    const CountingLine line = lineAt(240, 15);
    CrossingDirection direction = CrossingDirection::kDecreasingY;
    EXPECT_FALSE(detectCrossing(nullptr, cv::Point2f(320, 300), line, &direction));
    EXPECT_EQ(direction, CrossingDirection::kDecreasingY);

    const cv::Point2f previous(320, 100);
    EXPECT_TRUE(detectCrossing(&previous, cv::Point2f(320, 300), line, &direction));
    EXPECT_EQ(direction, CrossingDirection::kIncreasingY);
}

TEST(CrossingDetector, ZeroToleranceStillNeedsBothSides) {
    const CountingLine line = lineAt(100, 0);
    EXPECT_TRUE(detectCrossing(99, 101, line, nullptr));
    EXPECT_FALSE(detectCrossing(100, 101, line, nullptr));
}
