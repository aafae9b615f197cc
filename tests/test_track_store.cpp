#include <gtest/gtest.h>
#include "../include/track_store.hpp"
#include "test_helpers.hpp"

TEST(TrackStore, FirstSightingHasNoPreviousPosition) {
    TrackStore store;
    cv::Point2f previous(-1, -1);
    EXPECT_FALSE(store.upsert(7, cv::Point2f(100, 200), at(0.0), &previous));
    EXPECT_EQ(previous, cv::Point2f(-1, -1));
    EXPECT_EQ(store.size(), 1u);
}

TEST(TrackStore, UpsertReturnsPositionFromPreviousCall) {
    TrackStore store;
    store.upsert(7, cv::Point2f(100, 200), at(0.0));

    cv::Point2f previous;
    ASSERT_TRUE(store.upsert(7, cv::Point2f(110, 230), at(0.1), &previous));
    EXPECT_EQ(previous, cv::Point2f(100, 200));

    ASSERT_TRUE(store.upsert(7, cv::Point2f(120, 260), at(0.2), &previous));
    EXPECT_EQ(previous, cv::Point2f(110, 230));

    const TrackState* track = store.find(7);
    ASSERT_NE(track, nullptr);
    EXPECT_EQ(track->last_center, cv::Point2f(120, 260));
    EXPECT_EQ(track->last_seen, at(0.2));
    EXPECT_FALSE(track->counted);
}

TEST(TrackStore, MarkCountedIsIdempotentAndSticky) {
    TrackStore store;
    store.upsert(1, cv::Point2f(0, 0), at(0.0));
    store.markCounted(1);
    store.markCounted(1);
    EXPECT_TRUE(store.isCounted(1));

    store.upsert(1, cv::Point2f(5, 5), at(0.1));
    EXPECT_TRUE(store.isCounted(1));

    // Unknown ids are left alone
    store.markCounted(99);
    EXPECT_FALSE(store.isCounted(99));
    EXPECT_EQ(store.find(99), nullptr);
}

TEST(TrackStore, EvictsOnlyTracksOlderThanTimeout) {
    TrackStore store;
    store.upsert(1, cv::Point2f(0, 0), at(0.0));
    store.upsert(2, cv::Point2f(0, 0), at(1.0));
    store.upsert(3, cv::Point2f(0, 0), at(2.5));

    EXPECT_EQ(store.evictStale(at(3.0), std::chrono::duration<double>(2.0)), 1u);
    EXPECT_EQ(store.find(1), nullptr);
    EXPECT_NE(store.find(2), nullptr);  // exactly at the timeout
    EXPECT_NE(store.find(3), nullptr);

    EXPECT_EQ(store.evictStale(at(10.0), std::chrono::duration<double>(2.0)), 2u);
    EXPECT_TRUE(store.empty());
}

TEST(TrackStore, EvictedIdComesBackUncounted) {
    TrackStore store;
    store.upsert(4, cv::Point2f(0, 0), at(0.0));
    store.markCounted(4);
    store.evictStale(at(5.0), std::chrono::duration<double>(2.0));

    EXPECT_FALSE(store.upsert(4, cv::Point2f(0, 0), at(5.0)));
    EXPECT_FALSE(store.isCounted(4));
}

TEST(TrackStore, ClearForgetsEverything) {
    TrackStore store;
    store.upsert(1, cv::Point2f(0, 0), at(0.0));
    store.upsert(2, cv::Point2f(0, 0), at(0.0));
    store.clear();
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.size(), 0u);
}
