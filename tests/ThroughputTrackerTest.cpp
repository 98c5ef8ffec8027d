#include <gtest/gtest.h>
#include "ThroughputTracker.hpp"

TEST(ThroughputTracker, StartsEmpty){
    ThroughputTracker tracker;
    const ThroughputSnapshot s = tracker.snapshot(3);
    EXPECT_EQ(s.activeClients, 3u);
    EXPECT_EQ(s.totalPredictions, 0u);
    EXPECT_DOUBLE_EQ(s.meanLatencyMs, 0.0);
    EXPECT_GE(s.uptimeSeconds, 0.0);
}

TEST(ThroughputTracker, MeanLatencyCoversRecentWindow){
    ThroughputTracker tracker;
    for(std::size_t i = 0; i < ThroughputTracker::kWindow; ++i) tracker.record(100.0);
    for(std::size_t i = 0; i < ThroughputTracker::kWindow; ++i) tracker.record(2.0);
    const ThroughputSnapshot s = tracker.snapshot(0);
    EXPECT_EQ(s.totalPredictions, 2 * ThroughputTracker::kWindow);
    EXPECT_DOUBLE_EQ(s.meanLatencyMs, 2.0);
    EXPECT_GT(s.predictionsPerSecond, 0.0);
}
