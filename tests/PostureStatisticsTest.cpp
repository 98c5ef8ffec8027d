#include <gtest/gtest.h>
#include <memory>
#include "PostureLabels.hpp"
#include "PostureStatistics.hpp"
#include "TestUtil.hpp"

namespace {

class PostureStatisticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        log = std::make_shared<CsvClassificationLog>(tempPath("history.csv"));
        // Day 1: 30 min upright, 10 min turtle neck, 10 min right armrest.
        const std::int64_t d1 = kDayStartMs;
        add(d1, kPostureUpright);
        add(d1 + 30 * kMinuteMs, kPostureTurtleNeck);
        add(d1 + 40 * kMinuteMs, kPostureRightArmrest);
        add(d1 + 50 * kMinuteMs, kPostureRightArmrest);
        // Day 2 on another seat: 20 min slouched.
        const std::int64_t d2 = kDayStartMs + 86400000LL;
        add(d2, kPostureSlouched, "seat-2");
        add(d2 + 20 * kMinuteMs, kPostureSlouched, "seat-2");
    }

    void add(std::int64_t ts, int label, const std::string& device = "seat-1"){
        ASSERT_TRUE(log->append(predictionAt(ts, label, 0.9, device)));
    }

    std::shared_ptr<CsvClassificationLog> log;
};

// Refuses every write.
class ReadOnlyLog : public ClassificationLog {
public:
    bool append(const ClassificationRecord&) override { return false; }
    std::vector<ClassificationRecord> query(const LogQuery&) const override { return {}; }
    std::size_t count() const override { return 0; }
    bool reset(std::size_t& deleted) override { deleted = 0; return false; }
};

}  // namespace

TEST_F(PostureStatisticsTest, SessionsKeepTheMostRecent){
    PostureStatistics stats(log, PosturePolicy{});
    // Unfiltered, the armrest run lasts until the first day-2 record.
    auto sessions = stats.sessions(SessionFilter{});
    ASSERT_EQ(sessions.size(), 4u);
    EXPECT_EQ(sessions.back().label, kPostureSlouched);

    sessions = stats.sessions(SessionFilter{}, 2);
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].label, kPostureRightArmrest);
    EXPECT_EQ(sessions[1].label, kPostureSlouched);
}

TEST_F(PostureStatisticsTest, SessionsFilterByDevice){
    PostureStatistics stats(log, PosturePolicy{});
    SessionFilter f;
    f.deviceId = "seat-1";
    const auto sessions = stats.sessions(f);
    ASSERT_EQ(sessions.size(), 3u);
    EXPECT_EQ(sessions.back().endMs, kDayStartMs + 50 * kMinuteMs);
}

TEST_F(PostureStatisticsTest, DeviceIdsWithSeparatorsCanBeQueried){
    const std::int64_t d3 = kDayStartMs + 2 * 86400000LL;
    add(d3, kPostureLeftLegCrossed, "seat:3");
    add(d3 + 5 * kMinuteMs, kPostureLeftLegCrossed, "seat:3");
    PostureStatistics stats(log, PosturePolicy{});
    SessionFilter f;
    f.deviceId = "seat:3";
    const auto sessions = stats.sessions(f);
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].label, kPostureLeftLegCrossed);
    EXPECT_EQ(stats.score("2026-03-16", "seat:3").grade, "D");
}

TEST_F(PostureStatisticsTest, PosturesPerDateRange){
    PostureStatistics stats(log, PosturePolicy{});
    SessionFilter f;
    f.startDate = "2026-03-15";
    const auto postures = stats.postures(f);
    ASSERT_EQ(postures.size(), 1u);
    EXPECT_EQ(postures[0].label, kPostureSlouched);
    EXPECT_DOUBLE_EQ(postures[0].totalMinutes, 20.0);
    EXPECT_DOUBLE_EQ(postures[0].percentage, 100.0);
}

TEST_F(PostureStatisticsTest, DailyAndScore){
    PostureStatistics stats(log, PosturePolicy{});
    DailyStats day;
    ASSERT_TRUE(stats.daily("2026-03-14", "", day));
    EXPECT_EQ(day.mostCommonPosture, "upright");
    EXPECT_FALSE(stats.daily("2026-03-20", "", day));

    const DailyScore score = stats.score("2026-03-14", "");
    EXPECT_EQ(score.totalScore, 39);
    EXPECT_EQ(score.grade, "D");

    const DailyScore other = stats.score("2026-03-14", "seat-2");
    EXPECT_EQ(other.grade, "F");
}

TEST_F(PostureStatisticsTest, SummaryCoversTrailingDays){
    PostureStatistics stats(log, PosturePolicy{});
    StatsSummary s = stats.summary(7, "seat-1", "2026-03-15");
    EXPECT_EQ(s.period, "2026-03-08 ~ 2026-03-15");
    EXPECT_DOUBLE_EQ(s.totalMinutes, 50.0);
    EXPECT_EQ(s.totalSessions, 3u);
    EXPECT_EQ(s.mostProblematicPosture, "turtle neck");

    s = stats.summary(1, "seat-2", "2026-03-15");
    EXPECT_EQ(s.period, "2026-03-14 ~ 2026-03-15");
    EXPECT_DOUBLE_EQ(s.totalMinutes, 20.0);
    EXPECT_EQ(s.mostProblematicPosture, "slouched, hips forward");

    s = stats.summary(7, "", "2026-03-30");
    EXPECT_EQ(s.totalSessions, 0u);
}

TEST_F(PostureStatisticsTest, ResetNeedsConfirmation){
    PostureStatistics stats(log, PosturePolicy{});
    std::size_t deleted = 99;
    std::string error;
    EXPECT_FALSE(stats.reset(false, deleted, error));
    EXPECT_EQ(deleted, 0u);
    EXPECT_EQ(error, "reset requires explicit confirmation");
    EXPECT_EQ(log->count(), 6u);

    ASSERT_TRUE(stats.reset(true, deleted, error));
    EXPECT_EQ(deleted, 6u);
    EXPECT_TRUE(stats.sessions(SessionFilter{}).empty());
}

TEST(PostureStatistics, ResetReportsStorageFailure){
    PostureStatistics stats(std::make_shared<ReadOnlyLog>(), PosturePolicy{});
    std::size_t deleted = 0;
    std::string error;
    EXPECT_FALSE(stats.reset(true, deleted, error));
    EXPECT_FALSE(error.empty());
}
