#include <gtest/gtest.h>
#include "PostureLabels.hpp"
#include "StatsJson.hpp"
#include "TestUtil.hpp"

using nlohmann::json;

TEST(StatsJson, SessionFields){
    PostureSession s;
    s.label = kPostureTurtleNeck;
    s.startMs = kDayStartMs;
    s.endMs = kDayStartMs + 90500;
    s.durationMinutes = 90.5 / 60.0;
    s.avgConfidence = 0.87654;
    const json j = s;
    EXPECT_EQ(j.at("posture_id"), 4);
    EXPECT_EQ(j.at("posture_name"), "turtle neck");
    EXPECT_EQ(j.at("start_time"), "2026-03-14 00:00:00.000");
    EXPECT_EQ(j.at("end_time"), "2026-03-14 00:01:30.500");
    EXPECT_DOUBLE_EQ(j.at("duration_minutes").get<double>(), 1.51);
    EXPECT_DOUBLE_EQ(j.at("confidence").get<double>(), 0.877);
}

TEST(StatsJson, DailyStatsNestsBreakdown){
    PostureTimeStats t;
    t.label = 0;
    t.name = "upright";
    t.totalMinutes = 12.346;
    t.sessionCount = 2;
    DailyStats d;
    d.date = "2026-03-14";
    d.breakdown = {t};
    d.mostCommonPosture = "upright";
    const json j = d;
    ASSERT_TRUE(j.at("posture_breakdown").is_array());
    EXPECT_EQ(j.at("posture_breakdown")[0].at("session_count"), 2);
    EXPECT_DOUBLE_EQ(j.at("posture_breakdown")[0].at("total_duration_minutes").get<double>(), 12.35);
    EXPECT_EQ(j.at("most_common_posture"), "upright");
}

TEST(StatsJson, ScoreAndSummaryKeys){
    DailyScore score;
    score.date = "2026-03-14";
    score.totalScore = 39;
    score.grade = "D";
    const json s = score;
    for(const char* key : {"date", "total_score", "good_posture_score", "bad_posture_penalty",
                           "session_stability_score", "monitoring_time_minutes", "good_posture_percentage",
                           "worst_posture", "worst_posture_duration", "grade", "feedback"}){
        EXPECT_TRUE(s.contains(key)) << key;
    }
    EXPECT_EQ(s.at("total_score"), 39);

    StatsSummary summary;
    summary.period = "2026-03-07 ~ 2026-03-14";
    const json m = summary;
    EXPECT_EQ(m.at("data_period"), "2026-03-07 ~ 2026-03-14");
    EXPECT_EQ(m.at("total_sessions"), 0);
}
