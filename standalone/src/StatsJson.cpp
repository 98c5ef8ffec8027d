#include "StatsJson.hpp"
#include "PostureLabels.hpp"
#include "TimeUtil.hpp"
#include <cmath>

namespace {

double round2(double v){ return std::round(v * 100.0) / 100.0; }
double round3(double v){ return std::round(v * 1000.0) / 1000.0; }

}  // namespace

void to_json(nlohmann::json& j, const PostureSession& s){
    j = nlohmann::json{
        {"posture_id", s.label},
        {"posture_name", postureName(s.label)},
        {"start_time", formatUtc(s.startMs)},
        {"end_time", formatUtc(s.endMs)},
        {"duration_minutes", round2(s.durationMinutes)},
        {"confidence", round3(s.avgConfidence)},
    };
}

void to_json(nlohmann::json& j, const PostureTimeStats& t){
    j = nlohmann::json{
        {"posture_id", t.label},
        {"posture_name", t.name},
        {"total_duration_minutes", round2(t.totalMinutes)},
        {"session_count", t.sessionCount},
        {"average_session_duration", round2(t.averageSessionMinutes)},
        {"percentage", round2(t.percentage)},
        {"first_detected", formatUtc(t.firstDetectedMs)},
        {"last_detected", formatUtc(t.lastDetectedMs)},
    };
}

void to_json(nlohmann::json& j, const DailyScore& d){
    j = nlohmann::json{
        {"date", d.date},
        {"total_score", d.totalScore},
        {"good_posture_score", d.goodPostureScore},
        {"bad_posture_penalty", d.badPosturePenalty},
        {"session_stability_score", d.stabilityScore},
        {"monitoring_time_minutes", round2(d.monitoringMinutes)},
        {"good_posture_percentage", round2(d.goodPosturePercentage)},
        {"worst_posture", d.worstPosture},
        {"worst_posture_duration", round2(d.worstPostureMinutes)},
        {"grade", d.grade},
        {"feedback", d.feedback},
    };
}

void to_json(nlohmann::json& j, const DailyStats& d){
    j = nlohmann::json{
        {"date", d.date},
        {"total_time_minutes", round2(d.totalMinutes)},
        {"posture_breakdown", d.breakdown},
        {"most_common_posture", d.mostCommonPosture},
        {"worst_posture_duration", round2(d.worstPostureMinutes)},
    };
}

void to_json(nlohmann::json& j, const StatsSummary& s){
    j = nlohmann::json{
        {"total_monitoring_time", round2(s.totalMinutes)},
        {"total_sessions", s.totalSessions},
        {"average_session_duration", round2(s.averageSessionMinutes)},
        {"good_posture_percentage", round2(s.goodPosturePercentage)},
        {"most_problematic_posture", s.mostProblematicPosture},
        {"data_period", s.period},
    };
}
