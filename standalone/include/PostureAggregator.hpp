#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "ClassificationLog.hpp"
#include "PosturePolicy.hpp"

struct SessionFilter {
    std::string startDate;  // inclusive YYYY-MM-DD, empty for unbounded
    std::string endDate;
    std::string deviceId;
};

// A run of consecutive records sharing one label.
struct PostureSession {
    int label{0};
    std::int64_t startMs{0};
    std::int64_t endMs{0};
    double durationMinutes{0.0};
    double avgConfidence{0.0};
};

struct PostureTimeStats {
    int label{0};
    std::string name;
    double totalMinutes{0.0};
    std::size_t sessionCount{0};
    double averageSessionMinutes{0.0};
    double percentage{0.0};
    std::int64_t firstDetectedMs{0};
    std::int64_t lastDetectedMs{0};
};

struct DailyScore {
    std::string date;
    int totalScore{0};
    int goodPostureScore{0};
    int badPosturePenalty{0};
    int stabilityScore{0};
    double monitoringMinutes{0.0};
    double goodPosturePercentage{0.0};
    std::string worstPosture;
    double worstPostureMinutes{0.0};
    std::string grade;
    std::string feedback;
};

struct DailyStats {
    std::string date;
    double totalMinutes{0.0};
    std::vector<PostureTimeStats> breakdown;
    std::string mostCommonPosture;
    double worstPostureMinutes{0.0};
};

struct StatsSummary {
    double totalMinutes{0.0};
    std::size_t totalSessions{0};
    double averageSessionMinutes{0.0};
    double goodPosturePercentage{0.0};
    std::string mostProblematicPosture;
    std::string period;
};

// Keeps prediction records matching filter, orders them by timestamp and
// merges consecutive same-label records. A session ends at the first record of
// the next label; the final session ends at the last record in range. Runs
// without positive duration are dropped, and the same-label sessions around
// such a run are joined, so segmenting the returned boundaries again yields
// the same sessions.
std::vector<PostureSession> segmentSessions(const std::vector<ClassificationRecord>& records,
                                            const SessionFilter& filter = SessionFilter{});

// Per-label totals, largest total first.
std::vector<PostureTimeStats> postureBreakdown(const std::vector<PostureSession>& sessions);

DailyScore scoreDay(const std::string& date, const std::vector<PostureSession>& sessions, const PosturePolicy& policy);
const char* gradeFor(int totalScore);

// False when there is nothing recorded for the day.
bool dailyStats(const std::string& date, const std::vector<PostureSession>& sessions, DailyStats& out);
StatsSummary summarize(const std::vector<PostureSession>& sessions, const std::string& period);
