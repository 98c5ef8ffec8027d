#include "PostureAggregator.hpp"
#include "PostureLabels.hpp"
#include "TimeUtil.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>

namespace {

constexpr double kMsPerMinute = 60000.0;
constexpr int kMaxScore = 100;
constexpr const char* kNoPosture = "none";

bool inFilter(const ClassificationRecord& r, const SessionFilter& f){
    if(r.kind != RecordKind::Prediction) return false;
    if(!f.deviceId.empty() && r.deviceId != f.deviceId) return false;
    if(f.startDate.empty() && f.endDate.empty()) return true;
    const std::string day = utcDate(r.timestampMs);
    if(!f.startDate.empty() && day < f.startDate) return false;
    if(!f.endDate.empty() && day > f.endDate) return false;
    return true;
}

// records is the number of records behind out.back(), kept for its confidence mean.
void closeSession(std::vector<PostureSession>& out, std::size_t& records, int label, std::int64_t startMs,
                  std::int64_t endMs, double confidenceSum, std::size_t n){
    if(endMs <= startMs) return;
    // A dropped zero-length run leaves two runs of one label back to back.
    if(!out.empty() && out.back().label == label && out.back().endMs == startMs){
        PostureSession& s = out.back();
        const double sum = s.avgConfidence * static_cast<double>(records) + confidenceSum;
        records += n;
        s.endMs = endMs;
        s.durationMinutes = static_cast<double>(s.endMs - s.startMs) / kMsPerMinute;
        s.avgConfidence = sum / static_cast<double>(records);
        return;
    }
    PostureSession s;
    s.label = label;
    s.startMs = startMs;
    s.endMs = endMs;
    s.durationMinutes = static_cast<double>(endMs - startMs) / kMsPerMinute;
    s.avgConfidence = n ? confidenceSum / static_cast<double>(n) : 0.0;
    out.push_back(s);
    records = n;
}

// Mean session length band, ideal window first.
int sessionLengthBonus(double meanMinutes, const PosturePolicy& p){
    if(meanMinutes >= p.idealSessionMin && meanMinutes <= p.idealSessionMax) return 10;
    if((meanMinutes >= 3.0 && meanMinutes < p.idealSessionMin) || (meanMinutes > p.idealSessionMax && meanMinutes <= 20.0)) return 8;
    if((meanMinutes >= 1.0 && meanMinutes < 3.0) || (meanMinutes > 20.0 && meanMinutes <= 30.0)) return 5;
    return 2;
}

int sessionCountBonus(std::size_t count){
    if(count >= 3) return 10;
    if(count >= 2) return 7;
    if(count >= 1) return 5;
    return 0;
}

const char* gradeMessage(const std::string& grade){
    if(grade == "A+") return "Excellent posture today. Keep it up!";
    if(grade == "A") return "Great posture. A little more attention and it will be perfect.";
    if(grade == "B+") return "Good posture. Try to stay upright a little longer.";
    if(grade == "B") return "Average posture. Make a conscious effort to sit upright.";
    if(grade == "C+") return "Your posture needs work.";
    if(grade == "C") return "Your posture needs attention.";
    return "Your posture was poor today. Focus on sitting upright.";
}

std::string formatMinutes(double minutes){
    std::ostringstream s;
    s.setf(std::ios::fixed);
    s.precision(1);
    s << minutes;
    return s.str();
}

}  // namespace

std::vector<PostureSession> segmentSessions(const std::vector<ClassificationRecord>& records, const SessionFilter& filter){
    std::vector<const ClassificationRecord*> ordered;
    ordered.reserve(records.size());
    for(const auto& r : records){
        if(inFilter(r, filter)) ordered.push_back(&r);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const ClassificationRecord* a, const ClassificationRecord* b){
        return a->timestampMs < b->timestampMs;
    });

    std::vector<PostureSession> out;
    if(ordered.empty()) return out;

    int label = ordered.front()->label;
    std::int64_t startMs = ordered.front()->timestampMs;
    double confidenceSum = 0.0;
    std::size_t n = 0;
    std::size_t lastRecords = 0;
    for(const ClassificationRecord* r : ordered){
        if(r->label != label){
            closeSession(out, lastRecords, label, startMs, r->timestampMs, confidenceSum, n);
            label = r->label;
            startMs = r->timestampMs;
            confidenceSum = 0.0;
            n = 0;
        }
        confidenceSum += r->confidence;
        ++n;
    }
    closeSession(out, lastRecords, label, startMs, ordered.back()->timestampMs, confidenceSum, n);
    return out;
}

std::vector<PostureTimeStats> postureBreakdown(const std::vector<PostureSession>& sessions){
    std::map<int, PostureTimeStats> byLabel;
    double total = 0.0;
    for(const auto& s : sessions){
        total += s.durationMinutes;
        auto it = byLabel.find(s.label);
        if(it == byLabel.end()){
            PostureTimeStats t;
            t.label = s.label;
            t.name = postureName(s.label);
            t.firstDetectedMs = s.startMs;
            it = byLabel.emplace(s.label, t).first;
        }
        PostureTimeStats& t = it->second;
        t.totalMinutes += s.durationMinutes;
        ++t.sessionCount;
        t.lastDetectedMs = s.endMs;
    }

    std::vector<PostureTimeStats> out;
    out.reserve(byLabel.size());
    for(auto& kv : byLabel){
        PostureTimeStats& t = kv.second;
        t.averageSessionMinutes = t.totalMinutes / static_cast<double>(t.sessionCount);
        t.percentage = total > 0.0 ? t.totalMinutes / total * 100.0 : 0.0;
        out.push_back(t);
    }
    std::stable_sort(out.begin(), out.end(), [](const PostureTimeStats& a, const PostureTimeStats& b){
        return a.totalMinutes > b.totalMinutes;
    });
    return out;
}

const char* gradeFor(int totalScore){
    if(totalScore >= 90) return "A+";
    if(totalScore >= 80) return "A";
    if(totalScore >= 70) return "B+";
    if(totalScore >= 60) return "B";
    if(totalScore >= 50) return "C+";
    if(totalScore >= 40) return "C";
    return "D";
}

DailyScore scoreDay(const std::string& date, const std::vector<PostureSession>& sessions, const PosturePolicy& policy){
    DailyScore score;
    score.date = date;
    score.worstPosture = kNoPosture;

    const std::vector<PostureTimeStats> breakdown = postureBreakdown(sessions);
    if(breakdown.empty()){
        score.grade = "F";
        score.feedback = "No posture data recorded for this day.";
        return score;
    }

    double penalty = 0.0;
    const PostureTimeStats* worst = nullptr;
    for(const auto& t : breakdown){
        score.monitoringMinutes += t.totalMinutes;
        if(t.label == kPostureUpright){
            score.goodPosturePercentage = t.percentage;
            continue;
        }
        penalty += t.percentage * policy.severityOf(t.label) * policy.penaltyFactor;
        if(!worst || t.totalMinutes > worst->totalMinutes) worst = &t;
    }

    score.goodPostureScore = static_cast<int>(std::min(policy.goodPostureMax,
                                                       std::floor(policy.goodPostureFactor * score.goodPosturePercentage)));
    score.badPosturePenalty = static_cast<int>(std::min(policy.penaltyCap, std::floor(penalty)));
    const double meanMinutes = score.monitoringMinutes / static_cast<double>(sessions.size());
    score.stabilityScore = sessionLengthBonus(meanMinutes, policy) + sessionCountBonus(sessions.size());

    const int raw = score.goodPostureScore - score.badPosturePenalty + score.stabilityScore;
    score.totalScore = std::max(0, std::min(kMaxScore, raw));
    score.grade = gradeFor(score.totalScore);

    score.feedback = gradeMessage(score.grade);
    if(worst){
        score.worstPosture = worst->name;
        score.worstPostureMinutes = worst->totalMinutes;
        score.feedback += " Most time in a poor posture: " + worst->name + " (" + formatMinutes(worst->totalMinutes) + " min).";
    }
    return score;
}

bool dailyStats(const std::string& date, const std::vector<PostureSession>& sessions, DailyStats& out){
    out = DailyStats{};
    out.date = date;
    out.breakdown = postureBreakdown(sessions);
    if(out.breakdown.empty()) return false;
    out.mostCommonPosture = out.breakdown.front().name;
    for(const auto& t : out.breakdown){
        out.totalMinutes += t.totalMinutes;
        if(t.label != kPostureUpright) out.worstPostureMinutes = std::max(out.worstPostureMinutes, t.totalMinutes);
    }
    return true;
}

StatsSummary summarize(const std::vector<PostureSession>& sessions, const std::string& period){
    StatsSummary summary;
    summary.period = period;
    summary.mostProblematicPosture = kNoPosture;
    bool haveWorst = false;
    for(const auto& t : postureBreakdown(sessions)){
        summary.totalMinutes += t.totalMinutes;
        summary.totalSessions += t.sessionCount;
        if(t.label == kPostureUpright){
            summary.goodPosturePercentage = t.percentage;
        } else if(!haveWorst){
            // sorted by total, so the first non-upright entry is the longest
            summary.mostProblematicPosture = t.name;
            haveWorst = true;
        }
    }
    if(summary.totalSessions) summary.averageSessionMinutes = summary.totalMinutes / static_cast<double>(summary.totalSessions);
    return summary;
}
