#include "PostureStatistics.hpp"
#include "TimeUtil.hpp"
#include <utility>

PostureStatistics::PostureStatistics(std::shared_ptr<ClassificationLog> log, PosturePolicy policy)
: log(std::move(log)), policy(std::move(policy)) {}

std::vector<PostureSession> PostureStatistics::load(const SessionFilter& filter) const{
    LogQuery q;
    q.startDate = filter.startDate;
    q.endDate = filter.endDate;
    q.deviceId = filter.deviceId;
    q.predictionsOnly = true;
    // The log has matched the device against its stored spelling already.
    SessionFilter byDate = filter;
    byDate.deviceId.clear();
    return segmentSessions(log->query(q), byDate);
}

std::vector<PostureSession> PostureStatistics::sessions(const SessionFilter& filter, std::size_t limit) const{
    std::vector<PostureSession> all = load(filter);
    if(all.size() > limit) all.erase(all.begin(), all.end() - static_cast<std::ptrdiff_t>(limit));
    return all;
}

std::vector<PostureTimeStats> PostureStatistics::postures(const SessionFilter& filter) const{
    return postureBreakdown(load(filter));
}

bool PostureStatistics::daily(const std::string& date, const std::string& deviceId, DailyStats& out) const{
    return dailyStats(date, load(SessionFilter{date, date, deviceId}), out);
}

DailyScore PostureStatistics::score(const std::string& date, const std::string& deviceId) const{
    return scoreDay(date, load(SessionFilter{date, date, deviceId}), policy);
}

StatsSummary PostureStatistics::summary(int days, const std::string& deviceId, const std::string& today) const{
    const std::string start = shiftDate(today, -days);
    return summarize(load(SessionFilter{start, today, deviceId}), start + " ~ " + today);
}

bool PostureStatistics::reset(bool confirm, std::size_t& deleted, std::string& error){
    deleted = 0;
    if(!confirm){
        error = "reset requires explicit confirmation";
        return false;
    }
    if(!log->reset(deleted)){
        error = "failed to truncate the classification log";
        return false;
    }
    return true;
}
