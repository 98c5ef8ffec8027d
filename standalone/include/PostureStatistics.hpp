#pragma once
#include <memory>
#include <string>
#include <vector>
#include "ClassificationLog.hpp"
#include "PostureAggregator.hpp"
#include "PosturePolicy.hpp"

// Read side of the classification history. Shares the log handle with the
// live server but no other state.
class PostureStatistics {
public:
    static constexpr std::size_t kDefaultSessionLimit = 100;
    static constexpr int kDefaultSummaryDays = 7;

    PostureStatistics(std::shared_ptr<ClassificationLog> log, PosturePolicy policy);

    // The most recent limit sessions, oldest first.
    std::vector<PostureSession> sessions(const SessionFilter& filter, std::size_t limit = kDefaultSessionLimit) const;
    std::vector<PostureTimeStats> postures(const SessionFilter& filter) const;
    bool daily(const std::string& date, const std::string& deviceId, DailyStats& out) const;
    DailyScore score(const std::string& date, const std::string& deviceId) const;
    // Covers [today - days, today].
    StatsSummary summary(int days, const std::string& deviceId, const std::string& today) const;

    // Deletes the whole history. Refused unless confirm is set.
    bool reset(bool confirm, std::size_t& deleted, std::string& error);

private:
    std::vector<PostureSession> load(const SessionFilter& filter) const;

    std::shared_ptr<ClassificationLog> log;
    PosturePolicy policy;
};
