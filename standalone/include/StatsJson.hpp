#pragma once
#include <nlohmann/json.hpp>
#include "PostureAggregator.hpp"

// JSON renderings used by the statistics CLI. Minutes and percentages are
// rounded to two decimals, timestamps rendered as UTC text.
void to_json(nlohmann::json& j, const PostureSession& s);
void to_json(nlohmann::json& j, const PostureTimeStats& t);
void to_json(nlohmann::json& j, const DailyScore& d);
void to_json(nlohmann::json& j, const DailyStats& d);
void to_json(nlohmann::json& j, const StatsSummary& s);
