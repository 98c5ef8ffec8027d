#pragma once
#include <cstdint>
#include <string>

std::int64_t wallClockMs();

// UTC renderings of a millisecond epoch timestamp.
std::string formatUtc(std::int64_t ms);   // YYYY-MM-DD HH:MM:SS.mmm
std::string utcDate(std::int64_t ms);     // YYYY-MM-DD

bool isDate(const std::string& text);
// Calendar arithmetic on YYYY-MM-DD; returns an empty string for bad input.
std::string shiftDate(const std::string& date, int days);
// Milliseconds at 00:00:00 UTC of date, or -1 for bad input.
std::int64_t dateStartMs(const std::string& date);
