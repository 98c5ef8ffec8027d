#include "TimeUtil.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

std::int64_t wallClockMs(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

namespace {

std::tm toUtc(std::int64_t ms){
    std::time_t secs = static_cast<std::time_t>(ms >= 0 ? ms / 1000 : (ms - 999) / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    return tm;
}

bool parseDate(const std::string& text, std::tm& tm){
    int y = 0, m = 0, d = 0;
    char tail = 0;
    if(text.size() != 10 || std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3) return false;
    if(m < 1 || m > 12 || d < 1 || d > 31) return false;
    tm = std::tm{};
    tm.tm_year = y - 1900; tm.tm_mon = m - 1; tm.tm_mday = d;
    // Reject dates timegm would roll over (2026-02-30).
    std::tm check = tm;
    const std::time_t t = timegm(&check);
    return t != static_cast<std::time_t>(-1) && check.tm_mday == d && check.tm_mon == m - 1;
}

}  // namespace

std::string formatUtc(std::int64_t ms){
    const std::tm tm = toUtc(ms);
    const int millis = static_cast<int>(((ms % 1000) + 1000) % 1000);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

std::string utcDate(std::int64_t ms){
    const std::tm tm = toUtc(ms);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return buf;
}

bool isDate(const std::string& text){
    std::tm tm{};
    return parseDate(text, tm);
}

std::int64_t dateStartMs(const std::string& date){
    std::tm tm{};
    if(!parseDate(date, tm)) return -1;
    return static_cast<std::int64_t>(timegm(&tm)) * 1000;
}

std::string shiftDate(const std::string& date, int days){
    const std::int64_t start = dateStartMs(date);
    if(start < 0) return std::string();
    return utcDate(start + static_cast<std::int64_t>(days) * 86400000LL);
}
