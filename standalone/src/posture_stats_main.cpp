#include "ClassificationLog.hpp"
#include "PostureLabels.hpp"
#include "PosturePolicy.hpp"
#include "PostureStatistics.hpp"
#include "StatsJson.hpp"
#include "TimeUtil.hpp"

#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

struct StatsOptions {
    std::string logPath{"posture_log.csv"};
    std::string policyPath{"config/posture.cfg"};
    SessionFilter filter;
    std::size_t limit{PostureStatistics::kDefaultSessionLimit};
    int days{PostureStatistics::kDefaultSummaryDays};
    bool confirm{false};
    std::string date;
};

void printUsage(const char* app) {
    std::cout << "Usage: " << app << " <command> [options]\n"
              << "Commands:\n"
              << "  sessions [-s start] [-e end] [-d device] [-n limit]   Posture sessions, most recent last\n"
              << "  postures [-s start] [-e end] [-d device]              Time spent per posture\n"
              << "  daily <date> [-d device]                              Per-posture breakdown for one day\n"
              << "  score <date|today> [-d device]                        Daily posture score\n"
              << "  summary [-n days] [-d device]                         Summary of the last days (default 7)\n"
              << "  reset --confirm                                       Delete the whole classification history\n"
              << "  labels                                                List posture labels\n"
              << "Options:\n"
              << "  -l <file>   Classification log (default: posture_log.csv or POSTURE_LOG)\n"
              << "  -c <file>   Policy file (default: config/posture.cfg or POSTURE_POLICY)\n"
              << "  -h          Show this help message\n";
}

int fail(const std::string& message) {
    std::cout << json{{"error", message}}.dump(2) << std::endl;
    return 1;
}

bool parseOptions(int argc, char* argv[], StatsOptions& opts, std::string& error) {
    static const struct option kLongOptions[] = {
        {"confirm", no_argument, nullptr, 'y'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };
    int opt = 0;
    while ((opt = ::getopt_long(argc, argv, "hl:c:s:e:d:n:", kLongOptions, nullptr)) != -1) {
        switch (opt) {
            case 'l':
                opts.logPath = optarg;
                break;
            case 'c':
                opts.policyPath = optarg;
                break;
            case 's':
                opts.filter.startDate = optarg;
                break;
            case 'e':
                opts.filter.endDate = optarg;
                break;
            case 'd':
                opts.filter.deviceId = optarg;
                break;
            case 'n': {
                const long value = std::strtol(optarg, nullptr, 10);
                if (value <= 0) {
                    error = std::string("invalid count: ") + optarg;
                    return false;
                }
                opts.limit = static_cast<std::size_t>(value);
                opts.days = static_cast<int>(value);
                break;
            }
            case 'y':
                opts.confirm = true;
                break;
            default:
                error = "unknown option";
                return false;
        }
    }
    if (optind < argc) {
        opts.date = argv[optind];
    }
    for (const std::string* d : {&opts.filter.startDate, &opts.filter.endDate}) {
        if (!d->empty() && !isDate(*d)) {
            error = "invalid date " + *d + ", expected YYYY-MM-DD";
            return false;
        }
    }
    return true;
}

json labelsJson(int classCount) {
    json postures = json::array();
    for (int label = 0; label < classCount; ++label) {
        postures.push_back({{"id", label}, {"name", postureName(label)}});
    }
    return json{{"postures", postures}, {"total_postures", classCount}};
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        printUsage(argv[0]);
        return argc < 2 ? 1 : 0;
    }
    const std::string command = argv[1];

    StatsOptions opts;
    if (const char* env = std::getenv("POSTURE_LOG")) {
        opts.logPath = env;
    }
    if (const char* env = std::getenv("POSTURE_POLICY")) {
        opts.policyPath = env;
    }
    std::string error;
    if (!parseOptions(argc - 1, argv + 1, opts, error)) {
        printUsage(argv[0]);
        return fail(error);
    }

    PosturePolicy policy;
    policy.load(opts.policyPath);
    auto log = std::make_shared<CsvClassificationLog>(opts.logPath);
    PostureStatistics stats(log, policy);
    const std::string today = utcDate(wallClockMs());

    if (command == "labels") {
        std::cout << labelsJson(policy.classCount).dump(2) << std::endl;
        return 0;
    }
    if (command == "sessions") {
        std::cout << json(stats.sessions(opts.filter, opts.limit)).dump(2) << std::endl;
        return 0;
    }
    if (command == "postures") {
        std::cout << json(stats.postures(opts.filter)).dump(2) << std::endl;
        return 0;
    }
    if (command == "daily" || command == "score") {
        const std::string date = (opts.date.empty() || opts.date == "today") ? today : opts.date;
        if (!isDate(date)) {
            return fail("invalid date " + date + ", expected YYYY-MM-DD");
        }
        if (command == "score") {
            std::cout << json(stats.score(date, opts.filter.deviceId)).dump(2) << std::endl;
            return 0;
        }
        DailyStats day;
        if (!stats.daily(date, opts.filter.deviceId, day)) {
            return fail("No data found for date: " + date);
        }
        std::cout << json(day).dump(2) << std::endl;
        return 0;
    }
    if (command == "summary") {
        std::cout << json(stats.summary(opts.days, opts.filter.deviceId, today)).dump(2) << std::endl;
        return 0;
    }
    if (command == "reset") {
        std::size_t deleted = 0;
        if (!stats.reset(opts.confirm, deleted, error)) {
            return fail(error + (opts.confirm ? "" : " (pass --confirm)"));
        }
        const json out = {
            {"success", true},
            {"message", "deleted " + std::to_string(deleted) + " records"},
            {"deleted_records", deleted},
            {"reset_timestamp", formatUtc(wallClockMs())},
        };
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    printUsage(argv[0]);
    return fail("unknown command " + command);
}
