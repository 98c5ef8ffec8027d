#include "Topology.hpp"

#include <Os/Os.hpp>
#include <Os/Task.hpp>

#include <Fw/Time/TimeInterval.hpp>

#include <cstdlib>
#include <csignal>
#include <getopt.h>
#include <iostream>
#include <string>

namespace {

using namespace PostureMonitorApp;

volatile std::sig_atomic_t g_shouldStop = 0;

void handleSignal(int) {
    g_shouldStop = 1;
}

void printUsage(const char* app) {
    std::cout << "Usage: " << app << " [options]\n"
              << "  -g <addr>   Bind address for the GDS TCP server (default: 0.0.0.0 or POSTURE_GDS_HOST)\n"
              << "  -q <port>   Port for the GDS TCP server (default: 50000 or POSTURE_GDS_PORT)\n"
              << "  -a <addr>   Bind address for sensor frames (default: 0.0.0.0 or POSTURE_HOST)\n"
              << "  -p <port>   Port for sensor frames (default: 8765 or POSTURE_PORT)\n"
              << "  -m <dir>    Model directory (default: models or POSTURE_MODEL_DIR)\n"
              << "  -l <file>   Classification log (default: posture_log.csv or POSTURE_LOG)\n"
              << "  -c <file>   Policy file (default: config/posture.cfg or POSTURE_POLICY)\n"
              << "  -n <count>  Maximum concurrent clients (default: 100 or POSTURE_MAX_CLIENTS)\n"
              << "  -h          Show this help message\n";
}

U16 parsePort(const char* text, U16 fallback) {
    if (text == nullptr) {
        return fallback;
    }
    const long value = std::strtol(text, nullptr, 10);
    if (value <= 0 || value > 65535) {
        return fallback;
    }
    return static_cast<U16>(value);
}

U32 parseCount(const char* text, U32 fallback) {
    if (text == nullptr) {
        return fallback;
    }
    const long value = std::strtol(text, nullptr, 10);
    return value > 0 ? static_cast<U32>(value) : fallback;
}

std::string envOr(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

}  // namespace

int main(int argc, char* argv[]) {
    Os::init();

    std::string gdsHost = envOr("POSTURE_GDS_HOST", "0.0.0.0");
    U16 gdsPort = parsePort(std::getenv("POSTURE_GDS_PORT"), static_cast<U16>(50000));
    std::string host = envOr("POSTURE_HOST", "0.0.0.0");
    U16 port = parsePort(std::getenv("POSTURE_PORT"), static_cast<U16>(8765));
    std::string modelDir = envOr("POSTURE_MODEL_DIR", "models");
    std::string logPath = envOr("POSTURE_LOG", "posture_log.csv");
    std::string policyPath = envOr("POSTURE_POLICY", "config/posture.cfg");
    U32 maxClients = parseCount(std::getenv("POSTURE_MAX_CLIENTS"), 100);

    int opt = 0;
    while ((opt = ::getopt(argc, argv, "hg:q:a:p:m:l:c:n:")) != -1) {
        switch (opt) {
            case 'g':
                gdsHost = optarg;
                break;
            case 'q':
                gdsPort = parsePort(optarg, gdsPort);
                break;
            case 'a':
                host = optarg;
                break;
            case 'p':
                port = parsePort(optarg, port);
                break;
            case 'm':
                modelDir = optarg;
                break;
            case 'l':
                logPath = optarg;
                break;
            case 'c':
                policyPath = optarg;
                break;
            case 'n':
                maxClients = parseCount(optarg, maxClients);
                break;
            case 'h':
            default:
                printUsage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    PostureMonitorApp::TopologyState state{};
    state.gdsHostname = gdsHost.c_str();
    state.gdsPort = gdsPort;
    state.postureHost = host.c_str();
    state.posturePort = port;
    state.modelDir = modelDir.c_str();
    state.logPath = logPath.c_str();
    state.policyPath = policyPath.c_str();
    state.maxClients = maxClients;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    setupTopology(state);
    startRateGroups(Fw::TimeInterval(1, 0));

    while (!g_shouldStop) {
        Os::Task::delay(Fw::TimeInterval(0, 250000000));  // 250ms sleep
    }

    stopRateGroups();
    teardownTopology(state);
    return 0;
}
