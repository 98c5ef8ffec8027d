#include "ClassificationLog.hpp"
#include "EnsembleClassifier.hpp"
#include "ModelBundle.hpp"
#include "PostureLabels.hpp"
#include "PosturePolicy.hpp"
#include "SessionManager.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_shouldStop = 0;

void handleSignal(int) {
    g_shouldStop = 1;
}

void printUsage(const char* app) {
    std::cout << "Usage: " << app << " [options]\n"
              << "  -a <addr>   Bind address (default: 0.0.0.0 or POSTURE_HOST)\n"
              << "  -p <port>   TCP port for sensor frames (default: 8765 or POSTURE_PORT)\n"
              << "  -m <dir>    Model directory holding models.cfg (default: models or POSTURE_MODEL_DIR)\n"
              << "  -l <file>   Classification log (default: posture_log.csv or POSTURE_LOG)\n"
              << "  -c <file>   Policy file (default: config/posture.cfg or POSTURE_POLICY)\n"
              << "  -i <sec>    Throughput report interval (default: 60 or POSTURE_STATS_INTERVAL)\n"
              << "  -n <count>  Maximum concurrent clients (default: 100 or POSTURE_MAX_CLIENTS)\n"
              << "  -h          Show this help message\n";
}

std::uint16_t parsePort(const char* text, std::uint16_t fallback) {
    if (text == nullptr) {
        return fallback;
    }
    const long value = std::strtol(text, nullptr, 10);
    if (value <= 0 || value > 65535) {
        return fallback;
    }
    return static_cast<std::uint16_t>(value);
}

long parsePositive(const char* text, long fallback) {
    if (text == nullptr) {
        return fallback;
    }
    const long value = std::strtol(text, nullptr, 10);
    return value > 0 ? value : fallback;
}

// Prints manager callbacks. Worker threads share the streams, hence the lock.
class ConsoleObserver : public SessionObserver {
public:
    void onConnected(const ClientSession& s) override {
        std::lock_guard<std::mutex> lock(mu);
        std::cout << "[INFO] client " << s.clientId << " connected" << std::endl;
    }
    void onDisconnected(const ClientSession& s, double durationSeconds) override {
        std::lock_guard<std::mutex> lock(mu);
        std::cout << "[INFO] client " << s.clientId << " disconnected after " << durationSeconds
                  << "s, " << s.predictionsCount << " predictions" << std::endl;
    }
    void onFrameProcessed(const std::string& clientId, const SensorFrame& frame, const ClassificationResult& r) override {
        if (r.method != ClassificationMethod::DegradedRandom) {
            return;
        }
        std::lock_guard<std::mutex> lock(mu);
        std::cerr << "[WARN] degraded prediction for client " << clientId << " frame " << frame.messageId
                  << ": " << postureName(r.label) << std::endl;
    }
    void onFrameRejected(const std::string& clientId, const FrameError& err) override {
        std::lock_guard<std::mutex> lock(mu);
        std::cerr << "[WARN] client " << clientId << " frame " << err.id.dump() << " rejected: "
                  << err.error << " (" << err.details << ")" << std::endl;
    }
    void onLogAppendFailed(const std::string& clientId) override {
        std::lock_guard<std::mutex> lock(mu);
        std::cerr << "[WARN] classification log append failed for client " << clientId << std::endl;
    }
    void onWarning(const std::string& clientId, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mu);
        std::cerr << "[WARN] " << (clientId.empty() ? std::string("server") : clientId) << ": " << message << std::endl;
    }
    void onThroughput(const ThroughputSnapshot& s) override {
        std::lock_guard<std::mutex> lock(mu);
        std::cout << "[INFO] clients=" << s.activeClients << " predictions=" << s.totalPredictions
                  << " rate=" << s.predictionsPerSecond << "/s mean_latency=" << s.meanLatencyMs << "ms"
                  << " uptime=" << s.uptimeSeconds << "s" << std::endl;
    }

private:
    std::mutex mu;
};

}  // namespace

int main(int argc, char* argv[]) {
    const char* envHost = std::getenv("POSTURE_HOST");
    const char* envModels = std::getenv("POSTURE_MODEL_DIR");
    const char* envLog = std::getenv("POSTURE_LOG");
    const char* envPolicy = std::getenv("POSTURE_POLICY");

    SessionManagerConfig config;
    config.host = envHost ? envHost : "0.0.0.0";
    config.port = parsePort(std::getenv("POSTURE_PORT"), 8765);
    config.maxClients = static_cast<std::size_t>(parsePositive(std::getenv("POSTURE_MAX_CLIENTS"), 100));
    long intervalSec = parsePositive(std::getenv("POSTURE_STATS_INTERVAL"), 60);
    std::string modelDir = envModels ? envModels : "models";
    std::string logPath = envLog ? envLog : "posture_log.csv";
    std::string policyPath = envPolicy ? envPolicy : "config/posture.cfg";

    int opt = 0;
    while ((opt = ::getopt(argc, argv, "ha:p:m:l:c:i:n:")) != -1) {
        switch (opt) {
            case 'a':
                config.host = optarg;
                break;
            case 'p':
                config.port = parsePort(optarg, config.port);
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
            case 'i':
                intervalSec = parsePositive(optarg, intervalSec);
                break;
            case 'n':
                config.maxClients = static_cast<std::size_t>(parsePositive(optarg, static_cast<long>(config.maxClients)));
                break;
            case 'h':
            default:
                printUsage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }
    config.reportInterval = std::chrono::seconds(intervalSec);

    PosturePolicy policy;
    if (!policy.load(policyPath)) {
        std::cout << "[INFO] policy " << policyPath << " not found, using defaults" << std::endl;
    }

    std::shared_ptr<const ModelBundle> bundle = ModelBundle::load(modelDir, policy);
    for (const auto& line : bundle->loadReport()) {
        std::cout << "[INFO] models: " << line << std::endl;
    }
    auto classifier = std::make_shared<const EnsembleClassifier>(bundle, policy);
    for (const auto& w : classifier->startupWarnings()) {
        std::cerr << "[WARN] " << w << std::endl;
    }

    auto log = std::make_shared<CsvClassificationLog>(logPath);
    ConsoleObserver console;
    SessionManager manager(classifier, log, config);
    manager.addObserver(&console);

    std::string error;
    if (!manager.start(error)) {
        std::cerr << "[ERROR] cannot start server on " << config.host << ":" << config.port << ": " << error << std::endl;
        return 1;
    }
    std::cout << "[INFO] listening on " << config.host << ":" << manager.boundPort()
              << " (log " << logPath << ")" << std::endl;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
    while (!g_shouldStop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    manager.stop();
    std::cout << "[INFO] server stopped" << std::endl;
    return 0;
}
