#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

struct ThroughputSnapshot {
    std::size_t activeClients{0};
    std::uint64_t totalPredictions{0};
    double predictionsPerSecond{0.0};
    double meanLatencyMs{0.0};
    double uptimeSeconds{0.0};
};

// Prediction counter plus a rolling window of the most recent latencies.
class ThroughputTracker {
public:
    static constexpr std::size_t kWindow = 100;

    ThroughputTracker();

    void record(double latencyMs);
    ThroughputSnapshot snapshot(std::size_t activeClients) const;

private:
    using Clock = std::chrono::steady_clock;

    mutable std::mutex mu;
    Clock::time_point started;
    std::uint64_t total{0};
    std::deque<double> latencies;
};
