#include "ThroughputTracker.hpp"
#include <numeric>

ThroughputTracker::ThroughputTracker() : started(Clock::now()) {}

void ThroughputTracker::record(double latencyMs){
    std::lock_guard<std::mutex> lock(mu);
    ++total;
    latencies.push_back(latencyMs);
    if(latencies.size() > kWindow) latencies.pop_front();
}

ThroughputSnapshot ThroughputTracker::snapshot(std::size_t activeClients) const{
    std::lock_guard<std::mutex> lock(mu);
    ThroughputSnapshot s;
    s.activeClients = activeClients;
    s.totalPredictions = total;
    s.uptimeSeconds = std::chrono::duration<double>(Clock::now() - started).count();
    if(s.uptimeSeconds > 0.0) s.predictionsPerSecond = static_cast<double>(total) / s.uptimeSeconds;
    if(!latencies.empty()){
        s.meanLatencyMs = std::accumulate(latencies.begin(), latencies.end(), 0.0) / static_cast<double>(latencies.size());
    }
    return s;
}
