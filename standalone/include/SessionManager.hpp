#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "ClassificationLog.hpp"
#include "EnsembleClassifier.hpp"
#include "FrameCodec.hpp"
#include "ThroughputTracker.hpp"

enum class ConnectionState { Connecting, Active, Closed };

struct ClientSession {
    std::string clientId;
    std::int64_t connectTimeMs{0};
    std::int64_t lastActivityMs{0};
    std::uint64_t predictionsCount{0};
};

// Callbacks fire on connection worker threads (onThroughput on the reporter
// thread). Implementations must be thread safe.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    virtual void onConnected(const ClientSession&) {}
    virtual void onDisconnected(const ClientSession&, double /*durationSeconds*/) {}
    virtual void onFrameProcessed(const std::string& /*clientId*/, const SensorFrame&, const ClassificationResult&) {}
    virtual void onFrameRejected(const std::string& /*clientId*/, const FrameError&) {}
    virtual void onLogAppendFailed(const std::string& /*clientId*/) {}
    virtual void onWarning(const std::string& /*clientId*/, const std::string& /*message*/) {}
    virtual void onThroughput(const ThroughputSnapshot&) {}
};

struct SessionManagerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8765};  // 0 picks an ephemeral port
    std::size_t maxClients{100};
    std::chrono::milliseconds reportInterval{std::chrono::seconds(60)};
};

// Owns the live connection table. Each accepted TCP connection gets its own
// worker thread that reads newline-delimited JSON frames and answers them in
// arrival order on the same socket.
class SessionManager {
public:
    SessionManager(std::shared_ptr<const EnsembleClassifier> classifier,
                   std::shared_ptr<ClassificationLog> log,
                   SessionManagerConfig config);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Must be called before start(). The observer must outlive the manager.
    void addObserver(SessionObserver* observer);

    bool start(std::string& error);
    void stop();
    bool running() const { return isRunning.load(); }
    std::uint16_t boundPort() const { return port; }

    // Transport-independent session lifecycle and per-frame entry point.
    // registerClient fails once maxClients sessions are live.
    bool registerClient(std::string& clientId);
    void unregisterClient(const std::string& clientId);
    std::string handleMessage(const std::string& clientId, const std::string& text);

    ThroughputSnapshot snapshot() const;
    std::size_t activeClients() const;
    std::vector<ClientSession> sessions() const;

private:
    struct Connection {
        int fd{-1};
        std::atomic<ConnectionState> state{ConnectionState::Connecting};
        std::thread worker;
    };

    void acceptLoop();
    void serve(const std::shared_ptr<Connection>& conn);
    void reportLoop();
    void reapFinished();
    bool sendLine(int fd, const std::string& payload);
    void closeConnection(Connection& conn);
    void warn(const std::string& clientId, const std::string& message);

    std::shared_ptr<const EnsembleClassifier> classifier;
    std::shared_ptr<ClassificationLog> log;
    SessionManagerConfig config;
    std::vector<SessionObserver*> observers;
    ThroughputTracker tracker;

    mutable std::mutex sessionsMu;
    std::map<std::string, ClientSession> live;

    std::mutex connectionsMu;
    std::vector<std::shared_ptr<Connection>> connections;

    std::atomic<bool> isRunning{false};
    int listenFd{-1};
    std::uint16_t port{0};
    std::thread acceptThread;
    std::thread reporterThread;
    std::mutex reportMu;
    std::condition_variable reportCv;
};
