#pragma once
// Derived implementation of the generated base component
#include <memory>
#include <string>
#include "deployments/PostureMonitor/Components/PostureClassifier/PostureClassifierComponentAc.hpp"
#include "ClassificationLog.hpp"
#include "EnsembleClassifier.hpp"
#include "PosturePolicy.hpp"
#include "PostureStatistics.hpp"
#include "SessionManager.hpp"

struct PostureServiceConfig {
    std::string host{"0.0.0.0"};
    U16 port{8765};
    std::string modelDir{"models"};
    std::string logPath{"posture_log.csv"};
    std::string policyPath{"config/posture.cfg"};
    U32 maxClients{100};
};

class PostureClassifierComponentImpl : public ::PostureMonitor::PostureClassifierComponentBase,
                                       public SessionObserver {
  public:
    explicit PostureClassifierComponentImpl(const char* compName);
    ~PostureClassifierComponentImpl();

    // Loads policy and models and prepares the session manager. Call after
    // the component is connected so load problems reach the event log.
    void configure(const PostureServiceConfig& config);
    bool startServer();
    void stopServer();

  private:
    // Port handler: schedIn
    void schedIn_handler(FwIndexType portNum, U32 context) override;

    // Command handlers
    void RESET_HISTORY_cmdHandler(FwOpcodeType opCode, U32 cmdSeq, bool confirm) override;
    void REPORT_SCORE_cmdHandler(FwOpcodeType opCode, U32 cmdSeq, const Fw::CmdStringArg& date) override;

    // SessionObserver, called from connection threads
    void onConnected(const ClientSession& session) override;
    void onDisconnected(const ClientSession& session, double durationSeconds) override;
    void onFrameProcessed(const std::string& clientId, const SensorFrame& frame, const ClassificationResult& result) override;
    void onFrameRejected(const std::string& clientId, const FrameError& err) override;
    void onLogAppendFailed(const std::string& clientId) override;
    void onWarning(const std::string& clientId, const std::string& message) override;

    PostureServiceConfig cfg;
    PosturePolicy policy;
    std::shared_ptr<CsvClassificationLog> log;
    std::unique_ptr<PostureStatistics> stats;
    std::unique_ptr<SessionManager> manager;
};
