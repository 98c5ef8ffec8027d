#include "PostureClassifierComponentImpl.hpp"
#include "ModelBundle.hpp"
#include "TimeUtil.hpp"
#include <Fw/Logger/Logger.hpp>
#include <chrono>
#include <memory>

namespace {

// Throughput goes out as telemetry on schedIn, not through the reporter.
constexpr std::chrono::hours kReporterInterval{24};

}  // namespace

PostureClassifierComponentImpl::PostureClassifierComponentImpl(const char* compName)
: PostureClassifierComponentBase(compName) {}

PostureClassifierComponentImpl::~PostureClassifierComponentImpl(){
    stopServer();
}

void PostureClassifierComponentImpl::configure(const PostureServiceConfig& config){
    cfg = config;
    if(!policy.load(cfg.policyPath)){
        Fw::Logger::log("[WARN] Policy file %s not found, using defaults\n", cfg.policyPath.c_str());
    }

    std::shared_ptr<const ModelBundle> bundle = ModelBundle::load(cfg.modelDir, policy);
    for(const auto& line : bundle->loadReport()){
        Fw::Logger::log("[INFO] models: %s\n", line.c_str());
        if(line.compare(0, 7, "failed:") == 0){
            Fw::LogStringArg detail(line.c_str());
            this->log_WARNING_HI_ModelLoadFailed(detail);
        }
    }
    auto classifier = std::make_shared<const EnsembleClassifier>(bundle, policy);
    for(const auto& w : classifier->startupWarnings()){
        Fw::LogStringArg detail(w.c_str());
        this->log_WARNING_LO_ClassifierWarning(detail);
    }

    log = std::make_shared<CsvClassificationLog>(cfg.logPath);
    stats = std::make_unique<PostureStatistics>(log, policy);

    SessionManagerConfig smc;
    smc.host = cfg.host;
    smc.port = cfg.port;
    smc.maxClients = cfg.maxClients;
    smc.reportInterval = kReporterInterval;
    manager = std::make_unique<SessionManager>(classifier, log, smc);
    manager->addObserver(this);
}

bool PostureClassifierComponentImpl::startServer(){
    if(!manager) return false;
    std::string error;
    if(!manager->start(error)){
        Fw::Logger::log("[WARN] Posture server %s:%hu failed: %s\n", cfg.host.c_str(), cfg.port, error.c_str());
        Fw::LogStringArg reason(error.c_str());
        this->log_WARNING_HI_ServerStartFailed(reason);
        return false;
    }
    Fw::Logger::log("[INFO] Posture server listening on %s:%hu\n", cfg.host.c_str(), manager->boundPort());
    return true;
}

void PostureClassifierComponentImpl::stopServer(){
    if(manager) manager->stop();
}

// ----------------------------------------------------------------------
// Handlers
// ----------------------------------------------------------------------

void PostureClassifierComponentImpl::schedIn_handler(FwIndexType, U32){
    if(!manager) return;
    const ThroughputSnapshot s = manager->snapshot();
    this->tlmWrite_PredictionsPerSecond(static_cast<F32>(s.predictionsPerSecond));
    this->tlmWrite_MeanLatencyMs(static_cast<F32>(s.meanLatencyMs));
    this->tlmWrite_ActiveConnections(static_cast<U32>(s.activeClients));
    this->tlmWrite_TotalPredictions(static_cast<U64>(s.totalPredictions));
}

void PostureClassifierComponentImpl::RESET_HISTORY_cmdHandler(FwOpcodeType opCode, U32 cmdSeq, bool confirm){
    if(!stats){
        this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::EXECUTION_ERROR);
        return;
    }
    std::size_t deleted = 0;
    std::string error;
    if(!stats->reset(confirm, deleted, error)){
        Fw::LogStringArg reason(error.c_str());
        this->log_WARNING_LO_HistoryResetFailed(reason);
        this->cmdResponse_out(opCode, cmdSeq, confirm ? Fw::CmdResponse::EXECUTION_ERROR : Fw::CmdResponse::VALIDATION_ERROR);
        return;
    }
    this->log_ACTIVITY_HI_HistoryReset(static_cast<U64>(deleted));
    this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
}

void PostureClassifierComponentImpl::REPORT_SCORE_cmdHandler(FwOpcodeType opCode, U32 cmdSeq, const Fw::CmdStringArg& date){
    std::string day = date.toChar();
    if(day.empty() || day == "today") day = utcDate(wallClockMs());
    if(!isDate(day)){
        Fw::LogStringArg bad(day.c_str());
        this->log_WARNING_LO_InvalidDate(bad);
        this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::VALIDATION_ERROR);
        return;
    }
    if(!stats){
        this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::EXECUTION_ERROR);
        return;
    }
    const DailyScore score = stats->score(day, "");
    Fw::LogStringArg d(score.date.c_str());
    Fw::LogStringArg grade(score.grade.c_str());
    Fw::LogStringArg feedback(score.feedback.c_str());
    this->log_ACTIVITY_HI_DailyScore(d, static_cast<U32>(score.totalScore), grade, feedback);
    this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
}

// ----------------------------------------------------------------------
// Session events
// ----------------------------------------------------------------------

void PostureClassifierComponentImpl::onConnected(const ClientSession& session){
    Fw::LogStringArg id(session.clientId.c_str());
    this->log_ACTIVITY_LO_ClientConnected(id);
}

void PostureClassifierComponentImpl::onDisconnected(const ClientSession& session, double durationSeconds){
    Fw::LogStringArg id(session.clientId.c_str());
    this->log_ACTIVITY_LO_ClientDisconnected(id, static_cast<F32>(durationSeconds), static_cast<U64>(session.predictionsCount));
}

void PostureClassifierComponentImpl::onFrameProcessed(const std::string& clientId, const SensorFrame&, const ClassificationResult& result){
    if(result.method != ClassificationMethod::DegradedRandom) return;
    Fw::LogStringArg id(clientId.c_str());
    this->log_WARNING_HI_DegradedPrediction(id, static_cast<I32>(result.label));
}

void PostureClassifierComponentImpl::onFrameRejected(const std::string& clientId, const FrameError& err){
    Fw::LogStringArg id(clientId.c_str());
    Fw::LogStringArg error(err.error.c_str());
    Fw::LogStringArg details(err.details.c_str());
    this->log_WARNING_LO_FrameRejected(id, error, details);
}

void PostureClassifierComponentImpl::onLogAppendFailed(const std::string& clientId){
    Fw::LogStringArg id(clientId.c_str());
    this->log_WARNING_HI_LogAppendFailed(id);
}

void PostureClassifierComponentImpl::onWarning(const std::string& clientId, const std::string& message){
    const std::string text = clientId.empty() ? message : clientId + ": " + message;
    Fw::LogStringArg detail(text.c_str());
    this->log_WARNING_LO_ClassifierWarning(detail);
}
