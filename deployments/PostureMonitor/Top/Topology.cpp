#include "Topology.hpp"

#include <deployments/PostureMonitor/Components/PostureClassifier/PostureClassifierComponentImpl.hpp>
#include <AppTopologyAc.hpp>

#include <Drv/Ip/IpSocket.hpp>
#include <Drv/TcpServer/TcpServerComponentImpl.hpp>
#include <Fw/Logger/Logger.hpp>
#include <Fw/Types/String.hpp>
#include <Svc/ActiveRateGroup/ActiveRateGroup.hpp>
#include <Svc/RateGroupDriver/RateGroupDriver.hpp>

#include <Os/Task.hpp>

using namespace PostureMonitorApp;

namespace PostureMonitorApp {
namespace ConfigObjects {
namespace CdhCore_health {
Svc::HealthImpl::PingEntry pingEntries[3] = {
    {PingEntries::CdhCore_cmdDisp::WARN, PingEntries::CdhCore_cmdDisp::FATAL, Fw::String("cmdDisp")},
    {PingEntries::CdhCore_events::WARN, PingEntries::CdhCore_events::FATAL, Fw::String("events")},
    {PingEntries::CdhCore_tlmSend::WARN, PingEntries::CdhCore_tlmSend::FATAL, Fw::String("tlmSend")},
};
}  // namespace CdhCore_health
}  // namespace ConfigObjects
}  // namespace PostureMonitorApp

namespace {

// ----------------------------------------------------------------------
// Scheduler configuration
// ----------------------------------------------------------------------

constexpr FwTaskPriorityType kComDriverPriority = 100;
constexpr Os::Task::ParamType kComDriverStack = Os::Task::TASK_DEFAULT;
constexpr Os::Task::ParamType kComDriverCpu = Os::Task::TASK_DEFAULT;

Svc::RateGroupDriver::DividerSet g_rateDivisors{{{1, 0}}};
U32 g_rateGroupContext[Svc::ActiveRateGroup::CONNECTION_COUNT_MAX] = {};

// ----------------------------------------------------------------------
// Posture service
// ----------------------------------------------------------------------

PostureServiceConfig serviceConfig(const TopologyState& state) {
    PostureServiceConfig config;
    if (state.postureHost) {
        config.host = state.postureHost;
    }
    if (state.posturePort != 0) {
        config.port = state.posturePort;
    }
    if (state.modelDir) {
        config.modelDir = state.modelDir;
    }
    if (state.logPath) {
        config.logPath = state.logPath;
    }
    if (state.policyPath) {
        config.policyPath = state.policyPath;
    }
    if (state.maxClients != 0) {
        config.maxClients = state.maxClients;
    }
    return config;
}

void configureComponents(const TopologyState& state) {
    rateGroupDriverComp.configure(g_rateDivisors);
    rateGroup1Comp.configure(g_rateGroupContext, FW_NUM_ARRAY_ELEMENTS(g_rateGroupContext));

    const char* host = state.gdsHostname ? state.gdsHostname : "0.0.0.0";
    const U16 port = state.gdsPort != 0 ? state.gdsPort : static_cast<U16>(50000);
    const Drv::SocketIpStatus status = comDriver.configure(host, port);
    if (status != Drv::SOCK_SUCCESS) {
        Fw::Logger::log("[WARN] TcpServer configure(%s:%hu) failed with status %d\n", host, port, status);
    }
    comDriver.setAutomaticOpen(true);

    postureClassifier.configure(serviceConfig(state));
}

}  // namespace

namespace PostureMonitorApp {

void setupTopology(const TopologyState& state) {
    initComponents(state);
    setBaseIds();
    connectComponents();
    regCommands();
    configComponents(state);
    configureComponents(state);
    loadParameters();
    startTasks(state);

    // Start the TCP server read task
    Os::TaskString recvTask("TcpServer");
    comDriver.start(recvTask, kComDriverPriority, kComDriverStack, kComDriverCpu);

    // Sensor frames are served outside the rate groups, one thread per client
    if (!postureClassifier.startServer()) {
        Fw::Logger::log("[WARN] Continuing without the posture server\n");
    }
}

void startRateGroups(const Fw::TimeInterval& interval) {
    linuxTimer.startTimer(interval);
}

void stopRateGroups() {
    linuxTimer.quit();
}

void teardownTopology(const TopologyState& state) {
    // Stop client threads first so no event is emitted after teardown begins
    postureClassifier.stopServer();

    // Stop server tasks
    comDriver.stopReconnect();
    comDriver.stop();
    (void)comDriver.joinReconnect();
    (void)comDriver.join();

    stopTasks(state);
    freeThreads(state);
    tearDownComponents(state);
}

}  // namespace PostureMonitorApp
