#ifndef SONDE_ORCHESTRATOR_ORCHESTRATOR_HPP
#define SONDE_ORCHESTRATOR_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <sonde/cluster/cluster_client.hpp>
#include <sonde/common/config.hpp>
#include <sonde/common/result.hpp>
#include <sonde/common/status.hpp>
#include <sonde/workload/workload.hpp>

namespace sonde::transport {
class ResultTransport;
}

namespace sonde {
class ResultWriter;

enum class RunState {
  Pending,
  SetupFailed,
  Running,
  GracefullyStopping,
  Completed,
  TimedOut,
  ServerFailed
};

const char*
RunStateToStr(RunState state);

struct RunReport {
  RunState state = RunState::Pending;
  sonde_status status = SONDE_OK;

  ExpectedResults expected;
  Results results;

  bool graceCleanupRan = false;
  bool exitCleanupRan = false;

  std::chrono::milliseconds duration{ 0 };
};

/** @brief Drives one diagnostics run from dispatch to termination.
 *
 * run() blocks the calling thread until all expected results arrived, the
 * hard deadline passed or the result transport failed. Every thread started
 * during the run is joined before run() returns.
 */
class Orchestrator {
  public:
  using TransportTerminated = std::function<void(sonde_status)>;
  /// Sees the serving transport and the handler it reports its end to.
  using TransportObserver = std::function<void(transport::ResultTransport&,
                                               const TransportTerminated&)>;

  Orchestrator(RunConfig config,
               ClusterClient& client,
               Workloads workloads,
               ResultWriter* writer = nullptr);
  ~Orchestrator();

  sonde_status run();

  const RunReport& report() const { return m_report; }
  const RunConfig& config() const { return m_config; }

  /// Port the transport is bound to while run() is serving, 0 otherwise.
  uint16_t transportPort() const { return m_transportPort; }

  /// Called during run() once the result transport is serving.
  void setTransportObserver(TransportObserver observer) {
    m_transportObserver = std::move(observer);
  }

  private:
  struct RunScope;

  RunConfig m_config;
  ClusterClient& m_client;
  Workloads m_workloads;
  ResultWriter* m_writer;

  RunReport m_report;
  std::atomic_uint16_t m_transportPort = 0;
  TransportObserver m_transportObserver;

  sonde_status execute(RunScope& scope);
  sonde_status setup(RunScope& scope);
  void dispatch(RunScope& scope);
  sonde_status awaitTermination(RunScope& scope);
  void finishWriter();
};

/** @brief Address handed to workloads for submitting results.
 *
 * Appends the bound port if the advertise address does not name one.
 */
std::string
AdvertisedEndpoint(const std::string& advertiseAddress, uint16_t port);
}

#endif
