#ifndef SONDE_WORKLOAD_WORKLOAD_HPP
#define SONDE_WORKLOAD_WORKLOAD_HPP

#include <memory>
#include <string>
#include <vector>

#include <sonde/authority/identity.hpp>
#include <sonde/cluster/cluster_client.hpp>
#include <sonde/common/result.hpp>
#include <sonde/common/status.hpp>

namespace sonde {
class ResultQueue;
class Signal;

enum class WorkloadScope { Cluster, PerNode };

/** @brief A pluggable unit of work dispatched against the cluster.
 *
 * The orchestrator only knows what a workload owes (expectedResults), how to
 * start it (run), how to watch it (monitor) and how to tear it down
 * (cleanup). Results themselves come back over the result transport,
 * authenticated with the identity given to run().
 */
class Workload {
  public:
  virtual ~Workload() = default;

  virtual const std::string& name() const = 0;
  virtual const std::string& resultKind() const = 0;

  virtual ExpectedResults expectedResults(const Nodes& nodes) const = 0;

  /// Nodes is the node set the expected results were computed from.
  virtual sonde_status run(ClusterClient& client,
                           const Nodes& nodes,
                           const std::string& advertiseAddress,
                           const CertificateIdentity& identity) = 0;

  /** @brief Watches the dispatched workload until stop is raised.
   *
   * Runtime failures are reported as error results pushed into the queue.
   * Must return soon after stop was raised.
   */
  virtual void monitor(ClusterClient& client,
                       const Nodes& nodes,
                       ResultQueue& queue,
                       const Signal& stop) = 0;

  virtual sonde_status cleanup(ClusterClient& client) = 0;
};

using WorkloadPtr = std::shared_ptr<Workload>;
using Workloads = std::vector<WorkloadPtr>;

/// One global slot for Cluster scope, one slot per node for PerNode scope.
ExpectedResults
ExpectedResultsForScope(WorkloadScope scope,
                        const std::string& producer,
                        const std::string& kind,
                        const Nodes& nodes);

const char*
WorkloadScopeToStr(WorkloadScope scope);
}

#endif
