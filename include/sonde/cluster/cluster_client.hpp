#ifndef SONDE_CLUSTER_CLUSTER_CLIENT_HPP
#define SONDE_CLUSTER_CLUSTER_CLIENT_HPP

#include <string>
#include <vector>

#include <sonde/common/status.hpp>

namespace sonde {
using Nodes = std::vector<std::string>;

/** @brief Access to the cluster a run is diagnosing.
 *
 * Implementations must be usable from multiple threads, as the annotation loop
 * and workload monitors call into the client concurrently.
 */
class ClusterClient {
  public:
  virtual ~ClusterClient() = default;

  /// Enumerates the names of all nodes taking part in the run.
  virtual sonde_status listNodes(Nodes& nodes) = 0;

  /// Sets annotation key to value on the named object in the namespace.
  virtual sonde_status annotate(const std::string& ns,
                                const std::string& object,
                                const std::string& key,
                                const std::string& value) = 0;
};
}

#endif
