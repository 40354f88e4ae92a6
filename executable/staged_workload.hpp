#ifndef SONDE_EXECUTABLE_STAGED_WORKLOAD_HPP
#define SONDE_EXECUTABLE_STAGED_WORKLOAD_HPP

#include <chrono>

#include <boost/filesystem/path.hpp>

#include <sonde/workload/workload.hpp>

#include "CLI.hpp"

namespace sonde {
/** @brief Workload run by an agent outside of this process.
 *
 * Dispatching stages everything the agent needs to submit its results in
 * <stagingRoot>/<name>: the client certificate and key, the CA certificate,
 * the endpoint and the participating nodes. An agent that fails reports the
 * reason by writing it to the file "error" in the same directory.
 */
class StagedWorkload : public Workload {
  public:
  StagedWorkload(WorkloadSpec spec,
                 boost::filesystem::path stagingRoot,
                 std::chrono::milliseconds pollInterval =
                   std::chrono::milliseconds(1000));
  ~StagedWorkload() override;

  const std::string& name() const override { return m_spec.name; }
  const std::string& resultKind() const override { return m_spec.kind; }

  ExpectedResults expectedResults(const Nodes& nodes) const override;

  sonde_status run(ClusterClient& client,
                   const Nodes& nodes,
                   const std::string& advertiseAddress,
                   const CertificateIdentity& identity) override;

  void monitor(ClusterClient& client,
               const Nodes& nodes,
               ResultQueue& queue,
               const Signal& stop) override;

  sonde_status cleanup(ClusterClient& client) override;

  const boost::filesystem::path& directory() const { return m_directory; }

  private:
  WorkloadSpec m_spec;
  boost::filesystem::path m_directory;
  std::chrono::milliseconds m_pollInterval;
};
}

#endif
