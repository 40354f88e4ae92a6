#ifndef SONDE_EXECUTABLE_CLI_HPP
#define SONDE_EXECUTABLE_CLI_HPP

#include <string>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <sonde/cluster/cluster_client.hpp>
#include <sonde/common/config.hpp>
#include <sonde/workload/workload.hpp>

namespace sonde {
/// A workload as given on the command line, name:scope[:kind].
struct WorkloadSpec {
  std::string name;
  WorkloadScope scope = WorkloadScope::Cluster;
  std::string kind = "default";
};

bool
ParseWorkloadSpec(const std::string& str, WorkloadSpec& spec);

class CLI {
  public:
  CLI();
  ~CLI();

  /// Returns false if the program should exit, exitCode tells how.
  bool parse(int argc, char* argv[], int& exitCode);

  const RunConfig& runConfig() const { return m_config; }
  const Nodes& nodes() const { return m_nodes; }
  const std::vector<WorkloadSpec>& workloads() const { return m_workloads; }
  const std::string& annotationsFile() const { return m_annotationsFile; }
  const std::string& getLocalName() const { return m_localName; }

  private:
  boost::program_options::options_description m_globalOptions{
    "Global Options"
  };
  boost::program_options::options_description m_transportOptions{
    "Transport Options"
  };
  boost::program_options::options_description m_orchestratorOptions{
    "Orchestrator Options"
  };
  boost::program_options::options_description m_annotatorOptions{
    "Annotator Options"
  };

  boost::program_options::variables_map m_vm;

  RunConfig m_config;
  Nodes m_nodes;
  std::vector<WorkloadSpec> m_workloads;
  std::string m_annotationsFile;
  std::string m_localName;

  bool m_traceMode = false;
  bool m_debugMode = false;
  bool m_infoMode = false;
};
}

#endif
