#include <sonde/workload/workload.hpp>

namespace sonde {
ExpectedResults
ExpectedResultsForScope(WorkloadScope scope,
                        const std::string& producer,
                        const std::string& kind,
                        const Nodes& nodes) {
  ExpectedResults expected;
  switch(scope) {
    case WorkloadScope::Cluster:
      expected.push_back({ producer, GlobalLocus, kind });
      break;
    case WorkloadScope::PerNode:
      expected.reserve(nodes.size());
      for(const auto& node : nodes) {
        expected.push_back({ producer, node, kind });
      }
      break;
  }
  return expected;
}

const char*
WorkloadScopeToStr(WorkloadScope scope) {
  switch(scope) {
    case WorkloadScope::Cluster:
      return "cluster";
    case WorkloadScope::PerNode:
      return "per-node";
  }
  return "!";
}
}
