#include "cleanup.hpp"

#include <sonde/common/log.hpp>

namespace sonde {
std::size_t
Cleanup(ClusterClient& client, const Workloads& workloads) {
  std::size_t failures = 0;
  for(const auto& w : workloads) {
    sonde_status s = SONDE_GENERIC_ERROR;
    try {
      s = w->cleanup(client);
    } catch(const std::exception& e) {
      sonde_log(SONDE_WORKLOAD,
                SONDE_LOCALERROR,
                "Exception while cleaning up workload {}: {}",
                w->name(),
                e.what());
    }

    if(s != SONDE_OK) {
      ++failures;
      sonde_log(SONDE_WORKLOAD,
                SONDE_LOCALWARNING,
                "Could not clean up workload {}! Status: {}",
                w->name(),
                sonde_status_to_str(s));
    } else {
      sonde_log(
        SONDE_WORKLOAD, SONDE_DEBUG, "Cleaned up workload {}.", w->name());
    }
  }
  return failures;
}
}
