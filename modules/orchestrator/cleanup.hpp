#pragma once

#include <cstddef>

#include <sonde/workload/workload.hpp>

namespace sonde {
/** @brief Asks every workload to tear down what it created in the cluster.
 *
 * Workloads are cleaned up independently, a failing one is logged and does
 * not keep the others from running. Returns the number of failures.
 */
std::size_t
Cleanup(ClusterClient& client, const Workloads& workloads);
}
