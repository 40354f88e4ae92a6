#ifndef SONDE_COMMON_RANDOM_HPP
#define SONDE_COMMON_RANDOM_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

double
sonde_double_uniform_distribution(double min, double max);

namespace sonde {
/** @brief Interval to sleep between two periodic ticks.
 *
 * Returns interval + uniform[0, jitterFactor * interval). A jitter factor <= 0
 * disables jitter.
 */
std::chrono::milliseconds
JitteredInterval(std::chrono::milliseconds interval, double jitterFactor);
}

#endif
