#ifndef SONDE_COMMON_CONFIG_HPP
#define SONDE_COMMON_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace sonde {
/// Lead time before the hard deadline for voluntary workload cleanup.
constexpr uint32_t DefaultGracePeriodSeconds = 60;
constexpr uint32_t DefaultAnnotationIntervalMS = 5000;
constexpr double DefaultJitterFactor = 1.2;
constexpr uint32_t DefaultCertificateValiditySeconds = 24 * 60 * 60;

/** @brief Timing of one run. Immutable once the run started.
 *
 * A total timeout of 0 disables both the grace and the hard deadline.
 */
struct RunTimeline {
  std::chrono::seconds totalTimeout{ 0 };
  std::chrono::seconds gracePeriod{ DefaultGracePeriodSeconds };
  std::chrono::milliseconds annotationInterval{ DefaultAnnotationIntervalMS };
  double jitterFactor = DefaultJitterFactor;

  bool hasDeadline() const { return totalTimeout.count() > 0; }

  /// Clamped to 0 if the grace period is longer than the total timeout.
  std::chrono::seconds graceDeadline() const {
    return totalTimeout > gracePeriod ? totalTimeout - gracePeriod
                                      : std::chrono::seconds(0);
  }
};

struct RunConfig {
  std::string bindAddress = "0.0.0.0";
  uint16_t bindPort = 8080;
  /// Address workloads use to reach the transport. May carry a port.
  std::string advertiseAddress = "127.0.0.1";

  std::string ns = "sonde";
  std::string statusObject = "sonde-aggregator";
  std::string outputLocation = "./sonde-results";

  RunTimeline timeline;
  std::chrono::seconds certificateValidity{
    DefaultCertificateValiditySeconds
  };

  /// Run workload cleanup on exit if it did not already run during the grace
  /// window.
  bool cleanupOnExit = false;
};
}

#endif
