#pragma once

#include <string>

#include <sonde/common/result.hpp>
#include <sonde/common/status.hpp>

namespace sonde {
class ClusterClient;
}

namespace sonde::annotator {
/// Annotation key carrying the status document.
constexpr const char* StatusAnnotationKey = "sonde.io/status";

/** @brief Publishes the progress of a run on a cluster object.
 *
 * Safe to call from multiple threads as long as the cluster client is.
 */
class StatusAnnotator {
  public:
  StatusAnnotator(const ExpectedResults& expected,
                  const std::string& ns,
                  const std::string& objectName,
                  ClusterClient& client);
  ~StatusAnnotator();

  sonde_status annotate(const Results& results);

  const std::string& ns() const { return m_ns; }
  const std::string& objectName() const { return m_objectName; }

  private:
  ExpectedResults m_expected;
  std::string m_ns;
  std::string m_objectName;
  ClusterClient& m_client;
};
}
