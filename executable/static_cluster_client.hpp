#ifndef SONDE_EXECUTABLE_STATIC_CLUSTER_CLIENT_HPP
#define SONDE_EXECUTABLE_STATIC_CLUSTER_CLIENT_HPP

#include <mutex>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/property_tree/ptree.hpp>

#include <sonde/cluster/cluster_client.hpp>

namespace sonde {
/** @brief Cluster given on the command line.
 *
 * Nodes are a fixed list, annotations are kept in a JSON file mapping
 * "<namespace>/<object>" to the annotations of that object.
 */
class StaticClusterClient : public ClusterClient {
  public:
  StaticClusterClient(Nodes nodes, boost::filesystem::path annotationsFile);
  ~StaticClusterClient() override;

  sonde_status listNodes(Nodes& nodes) override;

  sonde_status annotate(const std::string& ns,
                        const std::string& object,
                        const std::string& key,
                        const std::string& value) override;

  private:
  Nodes m_nodes;
  boost::filesystem::path m_annotationsFile;

  std::mutex m_mutex;
  boost::property_tree::ptree m_annotations;
};
}

#endif
