#include "static_cluster_client.hpp"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <sonde/common/log.hpp>

namespace fs = boost::filesystem;
using boost::property_tree::ptree;

namespace sonde {
namespace {
// Keys are looked up verbatim, annotation keys contain the path separator.
ptree&
Child(ptree& parent, const std::string& key) {
  auto it = parent.find(key);
  if(it == parent.not_found())
    return parent.push_back(ptree::value_type(key, ptree()))->second;
  return it->second;
}
}

StaticClusterClient::StaticClusterClient(Nodes nodes,
                                         fs::path annotationsFile)
  : m_nodes(std::move(nodes))
  , m_annotationsFile(std::move(annotationsFile)) {}

StaticClusterClient::~StaticClusterClient() {}

sonde_status
StaticClusterClient::listNodes(Nodes& nodes) {
  nodes = m_nodes;
  return SONDE_OK;
}

sonde_status
StaticClusterClient::annotate(const std::string& ns,
                              const std::string& object,
                              const std::string& key,
                              const std::string& value) {
  std::unique_lock lock(m_mutex);
  Child(Child(m_annotations, ns + "/" + object), key).data() = value;

  boost::system::error_code ec;
  if(m_annotationsFile.has_parent_path()) {
    fs::create_directories(m_annotationsFile.parent_path(), ec);
    if(ec) {
      sonde_log(SONDE_ANNOTATOR,
                SONDE_LOCALERROR,
                "Cannot create directory {}! Error: {}",
                m_annotationsFile.parent_path().string(),
                ec.message());
      return SONDE_IO_ERROR;
    }
  }

  fs::path tmp = m_annotationsFile;
  tmp += ".tmp";
  try {
    fs::ofstream o(tmp);
    boost::property_tree::write_json(o, m_annotations);
  } catch(const boost::property_tree::json_parser_error& e) {
    sonde_log(SONDE_ANNOTATOR,
              SONDE_LOCALERROR,
              "Cannot write annotations to {}! Error: {}",
              tmp.string(),
              e.what());
    return SONDE_IO_ERROR;
  }

  fs::rename(tmp, m_annotationsFile, ec);
  if(ec) {
    sonde_log(SONDE_ANNOTATOR,
              SONDE_LOCALERROR,
              "Cannot move annotations to {}! Error: {}",
              m_annotationsFile.string(),
              ec.message());
    return SONDE_IO_ERROR;
  }
  return SONDE_OK;
}
}
