#include "filesystem_result_writer.hpp"

#include <cereal/archives/json.hpp>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <sonde/common/log.hpp>

namespace fs = boost::filesystem;

namespace sonde {
namespace {
bool
IsSafePathComponent(const std::string& c) {
  return !c.empty() && c != "." && c != ".." &&
         c.find('/') == std::string::npos && c.find('\\') == std::string::npos;
}
}

FilesystemResultWriter::FilesystemResultWriter(fs::path outputLocation)
  : m_outputLocation(std::move(outputLocation)) {}

FilesystemResultWriter::~FilesystemResultWriter() {}

sonde_status
FilesystemResultWriter::write(const Result& result) {
  if(!IsSafePathComponent(result.producer) ||
     !IsSafePathComponent(result.locus) || !IsSafePathComponent(result.kind)) {
    sonde_log(SONDE_AGGREGATOR,
              SONDE_LOCALERROR,
              "Refusing to store result {}/{}/{}, not usable as a path.",
              result.producer,
              result.locus,
              result.kind);
    return SONDE_IO_ERROR;
  }

  fs::path relative =
    fs::path("plugins") / result.producer / "results" / result.locus;
  fs::path dir = m_outputLocation / relative;

  boost::system::error_code ec;
  fs::create_directories(dir, ec);
  if(ec) {
    sonde_log(SONDE_AGGREGATOR,
              SONDE_LOCALERROR,
              "Cannot create result directory {}! Error: {}",
              dir.string(),
              ec.message());
    return SONDE_IO_ERROR;
  }

  const std::string fileName = result.kind + ".json";
  try {
    fs::ofstream o(dir / fileName);
    boost::property_tree::write_json(o, result.payload);
  } catch(const boost::property_tree::json_parser_error& e) {
    sonde_log(SONDE_AGGREGATOR,
              SONDE_LOCALERROR,
              "Cannot write result to {}! Error: {}",
              (dir / fileName).string(),
              e.what());
    return SONDE_IO_ERROR;
  }

  ManifestEntry entry;
  entry.producer = result.producer;
  entry.locus = result.locus;
  entry.kind = result.kind;
  entry.file = (relative / fileName).generic_string();
  entry.failed = result.isError();
  if(result.error)
    entry.error = *result.error;
  m_manifest.emplace_back(std::move(entry));
  return SONDE_OK;
}

sonde_status
FilesystemResultWriter::finish() {
  fs::path path = m_outputLocation / "manifest.json";
  try {
    fs::ofstream o(path, std::ios::out | std::ios::trunc);
    if(!o) {
      sonde_log(SONDE_AGGREGATOR,
                SONDE_LOCALERROR,
                "Cannot open manifest {}!",
                path.string());
      return SONDE_IO_ERROR;
    }
    cereal::JSONOutputArchive oa(o);
    oa(cereal::make_nvp("results", m_manifest));
  } catch(const cereal::Exception& e) {
    sonde_log(SONDE_AGGREGATOR,
              SONDE_LOCALERROR,
              "Cannot write manifest {}! Error: {}",
              path.string(),
              e.what());
    return SONDE_IO_ERROR;
  }
  return SONDE_OK;
}
}
