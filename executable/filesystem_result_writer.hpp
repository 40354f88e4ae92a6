#ifndef SONDE_EXECUTABLE_FILESYSTEM_RESULT_WRITER_HPP
#define SONDE_EXECUTABLE_FILESYSTEM_RESULT_WRITER_HPP

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include <sonde/aggregator/result_writer.hpp>

namespace sonde {
struct ManifestEntry {
  std::string producer;
  std::string locus;
  std::string kind;
  std::string file;
  bool failed = false;
  std::string error;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("producer", producer),
       cereal::make_nvp("locus", locus),
       cereal::make_nvp("kind", kind),
       cereal::make_nvp("file", file),
       cereal::make_nvp("failed", failed),
       cereal::make_nvp("error", error));
  }
};

/** @brief Stores every result as <output>/plugins/<producer>/results/<locus>/
 * <kind>.json and lists them in <output>/manifest.json when the run finished.
 *
 * Not thread safe, the aggregator serializes calls.
 */
class FilesystemResultWriter : public ResultWriter {
  public:
  explicit FilesystemResultWriter(boost::filesystem::path outputLocation);
  ~FilesystemResultWriter() override;

  sonde_status write(const Result& result) override;
  sonde_status finish() override;

  const std::vector<ManifestEntry>& manifest() const { return m_manifest; }

  private:
  boost::filesystem::path m_outputLocation;
  std::vector<ManifestEntry> m_manifest;
};
}

#endif
