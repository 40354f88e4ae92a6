#pragma once

#include <string>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include <sonde/common/result.hpp>

namespace sonde::annotator {
constexpr const char* StatusRunning = "running";
constexpr const char* StatusComplete = "complete";
constexpr const char* StatusFailed = "failed";

struct SlotStatus {
  std::string plugin;
  std::string node;
  std::string status;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("plugin", plugin),
       cereal::make_nvp("node", node),
       cereal::make_nvp("status", status));
  }
};

/// Progress of a run as published on the status object.
struct StatusDocument {
  std::vector<SlotStatus> plugins;
  std::string status;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(cereal::make_nvp("plugins", plugins),
       cereal::make_nvp("status", status));
  }
};

StatusDocument
BuildStatusDocument(const ExpectedResults& expected, const Results& results);

std::string
StatusDocumentToJSON(const StatusDocument& doc);
}
