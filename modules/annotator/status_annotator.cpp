#include "status_annotator.hpp"
#include "status_document.hpp"

#include <map>
#include <sstream>

#include <cereal/archives/json.hpp>

#include <sonde/cluster/cluster_client.hpp>
#include <sonde/common/log.hpp>

namespace sonde::annotator {
StatusDocument
BuildStatusDocument(const ExpectedResults& expected, const Results& results) {
  std::map<ExpectedResult, bool> filled;
  for(const auto& r : results) {
    // The first result of a slot is the one that counts.
    filled.try_emplace(r.slot(), r.isError());
  }

  StatusDocument doc;
  bool pending = false, failed = false;

  for(const auto& e : expected) {
    SlotStatus s{ e.producer, e.locus, StatusRunning };
    auto it = filled.find(e);
    if(it == filled.end()) {
      pending = true;
    } else if(it->second) {
      s.status = StatusFailed;
      failed = true;
    } else {
      s.status = StatusComplete;
    }
    doc.plugins.emplace_back(std::move(s));
  }

  if(pending)
    doc.status = StatusRunning;
  else if(failed)
    doc.status = StatusFailed;
  else
    doc.status = StatusComplete;

  return doc;
}

std::string
StatusDocumentToJSON(const StatusDocument& doc) {
  std::ostringstream o;
  {
    cereal::JSONOutputArchive oa(o, cereal::JSONOutputArchive::Options::NoIndent());
    doc.serialize(oa);
  }
  return o.str();
}

StatusAnnotator::StatusAnnotator(const ExpectedResults& expected,
                                 const std::string& ns,
                                 const std::string& objectName,
                                 ClusterClient& client)
  : m_expected(expected)
  , m_ns(ns)
  , m_objectName(objectName)
  , m_client(client) {}

StatusAnnotator::~StatusAnnotator() {
  sonde_log(SONDE_ANNOTATOR, SONDE_DEBUG, "Destroy StatusAnnotator.");
}

sonde_status
StatusAnnotator::annotate(const Results& results) {
  std::string json;
  try {
    json = StatusDocumentToJSON(BuildStatusDocument(m_expected, results));
  } catch(const cereal::Exception& e) {
    sonde_log(SONDE_ANNOTATOR,
              SONDE_LOCALERROR,
              "Could not serialize status document! Error: {}",
              e.what());
    return SONDE_ANNOTATION_ERROR;
  }

  sonde_status s = SONDE_ANNOTATION_ERROR;
  try {
    s = m_client.annotate(m_ns, m_objectName, StatusAnnotationKey, json);
  } catch(const std::exception& e) {
    sonde_log(SONDE_ANNOTATOR,
              SONDE_LOCALERROR,
              "Exception while annotating {}/{}: {}",
              m_ns,
              m_objectName,
              e.what());
    return SONDE_ANNOTATION_ERROR;
  }

  if(s != SONDE_OK) {
    sonde_log(SONDE_ANNOTATOR,
              SONDE_LOCALWARNING,
              "Could not annotate {}/{}! Status: {}",
              m_ns,
              m_objectName,
              sonde_status_to_str(s));
    return s;
  }

  sonde_log(
    SONDE_ANNOTATOR, SONDE_TRACE, "Annotated {}/{}: {}", m_ns, m_objectName, json);
  return SONDE_OK;
}
}
