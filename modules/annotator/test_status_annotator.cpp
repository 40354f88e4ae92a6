#include <catch2/catch.hpp>

#include <sstream>

#include <boost/property_tree/json_parser.hpp>

#include "mocks.hpp"
#include "status_annotator.hpp"
#include "status_document.hpp"

using namespace sonde;
using namespace sonde::annotator;

namespace {
const ExpectedResults Expected = { { "e2e", GlobalLocus, "junit" },
                                   { "systemd", "node-a", "raw" } };

Result
Filled(const ExpectedResult& slot) {
  return Result{ slot.producer, slot.locus, slot.kind, {}, std::nullopt };
}

boost::property_tree::ptree
Parse(const std::string& json) {
  boost::property_tree::ptree doc;
  std::istringstream i(json);
  boost::property_tree::read_json(i, doc);
  return doc;
}
}

TEST_CASE("Status Document Reflects Slot States", "[annotator]") {
  SECTION("Nothing filled") {
    auto doc = BuildStatusDocument(Expected, {});
    REQUIRE(doc.status == StatusRunning);
    REQUIRE(doc.plugins.size() == 2);
    REQUIRE(doc.plugins[0].plugin == "e2e");
    REQUIRE(doc.plugins[0].node == GlobalLocus);
    REQUIRE(doc.plugins[1].status == StatusRunning);
  }

  SECTION("Partially filled") {
    auto doc = BuildStatusDocument(Expected, { Filled(Expected[1]) });
    REQUIRE(doc.status == StatusRunning);
    REQUIRE(doc.plugins[0].status == StatusRunning);
    REQUIRE(doc.plugins[1].status == StatusComplete);
  }

  SECTION("All filled") {
    auto doc = BuildStatusDocument(
      Expected, { Filled(Expected[0]), Filled(Expected[1]) });
    REQUIRE(doc.status == StatusComplete);
  }

  SECTION("Error results fail the run") {
    auto doc = BuildStatusDocument(
      Expected, { MakeErrorResult(Expected[0], "boom"), Filled(Expected[1]) });
    REQUIRE(doc.plugins[0].status == StatusFailed);
    REQUIRE(doc.status == StatusFailed);
  }
}

TEST_CASE("Annotator Writes JSON To The Status Object", "[annotator]") {
  test::MockClusterClient client;
  StatusAnnotator annotator(Expected, "sonde", "sonde-aggregator", client);

  REQUIRE(annotator.annotate({ Filled(Expected[0]) }) == SONDE_OK);

  auto annotations = client.annotations();
  REQUIRE(annotations.size() == 1);
  REQUIRE(annotations[0].ns == "sonde");
  REQUIRE(annotations[0].object == "sonde-aggregator");
  REQUIRE(annotations[0].key == StatusAnnotationKey);

  auto doc = Parse(annotations[0].value);
  REQUIRE(doc.get<std::string>("status") == "running");
  auto& plugins = doc.get_child("plugins");
  REQUIRE(plugins.size() == 2);
  REQUIRE(plugins.front().second.get<std::string>("plugin") == "e2e");
  REQUIRE(plugins.front().second.get<std::string>("status") == "complete");
}

TEST_CASE("Annotation Failures Are Returned", "[annotator]") {
  test::MockClusterClient client;
  client.annotateStatus = SONDE_ANNOTATION_ERROR;
  StatusAnnotator annotator(Expected, "sonde", "sonde-aggregator", client);
  REQUIRE(annotator.annotate({}) == SONDE_ANNOTATION_ERROR);
}
