#include <catch2/catch.hpp>

#include <sstream>
#include <thread>

#include <boost/property_tree/json_parser.hpp>

#include <sonde/orchestrator/orchestrator.hpp>

#include "mocks.hpp"
#include "tls_client.hpp"
#include "transport/result_transport.hpp"

using namespace sonde;
using sonde::test::MockClusterClient;
using sonde::test::MockResultWriter;
using sonde::test::MockWorkload;

namespace {
RunConfig
TestConfig() {
  RunConfig config;
  config.bindAddress = "127.0.0.1";
  config.bindPort = 0;
  config.advertiseAddress = "127.0.0.1";
  config.timeline.annotationInterval = std::chrono::milliseconds(20);
  config.timeline.jitterFactor = 0;
  return config;
}

/// Monitor submitting one result per expected slot over the transport.
void
SubmitAll(MockWorkload& w,
          const Nodes& nodes,
          ResultQueue&,
          const Signal&) {
  for(const auto& slot : w.expectedResults(nodes)) {
    std::string target = slot.isGlobal()
                           ? "/api/v1/results/global/" + slot.kind
                           : "/api/v1/results/by-node/" + slot.locus + "/" +
                               slot.kind;
    test::Submit(w.port(), w.identity(), target, R"({"payload": {"ok": "1"}})");
  }
}

std::string
LastStatus(const MockClusterClient& client) {
  auto annotations = client.annotations();
  if(annotations.empty())
    return "";
  boost::property_tree::ptree doc;
  std::istringstream i(annotations.back().value);
  boost::property_tree::read_json(i, doc);
  return doc.get<std::string>("status");
}
}

TEST_CASE("Run Without Workloads Succeeds Immediately", "[orchestrator]") {
  MockClusterClient client;
  Orchestrator orchestrator(TestConfig(), client, {});
  REQUIRE(orchestrator.run() == SONDE_OK);
  REQUIRE(orchestrator.report().state == RunState::Completed);
  REQUIRE(client.annotationCount() == 0);
}

TEST_CASE("Duplicate Workload Names Are Rejected", "[orchestrator]") {
  MockClusterClient client;
  auto a = std::make_shared<MockWorkload>("e2e");
  auto b = std::make_shared<MockWorkload>("e2e");
  Orchestrator orchestrator(TestConfig(), client, { a, b });

  REQUIRE(orchestrator.run() == SONDE_DUPLICATE_WORKLOAD);
  REQUIRE(orchestrator.report().state == RunState::SetupFailed);
  REQUIRE(a->runCount.load() == 0);
  REQUIRE(b->runCount.load() == 0);
}

TEST_CASE("Setup Failures Dispatch Nothing", "[orchestrator]") {
  MockClusterClient client;
  auto w = std::make_shared<MockWorkload>("e2e");
  RunConfig config = TestConfig();

  SECTION("Node listing") {
    client.failListing = true;
    Orchestrator orchestrator(config, client, { w });
    REQUIRE(orchestrator.run() == SONDE_NODE_LISTING_ERROR);
  }
  SECTION("Advertise address") {
    config.advertiseAddress = "not a host!";
    Orchestrator orchestrator(config, client, { w });
    REQUIRE(orchestrator.run() == SONDE_INVALID_ADDRESS);
  }
  SECTION("Bind address") {
    config.bindAddress = "localhost";
    Orchestrator orchestrator(config, client, { w });
    REQUIRE(orchestrator.run() == SONDE_INVALID_IP);
    REQUIRE(orchestrator.report().state == RunState::SetupFailed);
  }

  REQUIRE(w->runCount.load() == 0);
  REQUIRE(w->cleanupCount.load() == 0);
}

TEST_CASE("Run Completes When All Workloads Submitted", "[orchestrator]") {
  MockClusterClient client;
  auto e2e = std::make_shared<MockWorkload>("e2e");
  auto systemd = std::make_shared<MockWorkload>(
    "systemd", WorkloadScope::PerNode, "raw");
  e2e->onMonitor = SubmitAll;
  systemd->onMonitor = SubmitAll;

  Orchestrator orchestrator(TestConfig(), client, { e2e, systemd });
  REQUIRE(orchestrator.run() == SONDE_OK);

  const auto& report = orchestrator.report();
  REQUIRE(report.state == RunState::Completed);
  REQUIRE(report.expected.size() == 3);
  REQUIRE(report.results.size() == 3);
  for(const auto& r : report.results) {
    REQUIRE(!r.isError());
    REQUIRE(r.payload.get<std::string>("ok") == "1");
  }

  REQUIRE(e2e->runCount.load() == 1);
  REQUIRE(e2e->monitorCount.load() == 1);
  REQUIRE(client.listCount.load() == 1);
  REQUIRE(systemd->runNodes() == Nodes{ "node-a", "node-b" });
  REQUIRE(e2e->cleanupCount.load() == 0);
  REQUIRE(e2e->identity().subject == "e2e");
  REQUIRE(systemd->identity().subject == "systemd");

  REQUIRE(client.annotationCount() >= 1);
  REQUIRE(LastStatus(client) == "complete");
  REQUIRE(orchestrator.transportPort() == 0);
}

TEST_CASE("Failed Dispatch Fills Slots With Errors", "[orchestrator]") {
  MockClusterClient client;
  auto e2e = std::make_shared<MockWorkload>("e2e");
  auto broken = std::make_shared<MockWorkload>(
    "broken", WorkloadScope::PerNode, "raw");
  e2e->onMonitor = SubmitAll;
  broken->runStatus = SONDE_DISPATCH_ERROR;

  Orchestrator orchestrator(TestConfig(), client, { e2e, broken });
  REQUIRE(orchestrator.run() == SONDE_OK);

  const auto& report = orchestrator.report();
  REQUIRE(report.results.size() == 3);

  std::size_t errors = 0;
  for(const auto& r : report.results) {
    if(r.isError()) {
      ++errors;
      REQUIRE(r.producer == "broken");
    }
  }
  REQUIRE(errors == 2);
  REQUIRE(broken->monitorCount.load() == 0);
  REQUIRE(LastStatus(client) == "failed");
}

TEST_CASE("Monitors Report Failures Through The Queue", "[orchestrator]") {
  MockClusterClient client;
  auto w = std::make_shared<MockWorkload>("e2e");
  w->onMonitor =
    [](MockWorkload& w, const Nodes& nodes, ResultQueue& queue, const Signal&) {
      for(const auto& slot : w.expectedResults(nodes))
        queue.push(MakeErrorResult(slot, "pod evicted"));
    };

  Orchestrator orchestrator(TestConfig(), client, { w });
  REQUIRE(orchestrator.run() == SONDE_OK);
  REQUIRE(orchestrator.report().results.size() == 1);
  REQUIRE(*orchestrator.report().results[0].error == "pod evicted");
}

TEST_CASE("Unfinished Runs Time Out After Cleaning Up", "[orchestrator]") {
  MockClusterClient client;
  auto w = std::make_shared<MockWorkload>("e2e");
  RunConfig config = TestConfig();
  config.timeline.totalTimeout = std::chrono::seconds(2);
  config.timeline.gracePeriod = std::chrono::seconds(1);

  SECTION("Without cleanup on exit") {}
  SECTION("With cleanup on exit") { config.cleanupOnExit = true; }

  Orchestrator orchestrator(config, client, { w });
  REQUIRE(orchestrator.run() == SONDE_TIMEOUT);

  const auto& report = orchestrator.report();
  REQUIRE(report.state == RunState::TimedOut);
  REQUIRE(report.graceCleanupRan);
  REQUIRE(!report.exitCleanupRan);
  REQUIRE(report.duration >= std::chrono::seconds(2));
  REQUIRE(report.results.empty());

  // Cleanup runs exactly once, also with cleanup on exit enabled.
  REQUIRE(w->cleanupCount.load() == 1);

  REQUIRE(!test::Connectable(w->port()));
  REQUIRE(LastStatus(client) == "running");
}

TEST_CASE("Grace Period Longer Than Timeout Cleans Up At Once",
          "[orchestrator]") {
  MockClusterClient client;
  auto w = std::make_shared<MockWorkload>("e2e");
  RunConfig config = TestConfig();
  config.timeline.totalTimeout = std::chrono::seconds(1);
  config.timeline.gracePeriod = std::chrono::seconds(60);

  Orchestrator orchestrator(config, client, { w });
  REQUIRE(orchestrator.run() == SONDE_TIMEOUT);
  REQUIRE(orchestrator.report().graceCleanupRan);
  REQUIRE(w->cleanupCount.load() == 1);
}

TEST_CASE("Cleanup On Exit Runs After Completion", "[orchestrator]") {
  MockClusterClient client;
  auto w = std::make_shared<MockWorkload>("e2e");
  w->onMonitor = SubmitAll;
  RunConfig config = TestConfig();
  config.cleanupOnExit = true;

  Orchestrator orchestrator(config, client, { w });
  REQUIRE(orchestrator.run() == SONDE_OK);
  REQUIRE(orchestrator.report().exitCleanupRan);
  REQUIRE(!orchestrator.report().graceCleanupRan);
  REQUIRE(w->cleanupCount.load() == 1);
}

TEST_CASE("Completion After The Grace Deadline Cleans Up Once",
          "[orchestrator]") {
  MockClusterClient client;
  auto w = std::make_shared<MockWorkload>("e2e");
  w->onMonitor = [](MockWorkload& w,
                    const Nodes& nodes,
                    ResultQueue& queue,
                    const Signal& stop) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    SubmitAll(w, nodes, queue, stop);
  };
  RunConfig config = TestConfig();
  config.timeline.totalTimeout = std::chrono::seconds(3);
  config.timeline.gracePeriod = std::chrono::seconds(2);

  SECTION("Without cleanup on exit") {}
  SECTION("With cleanup on exit") { config.cleanupOnExit = true; }

  Orchestrator orchestrator(config, client, { w });
  REQUIRE(orchestrator.run() == SONDE_OK);

  const auto& report = orchestrator.report();
  REQUIRE(report.state == RunState::Completed);
  REQUIRE(report.graceCleanupRan);
  REQUIRE(!report.exitCleanupRan);
  REQUIRE(report.results.size() == 1);
  REQUIRE(report.duration < std::chrono::seconds(3));
  REQUIRE(w->cleanupCount.load() == 1);
  REQUIRE(LastStatus(client) == "complete");
}

TEST_CASE("Ending Transport Fails The Run", "[orchestrator]") {
  MockClusterClient client;
  auto w = std::make_shared<MockWorkload>(
    "systemd", WorkloadScope::PerNode, "raw");

  transport::ResultTransport* served = nullptr;
  Orchestrator::TransportTerminated terminated;
  sonde_status reported = SONDE_OK;
  sonde_status expected = SONDE_OK;

  SECTION("Transport closed") {
    expected = SONDE_CONNECTION_CLOSED;
    w->onMonitor =
      [&](MockWorkload& w, const Nodes&, ResultQueue&, const Signal&) {
        test::Submit(w.port(),
                     w.identity(),
                     "/api/v1/results/by-node/node-a/raw",
                     R"({"payload": {}})");
        served->close();
      };
  }
  SECTION("Transport ending without error") {
    expected = SONDE_TRANSPORT_ERROR;
    w->onMonitor = [&](MockWorkload&, const Nodes&, ResultQueue&,
                       const Signal&) { terminated(SONDE_OK); };
  }

  Orchestrator orchestrator(TestConfig(), client, { w });
  orchestrator.setTransportObserver(
    [&](transport::ResultTransport& t,
        const Orchestrator::TransportTerminated& onTerminated) {
      served = &t;
      terminated = onTerminated;
    });
  reported = orchestrator.run();

  REQUIRE(reported == expected);
  const auto& report = orchestrator.report();
  REQUIRE(report.state == RunState::ServerFailed);
  REQUIRE(report.status == expected);
  REQUIRE(report.results.size() < report.expected.size());
  REQUIRE(w->cleanupCount.load() == 0);
  REQUIRE(!test::Connectable(w->port()));
  REQUIRE(LastStatus(client) == "running");
}

TEST_CASE("Result Output Is Finished Once After The Run", "[orchestrator]") {
  MockClusterClient client;
  MockResultWriter writer;
  auto e2e = std::make_shared<MockWorkload>("e2e");
  auto systemd = std::make_shared<MockWorkload>(
    "systemd", WorkloadScope::PerNode, "raw");
  e2e->onMonitor = SubmitAll;
  systemd->onMonitor = SubmitAll;

  Orchestrator orchestrator(TestConfig(), client, { e2e, systemd }, &writer);
  REQUIRE(orchestrator.run() == SONDE_OK);

  REQUIRE(writer.writeCount.load() == 3);
  REQUIRE(writer.finishCount.load() == 1);
  REQUIRE(writer.writtenAtFinish.load() == 3);
}
