#include <catch2/catch.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include <sonde/aggregator/result_writer.hpp>
#include <sonde/common/result_queue.hpp>
#include <sonde/common/signal.hpp>

#include "aggregator.hpp"

using namespace sonde;
using sonde::aggregator::Aggregator;

namespace {
Result
MakeResult(const std::string& producer,
           const std::string& locus,
           const std::string& kind,
           const std::string& value = "") {
  Result r{ producer, locus, kind, {}, std::nullopt };
  r.payload.put("value", value);
  return r;
}

class CountingWriter : public ResultWriter {
  public:
  sonde_status write(const Result& result) override {
    written.push_back(result.slot());
    return status;
  }

  std::vector<ExpectedResult> written;
  sonde_status status = SONDE_OK;
};

const ExpectedResults Expected = { { "e2e", GlobalLocus, "junit" },
                                   { "systemd", "node-a", "raw" },
                                   { "systemd", "node-b", "raw" } };
}

TEST_CASE("Aggregator Completes After All Slots Are Filled",
          "[aggregator]") {
  Aggregator aggregator("out", Expected);
  REQUIRE(aggregator.pendingCount() == 3);
  REQUIRE(!aggregator.isComplete());

  REQUIRE(aggregator.handleSubmission(MakeResult("e2e", GlobalLocus, "junit")) ==
          SubmissionOutcome::Accepted);
  REQUIRE(aggregator.handleSubmission(MakeResult("systemd", "node-a", "raw")) ==
          SubmissionOutcome::Accepted);
  REQUIRE(!aggregator.isComplete());
  REQUIRE(aggregator.handleSubmission(MakeResult("systemd", "node-b", "raw")) ==
          SubmissionOutcome::Accepted);

  REQUIRE(aggregator.isComplete());
  REQUIRE(aggregator.filledCount() == 3);
  REQUIRE(aggregator.results().size() == 3);
  REQUIRE(aggregator.results()[1].locus == "node-a");
}

TEST_CASE("First Submission Of A Slot Wins", "[aggregator]") {
  CountingWriter writer;
  Aggregator aggregator("out", Expected, &writer);

  REQUIRE(aggregator.handleSubmission(
            MakeResult("systemd", "node-a", "raw", "first")) ==
          SubmissionOutcome::Accepted);
  REQUIRE(aggregator.handleSubmission(
            MakeResult("systemd", "node-a", "raw", "second")) ==
          SubmissionOutcome::Duplicate);

  auto results = aggregator.results();
  REQUIRE(results.size() == 1);
  REQUIRE(results[0].payload.get<std::string>("value") == "first");
  REQUIRE(writer.written.size() == 1);
}

TEST_CASE("Unexpected Submissions Are Dropped", "[aggregator]") {
  Aggregator aggregator("out", Expected);

  REQUIRE(aggregator.handleSubmission(MakeResult("e2e", "node-a", "junit")) ==
          SubmissionOutcome::Unexpected);
  REQUIRE(aggregator.handleSubmission(MakeResult("e2e", GlobalLocus, "raw")) ==
          SubmissionOutcome::Unexpected);
  REQUIRE(aggregator.handleSubmission(MakeResult("other", GlobalLocus, "junit")) ==
          SubmissionOutcome::Unexpected);
  REQUIRE(aggregator.filledCount() == 0);
  REQUIRE(aggregator.pendingCount() == 3);
}

TEST_CASE("Late Submissions After Completion Are Duplicates", "[aggregator]") {
  Aggregator aggregator("out", { { "e2e", GlobalLocus, "junit" } });
  REQUIRE(aggregator.handleSubmission(MakeResult("e2e", GlobalLocus, "junit")) ==
          SubmissionOutcome::Accepted);
  REQUIRE(aggregator.isComplete());
  REQUIRE(aggregator.handleSubmission(MakeResult("e2e", GlobalLocus, "junit")) ==
          SubmissionOutcome::Duplicate);
  REQUIRE(aggregator.isComplete());
}

TEST_CASE("Duplicate Expectations Collapse Into One Slot", "[aggregator]") {
  Aggregator aggregator(
    "out", { { "e2e", GlobalLocus, "junit" }, { "e2e", GlobalLocus, "junit" } });
  REQUIRE(aggregator.expectedResults().size() == 1);
  REQUIRE(aggregator.pendingCount() == 1);
}

TEST_CASE("Error Results Fill Their Slot", "[aggregator]") {
  Aggregator aggregator("out", { { "e2e", GlobalLocus, "junit" } });
  auto r = MakeErrorResult({ "e2e", GlobalLocus, "junit" }, "pod crashed");
  REQUIRE(aggregator.handleSubmission(r) == SubmissionOutcome::Accepted);
  REQUIRE(aggregator.isComplete());
  REQUIRE(aggregator.results()[0].isError());
  REQUIRE(aggregator.results()[0].payload.get<std::string>("error") ==
          "pod crashed");
}

TEST_CASE("Failing Writer Keeps The Slot Filled", "[aggregator]") {
  CountingWriter writer;
  writer.status = SONDE_IO_ERROR;
  Aggregator aggregator("out", { { "e2e", GlobalLocus, "junit" } }, &writer);
  REQUIRE(aggregator.handleSubmission(MakeResult("e2e", GlobalLocus, "junit")) ==
          SubmissionOutcome::Accepted);
  REQUIRE(aggregator.isComplete());
}

TEST_CASE("Wait Returns Only After The Last Slot Is Filled", "[aggregator]") {
  Aggregator aggregator("out", Expected);
  Signal stop;
  std::atomic_bool returned = false;
  bool completed = false;

  std::thread waiter([&]() {
    completed = aggregator.wait(stop);
    returned = true;
  });

  aggregator.handleSubmission(MakeResult("e2e", GlobalLocus, "junit"));
  aggregator.handleSubmission(MakeResult("systemd", "node-a", "raw"));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE(!returned);

  aggregator.handleSubmission(MakeResult("systemd", "node-b", "raw"));
  waiter.join();
  REQUIRE(returned);
  REQUIRE(completed);
}

TEST_CASE("Wait Returns When Stopped", "[aggregator]") {
  Aggregator aggregator("out", Expected);
  Signal stop;
  bool completed = true;

  std::thread waiter([&]() { completed = aggregator.wait(stop); });
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  stop.raise();
  waiter.join();

  REQUIRE(!completed);
}

TEST_CASE("Concurrent Submissions Fill Every Slot Once", "[aggregator]") {
  ExpectedResults expected;
  for(int i = 0; i < 64; ++i) {
    expected.push_back({ "systemd", "node-" + std::to_string(i), "raw" });
  }
  Aggregator aggregator("out", expected);

  std::atomic_int accepted = 0;
  std::vector<std::thread> threads;
  for(int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      for(const auto& e : expected) {
        if(aggregator.handleSubmission(MakeResult(e.producer, e.locus, e.kind)) ==
           SubmissionOutcome::Accepted)
          ++accepted;
      }
    });
  }
  for(auto& t : threads)
    t.join();

  REQUIRE(accepted == 64);
  REQUIRE(aggregator.isComplete());
  REQUIRE(aggregator.filledCount() == 64);
}

TEST_CASE("Ingest Drains The Queue Until Closed", "[aggregator]") {
  Aggregator aggregator("out", Expected);
  ResultQueue queue(3);

  std::thread ingest([&]() { aggregator.ingest(queue); });

  REQUIRE(queue.push(MakeErrorResult(Expected[1], "node down")) == SONDE_OK);
  REQUIRE(queue.push(MakeResult("systemd", "node-b", "raw")) == SONDE_OK);
  REQUIRE(queue.push(MakeResult("unknown", "node-b", "raw")) == SONDE_OK);
  queue.close();
  ingest.join();

  REQUIRE(aggregator.filledCount() == 2);
  REQUIRE(aggregator.pendingCount() == 1);
}

TEST_CASE("Slow Writers Do Not Block Readers", "[aggregator]") {
  class BlockingWriter : public ResultWriter {
    public:
    sonde_status write(const Result&) override {
      entered = true;
      release.wait();
      return SONDE_OK;
    }

    std::atomic_bool entered = false;
    Signal release;
  };

  BlockingWriter writer;
  Aggregator aggregator("out", Expected, &writer);

  std::thread submitter([&]() {
    aggregator.handleSubmission(MakeResult("e2e", GlobalLocus, "junit"));
  });
  while(!writer.entered)
    std::this_thread::sleep_for(std::chrono::milliseconds(1));

  // The writer is still busy with the first result.
  REQUIRE(aggregator.filledCount() == 1);
  REQUIRE(aggregator.pendingCount() == 2);
  REQUIRE(aggregator.results()[0].producer == "e2e");
  REQUIRE(!aggregator.isComplete());

  writer.release.raise();
  submitter.join();
}
