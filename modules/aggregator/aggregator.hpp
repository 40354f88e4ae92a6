#pragma once

#include <memory>
#include <string>

#include <sonde/common/result.hpp>
#include <sonde/common/status.hpp>

namespace sonde {
class ResultQueue;
class ResultWriter;
class Signal;
}

namespace sonde::aggregator {
/** @brief Tracks which expected results have been filled.
 *
 * Every slot goes from pending to filled exactly once, the first result for a
 * slot wins. All state is guarded by one mutex, so all functions may be called
 * from any thread. Filled results are handed to the writer after that mutex
 * was released.
 */
class Aggregator {
  public:
  Aggregator(const std::string& outputLocation,
             const ExpectedResults& expectedResults,
             ResultWriter* writer = nullptr);
  ~Aggregator();

  /// Entry point of the result transport.
  SubmissionOutcome handleSubmission(Result result);

  /// Drains the queue until it is closed. Blocks the calling thread.
  void ingest(ResultQueue& queue);

  bool isComplete() const;

  /** @brief Blocks until all slots are filled or stop is raised.
   *
   * Returns true if the aggregator completed.
   */
  bool wait(Signal& stop) const;

  /// Snapshot of all filled results in the order they arrived.
  Results results() const;

  const ExpectedResults& expectedResults() const;
  size_t pendingCount() const;
  size_t filledCount() const;

  const std::string& outputLocation() const { return m_outputLocation; }

  private:
  struct Internal;
  std::unique_ptr<Internal> m_internal;
  std::string m_outputLocation;
  ResultWriter* m_writer;

  SubmissionOutcome fill(Result result, const char* source);
  void persist(const Result& result);
};
}
