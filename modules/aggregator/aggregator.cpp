#include "aggregator.hpp"

#include <condition_variable>
#include <map>
#include <mutex>

#include <boost/signals2/connection.hpp>

#include <sonde/aggregator/result_writer.hpp>
#include <sonde/common/log.hpp>
#include <sonde/common/result_queue.hpp>
#include <sonde/common/signal.hpp>

namespace sonde::aggregator {
struct Aggregator::Internal {
  mutable std::mutex mutex;
  mutable std::condition_variable filledNotifier;

  // Serializes the writer, taken without holding mutex.
  std::mutex writeMutex;

  ExpectedResults expected;
  std::map<ExpectedResult, bool> slots;
  size_t pending = 0;

  Results results;
};

Aggregator::Aggregator(const std::string& outputLocation,
                       const ExpectedResults& expectedResults,
                       ResultWriter* writer)
  : m_internal(std::make_unique<Internal>())
  , m_outputLocation(outputLocation)
  , m_writer(writer) {
  for(const auto& e : expectedResults) {
    auto [it, inserted] = m_internal->slots.try_emplace(e, false);
    if(inserted) {
      m_internal->expected.push_back(e);
      ++m_internal->pending;
    } else {
      sonde_log(SONDE_AGGREGATOR,
                SONDE_LOCALWARNING,
                "Expected result {}/{}/{} listed twice, tracking it once.",
                e.producer,
                e.locus,
                e.kind);
    }
  }

  sonde_log(SONDE_AGGREGATOR,
            SONDE_DEBUG,
            "Initialize Aggregator with {} expected results, output to {}.",
            m_internal->expected.size(),
            m_outputLocation);
}

Aggregator::~Aggregator() {
  sonde_log(SONDE_AGGREGATOR, SONDE_DEBUG, "Destroy Aggregator.");
}

SubmissionOutcome
Aggregator::handleSubmission(Result result) {
  return fill(std::move(result), "transport");
}

void
Aggregator::ingest(ResultQueue& queue) {
  sonde_log(SONDE_AGGREGATOR, SONDE_DEBUG, "Start ingesting queued results.");
  while(auto result = queue.pop()) {
    fill(std::move(*result), "queue");
  }
  sonde_log(SONDE_AGGREGATOR, SONDE_DEBUG, "Result queue closed.");
}

SubmissionOutcome
Aggregator::fill(Result result, const char* source) {
  std::unique_lock lock(m_internal->mutex);

  auto it = m_internal->slots.find(result.slot());
  if(it == m_internal->slots.end()) {
    sonde_log(SONDE_AGGREGATOR,
              SONDE_LOCALWARNING,
              "Dropping unexpected result {}/{}/{} from {}.",
              result.producer,
              result.locus,
              result.kind,
              source);
    return SubmissionOutcome::Unexpected;
  }

  if(it->second) {
    sonde_log(SONDE_AGGREGATOR,
              m_internal->pending == 0 ? SONDE_INFO : SONDE_DEBUG,
              "Dropping {} result {}/{}/{} from {}, slot already filled.",
              m_internal->pending == 0 ? "late" : "duplicate",
              result.producer,
              result.locus,
              result.kind,
              source);
    return SubmissionOutcome::Duplicate;
  }

  it->second = true;
  --m_internal->pending;

  if(result.isError()) {
    sonde_log(SONDE_AGGREGATOR,
              SONDE_LOCALWARNING,
              "Received error result {}/{}/{} from {}: {}",
              result.producer,
              result.locus,
              result.kind,
              source,
              *result.error);
  } else {
    sonde_log(SONDE_AGGREGATOR,
              SONDE_INFO,
              "Received result {}/{}/{} from {}. {} results pending.",
              result.producer,
              result.locus,
              result.kind,
              source,
              m_internal->pending);
  }

  m_internal->results.push_back(result);

  if(m_internal->pending == 0) {
    sonde_log(SONDE_AGGREGATOR, SONDE_INFO, "All expected results received.");
  }

  lock.unlock();
  m_internal->filledNotifier.notify_all();

  if(m_writer)
    persist(result);

  return SubmissionOutcome::Accepted;
}

void
Aggregator::persist(const Result& result) {
  std::unique_lock lock(m_internal->writeMutex);
  sonde_status s = SONDE_GENERIC_ERROR;
  try {
    s = m_writer->write(result);
  } catch(const std::exception& e) {
    sonde_log(SONDE_AGGREGATOR,
              SONDE_LOCALERROR,
              "Exception while writing result {}/{}/{}: {}",
              result.producer,
              result.locus,
              result.kind,
              e.what());
  }
  if(s != SONDE_OK) {
    sonde_log(SONDE_AGGREGATOR,
              SONDE_LOCALERROR,
              "Could not persist result {}/{}/{}! Status: {}",
              result.producer,
              result.locus,
              result.kind,
              sonde_status_to_str(s));
  }
}

bool
Aggregator::isComplete() const {
  std::unique_lock lock(m_internal->mutex);
  return m_internal->pending == 0;
}

bool
Aggregator::wait(Signal& stop) const {
  boost::signals2::scoped_connection conn = stop.onRaised([this]() {
    // The waiter checks stop.raised() under this lock.
    { std::unique_lock lock(m_internal->mutex); }
    m_internal->filledNotifier.notify_all();
  });

  std::unique_lock lock(m_internal->mutex);
  m_internal->filledNotifier.wait(
    lock, [this, &stop] { return m_internal->pending == 0 || stop.raised(); });
  return m_internal->pending == 0;
}

Results
Aggregator::results() const {
  std::unique_lock lock(m_internal->mutex);
  return m_internal->results;
}

const ExpectedResults&
Aggregator::expectedResults() const {
  return m_internal->expected;
}

size_t
Aggregator::pendingCount() const {
  std::unique_lock lock(m_internal->mutex);
  return m_internal->pending;
}

size_t
Aggregator::filledCount() const {
  std::unique_lock lock(m_internal->mutex);
  return m_internal->results.size();
}
}
