#include "annotation_loop.hpp"

#include <sonde/common/log.hpp>
#include <sonde/common/random.hpp>
#include <sonde/common/thread_registry.hpp>

namespace sonde::annotator {
AnnotationLoop::AnnotationLoop(std::chrono::milliseconds interval,
                               double jitterFactor,
                               TickFunc tick,
                               FinalFunc final)
  : m_interval(interval)
  , m_jitterFactor(jitterFactor)
  , m_tick(std::move(tick))
  , m_final(std::move(final)) {}

AnnotationLoop::~AnnotationLoop() {
  cancel();
}

sonde_status
AnnotationLoop::start(ThreadRegistry& registry) {
  sonde_log(SONDE_ANNOTATOR,
            SONDE_DEBUG,
            "Starting annotation loop with interval {}ms and jitter factor {}.",
            m_interval.count(),
            m_jitterFactor);
  return registry.create(
    "annotator", [this](ThreadRegistry::Handle&) -> int { return run(); });
}

void
AnnotationLoop::cancel() {
  if(m_cancel.raise()) {
    sonde_log(SONDE_ANNOTATOR, SONDE_DEBUG, "Annotation loop cancelled.");
  }
}

void
AnnotationLoop::finalAnnotate() {
  std::call_once(m_finalOnce, [this]() {
    // Waits for an in-flight tick to finish its write.
    std::unique_lock lock(m_writeMutex);
    m_finalDone = true;
    sonde_log(SONDE_ANNOTATOR, SONDE_DEBUG, "Publishing final status.");
    try {
      if(m_final)
        m_final();
    } catch(const std::exception& e) {
      sonde_log(SONDE_ANNOTATOR,
                SONDE_LOCALERROR,
                "Exception during final annotation: {}",
                e.what());
    }
  });
}

int
AnnotationLoop::run() {
  while(!m_cancel.raised()) {
    bool done = false;
    {
      std::unique_lock lock(m_writeMutex);
      if(m_finalDone || m_cancel.raised())
        break;
      try {
        done = m_tick();
      } catch(const std::exception& e) {
        sonde_log(SONDE_ANNOTATOR,
                  SONDE_LOCALERROR,
                  "Exception during annotation tick: {}",
                  e.what());
      }
      ++m_ticks;
    }

    if(done) {
      sonde_log(
        SONDE_ANNOTATOR, SONDE_DEBUG, "Run complete, ending annotation loop.");
      cancel();
      break;
    }

    m_cancel.waitFor(JitteredInterval(m_interval, m_jitterFactor));
  }

  finalAnnotate();
  return SONDE_OK;
}
}
