#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>

#include <sonde/common/signal.hpp>
#include <sonde/common/status.hpp>

namespace sonde {
class ThreadRegistry;
}

namespace sonde::annotator {
/** @brief Periodic jittered task publishing the run status.
 *
 * The tick returns true once the run completed, which ends the loop. After
 * the loop ended, the final function runs exactly once, no matter whether the
 * loop thread or finalAnnotate() gets there first. Ticks and the final
 * function are serialized, and no tick runs after the final function, so the
 * final write is always the last one. Must outlive its thread.
 */
class AnnotationLoop {
  public:
  using TickFunc = std::function<bool()>;
  using FinalFunc = std::function<void()>;

  AnnotationLoop(std::chrono::milliseconds interval,
                 double jitterFactor,
                 TickFunc tick,
                 FinalFunc final);
  ~AnnotationLoop();

  sonde_status start(ThreadRegistry& registry);

  void cancel();
  bool cancelled() const { return m_cancel.raised(); }

  void finalAnnotate();

  size_t tickCount() const { return m_ticks; }

  private:
  std::chrono::milliseconds m_interval;
  double m_jitterFactor;
  TickFunc m_tick;
  FinalFunc m_final;

  Signal m_cancel;
  std::mutex m_writeMutex;
  bool m_finalDone = false;
  std::once_flag m_finalOnce;
  std::atomic_size_t m_ticks = 0;

  int run();
};

/// Cancels the loop and publishes the final status when leaving a scope.
class FinalAnnotationGuard {
  public:
  explicit FinalAnnotationGuard(AnnotationLoop& loop)
    : m_loop(loop) {}
  ~FinalAnnotationGuard() {
    m_loop.cancel();
    m_loop.finalAnnotate();
  }

  FinalAnnotationGuard(const FinalAnnotationGuard&) = delete;
  FinalAnnotationGuard& operator=(const FinalAnnotationGuard&) = delete;

  private:
  AnnotationLoop& m_loop;
};
}
