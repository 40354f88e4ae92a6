#ifndef SONDE_COMMON_SIGNAL_HPP
#define SONDE_COMMON_SIGNAL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include <boost/signals2/signal.hpp>

namespace sonde {
/** @brief One-shot event that can be raised from any thread.
 *
 * Raising is idempotent, only the first call notifies waiters and connected
 * slots. Slots connected after the signal was raised are never called, so
 * check raised() after connecting.
 */
class Signal {
  public:
  using RaisedSignal = boost::signals2::signal<void()>;

  Signal() = default;
  Signal(const Signal&) = delete;
  Signal& operator=(const Signal&) = delete;

  /// Returns true if this call raised the signal.
  bool raise() {
    {
      std::unique_lock lock(m_mutex);
      if(m_raised)
        return false;
      m_raised = true;
    }
    m_cv.notify_all();
    m_raisedSignal();
    return true;
  }

  bool raised() const { return m_raised; }

  void wait() const {
    std::unique_lock lock(m_mutex);
    m_cv.wait(lock, [this] { return m_raised.load(); });
  }

  template<typename Clock, typename Duration>
  bool waitUntil(const std::chrono::time_point<Clock, Duration>& t) const {
    std::unique_lock lock(m_mutex);
    return m_cv.wait_until(lock, t, [this] { return m_raised.load(); });
  }

  template<typename Rep, typename Period>
  bool waitFor(const std::chrono::duration<Rep, Period>& d) const {
    std::unique_lock lock(m_mutex);
    return m_cv.wait_for(lock, d, [this] { return m_raised.load(); });
  }

  boost::signals2::connection onRaised(const RaisedSignal::slot_type& slot) {
    return m_raisedSignal.connect(slot);
  }

  private:
  mutable std::mutex m_mutex;
  mutable std::condition_variable m_cv;
  std::atomic_bool m_raised = false;
  RaisedSignal m_raisedSignal;
};
}

#endif
