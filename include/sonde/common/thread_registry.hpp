#ifndef SONDE_COMMON_THREAD_REGISTRY_HPP
#define SONDE_COMMON_THREAD_REGISTRY_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "status.hpp"

namespace sonde {
/** @brief Owns every background thread of a run.
 *
 * Threads are only ever started and joined from the thread owning the
 * registry. Handles stay valid until the registry is destroyed.
 */
class ThreadRegistry {
  public:
  struct Handle {
    uint16_t threadId = 0;
    std::string name;
    std::atomic_bool running = false;
    int exitStatus = 0;// Should be of type sonde_status
    ThreadRegistry* registry = nullptr;
    std::thread thread;
  };

  using StartFunc = std::function<int(Handle&)>;
  using StartingCallback = std::function<void(Handle&)>;

  ThreadRegistry() = default;
  ThreadRegistry(const ThreadRegistry&) = delete;
  ThreadRegistry& operator=(const ThreadRegistry&) = delete;
  ~ThreadRegistry();

  sonde_status create(const std::string& name,
                      StartFunc startFunc,
                      Handle** handle = nullptr);

  void addStartingCallback(StartingCallback cb);

  /// Sets the stop flag. Threads are expected to poll stopRequested() or to be
  /// stopped by their own means.
  void requestStop();
  bool stopRequested() const { return m_stop; }

  void waitForExit();

  size_t threadCount() const;

  private:
  mutable std::mutex m_mutex;
  std::list<Handle> m_threads;
  std::vector<StartingCallback> m_startingCallbacks;
  std::atomic_bool m_stop = false;
  uint16_t m_nextThreadId = 1;
};
}

#endif
