#include <sonde/common/log.hpp>
#include <sonde/common/thread_registry.hpp>

#include <cassert>

namespace sonde {
ThreadRegistry::~ThreadRegistry() {
  requestStop();
  waitForExit();
}

sonde_status
ThreadRegistry::create(const std::string& name,
                       StartFunc startFunc,
                       Handle** handle) {
  assert(startFunc);

  std::vector<StartingCallback> callbacks;
  Handle* h = nullptr;
  {
    std::unique_lock lock(m_mutex);
    h = &m_threads.emplace_back();
    h->threadId = m_nextThreadId++;
    h->name = name;
    h->registry = this;
    callbacks = m_startingCallbacks;
  }

  try {
    h->thread = std::thread([h, callbacks, startFunc]() {
      for(auto& cb : callbacks) {
        cb(*h);
      }
      h->running = true;
      h->exitStatus = startFunc(*h);
      h->running = false;
    });
  } catch(const std::system_error& e) {
    sonde_log(SONDE_GENERAL,
              SONDE_LOCALERROR,
              "Could not start thread \"{}\"! Error: {}",
              name,
              e.what());
    return SONDE_GENERIC_ERROR;
  }

  sonde_log(SONDE_GENERAL,
            SONDE_TRACE,
            "Started thread T{} named \"{}\".",
            h->threadId,
            name);

  if(handle)
    *handle = h;

  return SONDE_OK;
}

void
ThreadRegistry::addStartingCallback(StartingCallback cb) {
  std::unique_lock lock(m_mutex);
  m_startingCallbacks.emplace_back(std::move(cb));
}

void
ThreadRegistry::requestStop() {
  m_stop = true;
}

void
ThreadRegistry::waitForExit() {
  for(;;) {
    Handle* h = nullptr;
    {
      std::unique_lock lock(m_mutex);
      for(auto& t : m_threads) {
        if(t.thread.joinable()) {
          h = &t;
          break;
        }
      }
    }
    if(!h)
      return;

    assert(h->thread.get_id() != std::this_thread::get_id());
    h->thread.join();

    sonde_log(SONDE_GENERAL,
              SONDE_TRACE,
              "Thread T{} named \"{}\" exited with status {}.",
              h->threadId,
              h->name,
              h->exitStatus);
  }
}

size_t
ThreadRegistry::threadCount() const {
  std::unique_lock lock(m_mutex);
  return m_threads.size();
}
}
