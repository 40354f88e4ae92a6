#include <sonde/common/result_queue.hpp>

#include <algorithm>

namespace sonde {
ResultQueue::ResultQueue(std::size_t capacity)
  : m_capacity(std::max<std::size_t>(capacity, 1)) {}

ResultQueue::~ResultQueue() {
  close();
}

sonde_status
ResultQueue::push(Result result) {
  std::unique_lock lock(m_mutex);
  m_notFull.wait(lock,
                 [this] { return m_closed || m_queue.size() < m_capacity; });
  if(m_closed)
    return SONDE_QUEUE_CLOSED;
  m_queue.emplace_back(std::move(result));
  lock.unlock();
  m_notEmpty.notify_one();
  return SONDE_OK;
}

std::optional<Result>
ResultQueue::pop() {
  std::unique_lock lock(m_mutex);
  m_notEmpty.wait(lock, [this] { return m_closed || !m_queue.empty(); });
  if(m_queue.empty())
    return std::nullopt;
  Result r = std::move(m_queue.front());
  m_queue.pop_front();
  lock.unlock();
  m_notFull.notify_one();
  return r;
}

void
ResultQueue::close() {
  {
    std::unique_lock lock(m_mutex);
    m_closed = true;
  }
  m_notEmpty.notify_all();
  m_notFull.notify_all();
}

bool
ResultQueue::closed() const {
  std::unique_lock lock(m_mutex);
  return m_closed;
}

std::size_t
ResultQueue::size() const {
  std::unique_lock lock(m_mutex);
  return m_queue.size();
}
}
