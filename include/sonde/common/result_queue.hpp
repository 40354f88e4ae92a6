#ifndef SONDE_COMMON_RESULT_QUEUE_HPP
#define SONDE_COMMON_RESULT_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "result.hpp"
#include "status.hpp"

namespace sonde {
/** @brief Bounded many-producer single-consumer queue of results.
 *
 * Fed by workload monitors and by synthesized dispatch failures, drained by
 * the aggregator. Size it to at least the number of expected results, so a
 * producer reporting one terminal result per slot never blocks.
 */
class ResultQueue {
  public:
  explicit ResultQueue(std::size_t capacity);
  ResultQueue(const ResultQueue&) = delete;
  ResultQueue& operator=(const ResultQueue&) = delete;
  ~ResultQueue();

  /// Blocks while the queue is full. Returns SONDE_QUEUE_CLOSED once closed.
  sonde_status push(Result result);

  /// Blocks until a result is available. Returns std::nullopt once the queue
  /// is closed and drained.
  std::optional<Result> pop();

  void close();
  bool closed() const;

  std::size_t size() const;
  std::size_t capacity() const { return m_capacity; }

  private:
  mutable std::mutex m_mutex;
  std::condition_variable m_notEmpty;
  std::condition_variable m_notFull;
  std::deque<Result> m_queue;
  std::size_t m_capacity;
  bool m_closed = false;
};
}

#endif
