#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <sonde/common/result.hpp>
#include <sonde/common/status.hpp>

namespace boost::asio::ssl {
class context;
}

namespace sonde {
class ThreadRegistry;
}

namespace sonde::transport {
/** @brief HTTPS endpoint receiving results from workloads.
 *
 * Serves on its own io thread. Every peer has to present a certificate the
 * server context trusts, its common name is the producer of all results
 * submitted over the connection.
 */
class ResultTransport {
  public:
  /// Called exactly once from the io thread when serving ended.
  using TerminationHandler = std::function<void(sonde_status)>;

  ResultTransport(std::unique_ptr<boost::asio::ssl::context> ctx,
                  SubmissionHandler handler);
  ~ResultTransport();

  sonde_status start(ThreadRegistry& registry,
                     const std::string& bindAddress,
                     uint16_t bindPort,
                     TerminationHandler onTerminated);

  /** @brief Closes the listener and all open connections.
   *
   * Returns after the io thread stopped serving and the termination handler
   * received SONDE_CONNECTION_CLOSED.
   */
  void close();

  uint16_t port() const;
  bool running() const;

  private:
  struct Internal;
  std::shared_ptr<Internal> m_internal;
};
}
