#include "result_transport.hpp"
#include "https_session.hpp"

#include <atomic>
#include <list>

#include <boost/asio/coroutine.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

#include <sonde/common/log.hpp>
#include <sonde/common/signal.hpp>
#include <sonde/common/thread_registry.hpp>

#include "../commonc/address_util.hpp"

using boost::asio::io_context;
using boost::asio::ip::tcp;

namespace sonde::transport {
struct ResultTransport::Internal {
  Internal(std::unique_ptr<boost::asio::ssl::context> ctx,
           SubmissionHandler handler)
    : sslContext(std::move(ctx))
    , handler(std::move(handler)) {}

  std::unique_ptr<boost::asio::ssl::context> sslContext;
  SubmissionHandler handler;
  TerminationHandler onTerminated;

  // Declared after the TLS context, pending handlers holding sessions are
  // destroyed first.
  io_context context;
  tcp::acceptor acceptor{ context };
  tcp::endpoint endpoint;
  std::unique_ptr<tcp::socket> newSocket;
  boost::asio::coroutine coro;

  std::list<std::weak_ptr<HttpsSession>> sessions;

  std::atomic_uint16_t port = 0;
  std::atomic_bool started = false;
  std::atomic_bool closeRequested = false;
  Signal closed;

  void loop(const boost::system::error_code& ec);
  int run();
  void shutdownSockets();
};

#include <boost/asio/yield.hpp>
void
ResultTransport::Internal::loop(const boost::system::error_code& ec) {
  const auto l = [this](const boost::system::error_code& ec) { loop(ec); };

  reenter(coro) {
    for(;;) {
      newSocket = std::make_unique<tcp::socket>(context);

      yield acceptor.async_accept(*newSocket, l);

      if(ec == boost::asio::error::operation_aborted) {
        yield break;
      } else if(ec) {
        sonde_log(SONDE_TRANSPORT,
                  SONDE_LOCALERROR,
                  "Error during accepting new connection on port {}! Error: {}",
                  port.load(),
                  ec.message());
      } else {
        auto session = std::make_shared<HttpsSession>(
          std::move(*newSocket), *sslContext, handler);

        sonde_log(SONDE_TRANSPORT,
                  SONDE_DEBUG,
                  "New connection on port {} from {}.",
                  port.load(),
                  session->remote());

        sessions.remove_if([](auto& s) { return s.expired(); });
        sessions.push_back(session);
        session->run();
      }
    }
  }
}
#include <boost/asio/unyield.hpp>

int
ResultTransport::Internal::run() {
  sonde_log(SONDE_TRANSPORT,
            SONDE_DEBUG,
            "Starting result transport io_context on port {}.",
            port.load());

  sonde_status status = SONDE_OK;
  try {
    context.run();
  } catch(const std::exception& e) {
    sonde_log(SONDE_TRANSPORT,
              SONDE_LOCALERROR,
              "Exception in result transport io_context: {}",
              e.what());
    status = SONDE_TRANSPORT_ERROR;
  }

  shutdownSockets();

  if(closeRequested) {
    status = SONDE_CONNECTION_CLOSED;
  } else if(status == SONDE_OK) {
    // Without a close request the accept loop never runs out of work.
    status = SONDE_TRANSPORT_ERROR;
  }

  sonde_log(SONDE_TRANSPORT,
            status == SONDE_CONNECTION_CLOSED ? SONDE_DEBUG : SONDE_LOCALERROR,
            "Result transport on port {} ended with status {}.",
            port.load(),
            sonde_status_to_str(status));

  if(onTerminated)
    onTerminated(status);
  closed.raise();

  return status;
}

void
ResultTransport::Internal::shutdownSockets() {
  boost::system::error_code ec;
  acceptor.close(ec);
  for(auto& weak : sessions) {
    if(auto session = weak.lock())
      session->close();
  }
  sessions.clear();
}

ResultTransport::ResultTransport(
  std::unique_ptr<boost::asio::ssl::context> ctx,
  SubmissionHandler handler)
  : m_internal(std::make_shared<Internal>(std::move(ctx), std::move(handler))) {
}

ResultTransport::~ResultTransport() {
  close();
  sonde_log(SONDE_TRANSPORT, SONDE_DEBUG, "Destroy ResultTransport.");
}

sonde_status
ResultTransport::start(ThreadRegistry& registry,
                       const std::string& bindAddress,
                       uint16_t bindPort,
                       TerminationHandler onTerminated) {
  auto& i = *m_internal;
  if(i.started || i.closeRequested) {
    return SONDE_GENERIC_ERROR;
  }

  auto ipAddress = ParseIPAddress(bindAddress);
  if(!ipAddress) {
    sonde_log(SONDE_TRANSPORT,
              SONDE_FATAL,
              "Cannot parse bind address \"{}\"!",
              bindAddress);
    return SONDE_INVALID_IP;
  }

  i.endpoint = tcp::endpoint(*ipAddress, bindPort);

  try {
    i.acceptor.open(i.endpoint.protocol());
    i.acceptor.set_option(tcp::acceptor::reuse_address(true));
    i.acceptor.bind(i.endpoint);
    i.acceptor.listen();
  } catch(const boost::system::system_error& e) {
    sonde_log(SONDE_TRANSPORT,
              SONDE_FATAL,
              "Cannot listen on {}:{}! Error: {}",
              bindAddress,
              bindPort,
              e.what());
    boost::system::error_code ec;
    i.acceptor.close(ec);
    return SONDE_TRANSPORT_ERROR;
  }

  i.port = i.acceptor.local_endpoint().port();
  i.onTerminated = std::move(onTerminated);

  sonde_log(SONDE_TRANSPORT,
            SONDE_INFO,
            "Accepting results on {}:{}.",
            bindAddress,
            i.port.load());

  i.loop(boost::system::error_code());

  auto internal = m_internal;
  i.started = true;
  sonde_status s = registry.create(
    "transport",
    [internal](ThreadRegistry::Handle&) -> int { return internal->run(); });
  if(s != SONDE_OK) {
    i.started = false;
    i.shutdownSockets();
    return s;
  }
  return SONDE_OK;
}

void
ResultTransport::close() {
  auto& i = *m_internal;
  if(i.closeRequested.exchange(true)) {
    if(i.started)
      i.closed.wait();
    return;
  }

  if(!i.started) {
    i.shutdownSockets();
    i.closed.raise();
    return;
  }

  sonde_log(SONDE_TRANSPORT, SONDE_DEBUG, "Force closing result transport.");
  i.context.stop();
  i.closed.wait();
}

uint16_t
ResultTransport::port() const {
  return m_internal->port;
}

bool
ResultTransport::running() const {
  return m_internal->started && !m_internal->closed.raised();
}
}
