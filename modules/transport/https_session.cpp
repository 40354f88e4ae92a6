#include "https_session.hpp"

#include <chrono>

#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <sonde/common/log.hpp>

#include "../authority/certificate_authority.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;

namespace sonde::transport {
namespace {
constexpr std::chrono::seconds SessionTimeout{ 30 };
constexpr std::uint64_t MaxBodySize = 64 * 1024 * 1024;

std::string
EndpointToStr(const asio::ip::tcp::socket& socket) {
  boost::system::error_code ec;
  auto endpoint = socket.remote_endpoint(ec);
  if(ec)
    return "(unknown)";
  return fmt::format(
    "{}:{}", endpoint.address().to_string(), endpoint.port());
}
}

HttpsSession::HttpsSession(asio::ip::tcp::socket&& socket,
                           asio::ssl::context& ctx,
                           SubmissionHandler handler)
  : m_remote(EndpointToStr(socket))
  , m_stream(std::move(socket), ctx)
  , m_handler(std::move(handler)) {}

HttpsSession::~HttpsSession() {
  sonde_log(
    SONDE_TRANSPORT, SONDE_TRACE, "Destroy HttpsSession with {}.", m_remote);
}

void
HttpsSession::run() {
  beast::get_lowest_layer(m_stream).expires_after(SessionTimeout);
  m_stream.async_handshake(
    asio::ssl::stream_base::server,
    beast::bind_front_handler(&HttpsSession::onHandshake, shared_from_this()));
}

void
HttpsSession::close() {
  beast::get_lowest_layer(m_stream).close();
}

std::optional<std::string>
HttpsSession::peerIdentity() {
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
  X509* cert = SSL_get1_peer_certificate(m_stream.native_handle());
#else
  X509* cert = SSL_get_peer_certificate(m_stream.native_handle());
#endif
  if(!cert)
    return std::nullopt;
  auto cn = authority::SubjectCommonName(cert);
  X509_free(cert);
  return cn;
}

void
HttpsSession::onHandshake(beast::error_code ec) {
  if(ec) {
    sonde_log(SONDE_TRANSPORT,
              SONDE_LOCALWARNING,
              "Rejected TLS handshake from {}! Error: {}",
              m_remote,
              ec.message());
    return;
  }

  m_identity = peerIdentity();
  if(!m_identity || m_identity->empty()) {
    sonde_log(SONDE_TRANSPORT,
              SONDE_LOCALWARNING,
              "Peer {} presented a certificate without common name.",
              m_remote);
    return close();
  }

  sonde_log(SONDE_TRANSPORT,
            SONDE_DEBUG,
            "Peer {} authenticated as {}.",
            m_remote,
            *m_identity);
  doRead();
}

void
HttpsSession::doRead() {
  m_parser.emplace();
  m_parser->body_limit(MaxBodySize);

  beast::get_lowest_layer(m_stream).expires_after(SessionTimeout);
  http::async_read(
    m_stream,
    m_buffer,
    *m_parser,
    beast::bind_front_handler(&HttpsSession::onRead, shared_from_this()));
}

void
HttpsSession::onRead(beast::error_code ec, std::size_t bytes) {
  (void)bytes;
  if(ec == http::error::end_of_stream)
    return doShutdown();

  if(ec) {
    sonde_log(SONDE_TRANSPORT,
              SONDE_DEBUG,
              "Could not read request from {} ({})! Error: {}",
              m_remote,
              *m_identity,
              ec.message());
    return;
  }

  m_response = std::make_shared<Response>(
    HandleSubmissionRequest(m_parser->get(), *m_identity, m_handler));

  http::async_write(m_stream,
                    *m_response,
                    beast::bind_front_handler(&HttpsSession::onWrite,
                                              shared_from_this(),
                                              m_response->need_eof()));
}

void
HttpsSession::onWrite(bool close, beast::error_code ec, std::size_t bytes) {
  (void)bytes;
  if(ec) {
    sonde_log(SONDE_TRANSPORT,
              SONDE_DEBUG,
              "Could not write response to {}! Error: {}",
              m_remote,
              ec.message());
    return;
  }

  m_response.reset();
  if(close)
    return doShutdown();

  doRead();
}

void
HttpsSession::doShutdown() {
  beast::get_lowest_layer(m_stream).expires_after(SessionTimeout);
  m_stream.async_shutdown(
    [self = shared_from_this()](beast::error_code ec) {
      // Peers often drop the connection without their close_notify.
      if(ec && ec != asio::ssl::error::stream_truncated) {
        sonde_log(SONDE_TRANSPORT,
                  SONDE_TRACE,
                  "TLS shutdown with {} failed: {}",
                  self->remote(),
                  ec.message());
      }
    });
}
}
