#pragma once

#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include <sonde/common/result.hpp>

#include "submission_request.hpp"

namespace sonde::transport {
/** @brief One mutually authenticated connection.
 *
 * Lives as long as one of its asynchronous operations is pending. All members
 * are only touched from the io thread of the transport.
 */
class HttpsSession : public std::enable_shared_from_this<HttpsSession> {
  public:
  HttpsSession(boost::asio::ip::tcp::socket&& socket,
               boost::asio::ssl::context& ctx,
               SubmissionHandler handler);
  ~HttpsSession();

  void run();

  /// Drops the connection without a TLS shutdown.
  void close();

  const std::string& remote() const { return m_remote; }

  private:
  using Stream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

  std::string m_remote;
  Stream m_stream;
  boost::beast::flat_buffer m_buffer;
  std::optional<boost::beast::http::request_parser<
    boost::beast::http::string_body>>
    m_parser;
  std::shared_ptr<Response> m_response;

  SubmissionHandler m_handler;
  std::optional<std::string> m_identity;

  void onHandshake(boost::beast::error_code ec);
  void doRead();
  void onRead(boost::beast::error_code ec, std::size_t bytes);
  void onWrite(bool close, boost::beast::error_code ec, std::size_t bytes);
  void doShutdown();

  std::optional<std::string> peerIdentity();
};
}
