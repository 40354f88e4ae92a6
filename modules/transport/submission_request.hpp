#pragma once

#include <string>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <sonde/common/result.hpp>
#include <sonde/common/status.hpp>

namespace sonde::transport {
using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

constexpr const char* ResultsTarget = "/api/v1/results";

/** @brief Turns one request into a Result.
 *
 * The locus and kind come from the target path, the body may repeat them.
 * Returns SONDE_INVALID_ADDRESS for unknown targets and SONDE_PARSE_ERROR for
 * malformed or contradicting bodies.
 */
sonde_status
DecodeSubmission(const std::string& producer,
                 const std::string& target,
                 const std::string& body,
                 Result& result,
                 std::string& problem);

/// Answers a request of an authenticated peer. Never throws.
Response
HandleSubmissionRequest(const Request& req,
                        const std::string& peerIdentity,
                        const SubmissionHandler& handler);
}
