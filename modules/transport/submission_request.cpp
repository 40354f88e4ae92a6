#include "submission_request.hpp"

#include <sstream>
#include <vector>

#include <boost/algorithm/string/split.hpp>
#include <boost/beast/version.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <sonde/common/log.hpp>

namespace http = boost::beast::http;

namespace sonde::transport {
namespace {
std::vector<std::string>
PathSegments(std::string target) {
  auto query = target.find('?');
  if(query != std::string::npos)
    target.erase(query);

  std::vector<std::string> segments;
  boost::algorithm::split(
    segments, target, [](char c) { return c == '/'; });

  // Leading slash and an optional trailing slash produce empty segments.
  if(!segments.empty() && segments.front().empty())
    segments.erase(segments.begin());
  if(!segments.empty() && segments.back().empty())
    segments.pop_back();
  return segments;
}

bool
RouteTarget(const std::string& target,
            std::optional<std::string>& locus,
            std::optional<std::string>& kind) {
  auto s = PathSegments(target);
  if(s.size() < 3 || s[0] != "api" || s[1] != "v1" || s[2] != "results")
    return false;

  if(s.size() == 3)
    return true;
  if(s.size() == 5 && s[3] == "global") {
    locus = GlobalLocus;
    kind = s[4];
    return true;
  }
  if(s.size() == 6 && s[3] == "by-node") {
    locus = s[4];
    kind = s[5];
    return true;
  }
  return false;
}

bool
MergeField(const boost::property_tree::ptree& body,
           const char* key,
           std::optional<std::string>& field,
           std::string& problem) {
  auto v = body.get_optional<std::string>(key);
  if(!v)
    return true;
  if(field && *field != *v) {
    problem = fmt::format(
      "Field '{}' is '{}' in the body but '{}' in the target.", key, *v, *field);
    return false;
  }
  field = *v;
  return true;
}

Response
MakeResponse(const Request& req, http::status status, std::string body) {
  Response res{ status, req.version() };
  res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
  res.set(http::field::content_type, "application/json");
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

Response
ErrorResponse(const Request& req, http::status status, const std::string& why) {
  boost::property_tree::ptree doc;
  doc.put("error", why);
  std::ostringstream o;
  boost::property_tree::write_json(o, doc, false);
  return MakeResponse(req, status, o.str());
}
}

sonde_status
DecodeSubmission(const std::string& producer,
                 const std::string& target,
                 const std::string& body,
                 Result& result,
                 std::string& problem) {
  std::optional<std::string> locus, kind;
  if(!RouteTarget(target, locus, kind)) {
    problem = fmt::format("The resource '{}' was not found.", target);
    return SONDE_INVALID_ADDRESS;
  }

  boost::property_tree::ptree doc;
  if(!body.empty()) {
    try {
      std::istringstream i(body);
      boost::property_tree::read_json(i, doc);
    } catch(const boost::property_tree::json_parser_error& e) {
      problem = fmt::format("Malformed JSON body: {}", e.what());
      return SONDE_PARSE_ERROR;
    }
    if(!doc.data().empty() ||
       (!doc.empty() && doc.front().first.empty())) {
      problem = "The body must be a JSON object.";
      return SONDE_PARSE_ERROR;
    }
  }

  if(auto p = doc.get_optional<std::string>("producer");
     p && *p != producer) {
    problem = fmt::format(
      "Body producer '{}' does not match the certificate of '{}'.",
      *p,
      producer);
    return SONDE_CERTIFICATE_ERROR;
  }

  if(!MergeField(doc, "locus", locus, problem) ||
     !MergeField(doc, "kind", kind, problem)) {
    return SONDE_PARSE_ERROR;
  }
  if(!locus || locus->empty() || !kind || kind->empty()) {
    problem = "Submissions need a locus and a kind.";
    return SONDE_PARSE_ERROR;
  }

  result.producer = producer;
  result.locus = *locus;
  result.kind = *kind;
  if(auto payload = doc.get_child_optional("payload"))
    result.payload = *payload;
  else
    result.payload.clear();
  if(auto error = doc.get_optional<std::string>("error"))
    result.error = *error;
  else
    result.error.reset();

  return SONDE_OK;
}

Response
HandleSubmissionRequest(const Request& req,
                        const std::string& peerIdentity,
                        const SubmissionHandler& handler) {
  std::string target(req.target().data(), req.target().size());

  if(req.method() != http::verb::put && req.method() != http::verb::post) {
    auto res =
      ErrorResponse(req, http::status::method_not_allowed, "Use PUT or POST.");
    res.set(http::field::allow, "PUT, POST");
    return res;
  }

  Result result;
  std::string problem;
  sonde_status s =
    DecodeSubmission(peerIdentity, target, req.body(), result, problem);
  switch(s) {
    case SONDE_OK:
      break;
    case SONDE_INVALID_ADDRESS:
      return ErrorResponse(req, http::status::not_found, problem);
    case SONDE_CERTIFICATE_ERROR:
      sonde_log(SONDE_TRANSPORT, SONDE_LOCALWARNING, "{}", problem);
      return ErrorResponse(req, http::status::forbidden, problem);
    default:
      sonde_log(SONDE_TRANSPORT,
                SONDE_DEBUG,
                "Rejecting submission of {} to {}: {}",
                peerIdentity,
                target,
                problem);
      return ErrorResponse(req, http::status::bad_request, problem);
  }

  SubmissionOutcome outcome;
  try {
    outcome = handler(std::move(result));
  } catch(const std::exception& e) {
    sonde_log(SONDE_TRANSPORT,
              SONDE_LOCALERROR,
              "Exception while handling submission of {} to {}: {}",
              peerIdentity,
              target,
              e.what());
    return ErrorResponse(
      req, http::status::internal_server_error, "Could not store result.");
  }

  return MakeResponse(
    req,
    http::status::ok,
    fmt::format("{{\"accepted\":{},\"outcome\":\"{}\"}}",
                outcome == SubmissionOutcome::Accepted ? "true" : "false",
                SubmissionOutcomeToStr(outcome)));
}
}
