#ifndef SONDE_COMMON_RESULT_HPP
#define SONDE_COMMON_RESULT_HPP

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

#include <boost/property_tree/ptree.hpp>

namespace sonde {
/// Locus of results that are not bound to a single node.
constexpr const char* GlobalLocus = "global";

using Payload = boost::property_tree::ptree;

/** @brief One slot that has to be filled before a run is complete.
 *
 * The producer is the name of the workload, the locus a node name or
 * GlobalLocus, the kind the result type tag of the workload.
 */
struct ExpectedResult {
  std::string producer;
  std::string locus;
  std::string kind;

  bool operator==(const ExpectedResult& o) const {
    return std::tie(producer, locus, kind) ==
           std::tie(o.producer, o.locus, o.kind);
  }
  bool operator!=(const ExpectedResult& o) const { return !(*this == o); }
  bool operator<(const ExpectedResult& o) const {
    return std::tie(producer, locus, kind) <
           std::tie(o.producer, o.locus, o.kind);
  }

  bool isGlobal() const { return locus == GlobalLocus; }
};

using ExpectedResults = std::vector<ExpectedResult>;

struct Result {
  std::string producer;
  std::string locus;
  std::string kind;
  Payload payload;
  std::optional<std::string> error;

  ExpectedResult slot() const { return { producer, locus, kind }; }
  bool isError() const { return error.has_value(); }
};

using Results = std::vector<Result>;

enum class SubmissionOutcome { Accepted, Duplicate, Unexpected };

/// Capability handed to the transport. Backed by the aggregator.
using SubmissionHandler = std::function<SubmissionOutcome(Result)>;

/** @brief Builds an error surrogate for a slot that can not be filled
 * otherwise.
 *
 * The payload carries the message under the key "error".
 */
Result
MakeErrorResult(const ExpectedResult& slot, const std::string& message);

const char*
SubmissionOutcomeToStr(SubmissionOutcome outcome);

std::ostream&
operator<<(std::ostream& o, const ExpectedResult& e);
}

namespace std {
template<>
struct hash<sonde::ExpectedResult> {
  std::size_t operator()(const sonde::ExpectedResult& e) const noexcept {
    std::size_t h = std::hash<std::string>()(e.producer);
    h ^= std::hash<std::string>()(e.locus) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::string>()(e.kind) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
  }
};
}

#endif
