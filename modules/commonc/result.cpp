#include <sonde/common/result.hpp>

namespace sonde {
Result
MakeErrorResult(const ExpectedResult& slot, const std::string& message) {
  Result r;
  r.producer = slot.producer;
  r.locus = slot.locus;
  r.kind = slot.kind;
  r.payload.put("error", message);
  r.error = message;
  return r;
}

const char*
SubmissionOutcomeToStr(SubmissionOutcome outcome) {
  switch(outcome) {
    case SubmissionOutcome::Accepted:
      return "accepted";
    case SubmissionOutcome::Duplicate:
      return "duplicate";
    case SubmissionOutcome::Unexpected:
      return "unexpected";
  }
  return "!";
}

std::ostream&
operator<<(std::ostream& o, const ExpectedResult& e) {
  return o << e.producer << "/" << e.locus << "/" << e.kind;
}
}
