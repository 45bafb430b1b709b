#include "proxy/response_classifier.h"

namespace enginectl {

const char *OutcomeName(UpstreamOutcome outcome) {
  switch (outcome) {
  case UpstreamOutcome::kOk:
    return "ok";
  case UpstreamOutcome::kConnectionError:
    return "connection_error";
  case UpstreamOutcome::kLoadFailure:
    return "load_failure";
  case UpstreamOutcome::kTemplateIncompatible:
    return "template_incompatible";
  case UpstreamOutcome::kUpstreamError:
    return "upstream_error";
  }
  return "upstream_error";
}

UpstreamOutcome ClassifyResponse(int status, const std::string &body) {
  if (status >= 200 && status < 300) {
    return UpstreamOutcome::kOk;
  }
  if (status == 500 && body.find("failed to load") != std::string::npos) {
    return UpstreamOutcome::kLoadFailure;
  }
  if (body.find("Cannot pass both content and thinking") != std::string::npos) {
    return UpstreamOutcome::kTemplateIncompatible;
  }
  return UpstreamOutcome::kUpstreamError;
}

} // namespace enginectl
