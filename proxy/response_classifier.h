#pragma once

#include <string>

namespace enginectl {

enum class UpstreamOutcome {
  kOk,
  kConnectionError,
  kLoadFailure,
  kTemplateIncompatible,
  kUpstreamError,
};

const char *OutcomeName(UpstreamOutcome outcome);

// Classifies an engine response. The engine reports these conditions only as
// free text, so this is the one place that matches on its error messages:
//   500 + "failed to load"                       -> kLoadFailure
//   "Cannot pass both content and thinking"      -> kTemplateIncompatible
// kConnectionError is never returned here; the transport raises it.
UpstreamOutcome ClassifyResponse(int status, const std::string &body);

} // namespace enginectl
