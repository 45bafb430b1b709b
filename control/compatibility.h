#pragma once

#include "control/orchestrator_state.h"
#include "control/preset.h"

#include <string>
#include <vector>

namespace enginectl {

struct CompatibilityResult {
  bool compatible{true};
  std::vector<std::string> reasons;
};

// Decides whether a preset can be served by the running engine without a
// restart. Only launch-time settings are compared; sampling parameters travel
// per request.
class CompatibilityChecker {
public:
  explicit CompatibilityChecker(const OrchestratorState *state) : state_(state) {}

  // A null preset is always compatible.
  CompatibilityResult IsCompatible(const Preset *preset) const;

  static CompatibilityResult Check(const Preset &preset,
                                   const EngineRuntimeConfig &runtime);

private:
  const OrchestratorState *state_;
};

} // namespace enginectl
