#include "control/compatibility.h"

namespace enginectl {

namespace {
const char *BoolText(bool value) { return value ? "true" : "false"; }
} // namespace

CompatibilityResult
CompatibilityChecker::Check(const Preset &preset,
                            const EngineRuntimeConfig &runtime) {
  CompatibilityResult result;
  if (preset.context != 0 && preset.context != runtime.context) {
    result.reasons.push_back("Context " + std::to_string(preset.context) +
                             " != current " + std::to_string(runtime.context));
  }
  const auto &config = preset.config;
  if (config.gpu_layers && *config.gpu_layers != runtime.gpu_layers) {
    result.reasons.push_back("GPU layers " + std::to_string(*config.gpu_layers) +
                             " != current " +
                             std::to_string(runtime.gpu_layers));
  }
  if (config.flash_attn && *config.flash_attn != runtime.flash_attn) {
    result.reasons.push_back(std::string("Flash attention ") +
                             BoolText(*config.flash_attn) + " != current " +
                             BoolText(runtime.flash_attn));
  }
  if (config.reasoning_format && !config.reasoning_format->empty() &&
      config.reasoning_format != runtime.reasoning_format) {
    result.reasons.push_back("Reasoning format \"" + *config.reasoning_format +
                             "\" != current \"" +
                             runtime.reasoning_format.value_or("none") + "\"");
  }
  result.compatible = result.reasons.empty();
  return result;
}

CompatibilityResult
CompatibilityChecker::IsCompatible(const Preset *preset) const {
  if (!preset) {
    return {};
  }
  return Check(*preset, state_->Runtime());
}

} // namespace enginectl
