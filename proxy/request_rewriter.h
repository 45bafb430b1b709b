#pragma once

#include "control/config_store.h"
#include "control/preset.h"

#include <nlohmann/json.hpp>

#include <string>

namespace enginectl {

// Fills temperature / top_p / top_k / min_p from the preset where the request
// left them unset and merges the preset's chat_template_kwargs underneath the
// request's own (request keys win).
void ApplyPresetDefaults(const Preset &preset, nlohmann::json *body);

// Shell-style match supporting '*' and '?'.
bool GlobMatch(const std::string &pattern, const std::string &text);

// Places a reasoning effort into chat_template_kwargs.reasoning_effort:
//   1. a top-level "reasoning_effort" is moved there (and removed);
//   2. an existing kwargs value is left alone;
//   3. otherwise the first matching per-model glob, then the default.
// Returns the effort now in effect, or "" when none applies.
std::string InjectReasoningEffort(const Settings &settings, nlohmann::json *body);

// Rewrites assistant tool-call messages that carry both "content" and
// "thinking" into a single "thinking" field. Returns the number of messages
// changed. Non-array input is left as is.
int SanitizeMessages(nlohmann::json *messages);

} // namespace enginectl
