#include "proxy/request_rewriter.h"

#include "server/logging/logger.h"

namespace enginectl {

namespace {

bool IsUnset(const nlohmann::json &body, const char *key) {
  auto it = body.find(key);
  return it == body.end() || it->is_null();
}

std::string ContentText(const nlohmann::json &content) {
  if (content.is_null()) {
    return "";
  }
  if (content.is_string()) {
    return content.get<std::string>();
  }
  if (content.empty()) {
    return "";
  }
  return content.dump();
}

} // namespace

void ApplyPresetDefaults(const Preset &preset, nlohmann::json *body) {
  auto &request = *body;
  if (IsUnset(request, "temperature")) {
    request["temperature"] = preset.config.temp;
  }
  if (IsUnset(request, "top_p")) {
    request["top_p"] = preset.config.top_p;
  }
  if (IsUnset(request, "top_k")) {
    request["top_k"] = preset.config.top_k;
  }
  if (IsUnset(request, "min_p")) {
    request["min_p"] = preset.config.min_p;
  }

  nlohmann::json kwargs = ParseTemplateKwargs(preset.config.chat_template_kwargs);
  if (kwargs.empty()) {
    return;
  }
  auto existing = request.find("chat_template_kwargs");
  if (existing != request.end() && existing->is_object()) {
    for (auto it = existing->begin(); it != existing->end(); ++it) {
      kwargs[it.key()] = it.value();
    }
  }
  request["chat_template_kwargs"] = std::move(kwargs);
}

bool GlobMatch(const std::string &pattern, const std::string &text) {
  std::size_t p = 0;
  std::size_t t = 0;
  std::size_t star = std::string::npos;
  std::size_t resume = 0;
  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = t;
    } else if (star != std::string::npos) {
      p = star + 1;
      t = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

std::string InjectReasoningEffort(const Settings &settings, nlohmann::json *body) {
  auto &request = *body;
  auto ensure_kwargs = [&request]() -> nlohmann::json & {
    auto &kwargs = request["chat_template_kwargs"];
    if (!kwargs.is_object()) {
      kwargs = nlohmann::json::object();
    }
    return kwargs;
  };

  auto top_level = request.find("reasoning_effort");
  if (top_level != request.end() && top_level->is_string() &&
      !top_level->get<std::string>().empty()) {
    std::string effort = top_level->get<std::string>();
    request.erase(top_level);
    ensure_kwargs()["reasoning_effort"] = effort;
    return effort;
  }

  auto kwargs = request.find("chat_template_kwargs");
  if (kwargs != request.end() && kwargs->is_object()) {
    auto current = kwargs->find("reasoning_effort");
    if (current != kwargs->end() && current->is_string() &&
        !current->get<std::string>().empty()) {
      return current->get<std::string>();
    }
  }

  std::string model;
  auto model_it = request.find("model");
  if (model_it != request.end() && model_it->is_string()) {
    model = model_it->get<std::string>();
  }

  std::string effort;
  for (const auto &[pattern, value] : settings.model_reasoning_effort) {
    if (GlobMatch(pattern, model)) {
      effort = value;
      break;
    }
  }
  if (effort.empty() && settings.default_reasoning_effort) {
    effort = *settings.default_reasoning_effort;
  }
  if (!effort.empty()) {
    ensure_kwargs()["reasoning_effort"] = effort;
  }
  return effort;
}

int SanitizeMessages(nlohmann::json *messages) {
  if (!messages->is_array()) {
    return 0;
  }
  int changed = 0;
  for (auto &message : *messages) {
    if (!message.is_object() || message.value("role", "") != "assistant" ||
        !message.contains("tool_calls") || message["tool_calls"].is_null() ||
        !message.contains("content") ||
        !message.contains("thinking")) {
      continue;
    }
    std::string merged = ContentText(message["thinking"]);
    std::string content = ContentText(message["content"]);
    if (!content.empty()) {
      merged += "\n" + content;
    }
    message.erase("content");
    message["thinking"] = merged;
    ++changed;
  }
  log::Debug("proxy", "sanitized messages",
             "total=" + std::to_string(messages->size()) +
                 " changed=" + std::to_string(changed));
  return changed;
}

} // namespace enginectl
