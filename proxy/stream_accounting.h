#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace enginectl {

enum class ProxyEndpoint {
  kChatCompletions,
  kCompletions,
  kEmbeddings,
  kResponses,
  kMessages,
};

// "chat/completions", "completions", ...
const char *EndpointName(ProxyEndpoint endpoint);
// "/v1/chat/completions", ...
std::string EndpointPath(ProxyEndpoint endpoint);
std::optional<ProxyEndpoint> EndpointFromName(const std::string &name);

// Endpoints whose requests may carry a reasoning effort.
bool SupportsReasoningEffort(ProxyEndpoint endpoint);

struct TokenUsage {
  int prompt_tokens{0};
  int completion_tokens{0};
  std::string text;
  std::string model;
};

// Usage and response text of a complete (non-streaming) response body.
TokenUsage ExtractUsage(ProxyEndpoint endpoint, const nlohmann::json &response);

// Incremental SSE accounting for a streamed response. Chunks may split lines
// anywhere; unparseable data lines are skipped.
class StreamAccounting {
public:
  StreamAccounting(ProxyEndpoint endpoint, std::string model);

  void Feed(const std::string &chunk);
  // Processes a trailing line that arrived without a newline.
  void Finish();

  const TokenUsage &Usage() const { return usage_; }

private:
  void HandleLine(const std::string &line);
  void HandleEvent(const nlohmann::json &event);

  ProxyEndpoint endpoint_;
  TokenUsage usage_;
  std::string partial_;
  int counted_tokens_{0};
  bool usage_reported_{false};
};

} // namespace enginectl
