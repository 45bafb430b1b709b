#include "proxy/stream_accounting.h"

namespace enginectl {

namespace {

int IntField(const nlohmann::json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_number()) {
    return 0;
  }
  return it->get<int>();
}

// First non-zero of the named counters.
int FirstCount(const nlohmann::json &usage, const char *primary,
               const char *fallback) {
  int value = IntField(usage, primary);
  return value != 0 ? value : IntField(usage, fallback);
}

std::string StringField(const nlohmann::json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

} // namespace

const char *EndpointName(ProxyEndpoint endpoint) {
  switch (endpoint) {
  case ProxyEndpoint::kChatCompletions:
    return "chat/completions";
  case ProxyEndpoint::kCompletions:
    return "completions";
  case ProxyEndpoint::kEmbeddings:
    return "embeddings";
  case ProxyEndpoint::kResponses:
    return "responses";
  case ProxyEndpoint::kMessages:
    return "messages";
  }
  return "chat/completions";
}

std::string EndpointPath(ProxyEndpoint endpoint) {
  return std::string("/v1/") + EndpointName(endpoint);
}

std::optional<ProxyEndpoint> EndpointFromName(const std::string &name) {
  for (auto endpoint :
       {ProxyEndpoint::kChatCompletions, ProxyEndpoint::kCompletions,
        ProxyEndpoint::kEmbeddings, ProxyEndpoint::kResponses,
        ProxyEndpoint::kMessages}) {
    if (name == EndpointName(endpoint)) {
      return endpoint;
    }
  }
  return std::nullopt;
}

bool SupportsReasoningEffort(ProxyEndpoint endpoint) {
  return endpoint == ProxyEndpoint::kChatCompletions ||
         endpoint == ProxyEndpoint::kResponses ||
         endpoint == ProxyEndpoint::kMessages;
}

TokenUsage ExtractUsage(ProxyEndpoint endpoint, const nlohmann::json &response) {
  TokenUsage usage;
  if (!response.is_object()) {
    return usage;
  }
  usage.model = StringField(response, "model");

  auto usage_it = response.find("usage");
  if (usage_it != response.end() && usage_it->is_object()) {
    usage.prompt_tokens = FirstCount(*usage_it, "prompt_tokens", "input_tokens");
    usage.completion_tokens =
        FirstCount(*usage_it, "completion_tokens", "output_tokens");
  }

  switch (endpoint) {
  case ProxyEndpoint::kChatCompletions: {
    auto choices = response.find("choices");
    if (choices != response.end() && choices->is_array() && !choices->empty()) {
      const auto &first = choices->front();
      if (first.contains("message") && first["message"].is_object()) {
        usage.text = StringField(first["message"], "content");
      }
    }
    break;
  }
  case ProxyEndpoint::kCompletions: {
    auto choices = response.find("choices");
    if (choices != response.end() && choices->is_array() && !choices->empty()) {
      usage.text = StringField(choices->front(), "text");
    }
    break;
  }
  case ProxyEndpoint::kResponses: {
    usage.text = StringField(response, "output_text");
    auto output = response.find("output");
    if (usage.text.empty() && output != response.end() && output->is_array()) {
      for (const auto &item : *output) {
        if (!item.is_object() || !item.contains("content") ||
            !item["content"].is_array()) {
          continue;
        }
        for (const auto &part : item["content"]) {
          if (part.is_object() && StringField(part, "type") == "output_text") {
            usage.text += StringField(part, "text");
          }
        }
      }
    }
    break;
  }
  case ProxyEndpoint::kMessages: {
    auto content = response.find("content");
    if (content != response.end() && content->is_array() && !content->empty() &&
        content->front().is_object()) {
      usage.text = StringField(content->front(), "text");
    }
    break;
  }
  case ProxyEndpoint::kEmbeddings:
    break;
  }
  return usage;
}

StreamAccounting::StreamAccounting(ProxyEndpoint endpoint, std::string model)
    : endpoint_(endpoint) {
  usage_.model = std::move(model);
}

void StreamAccounting::Feed(const std::string &chunk) {
  partial_ += chunk;
  std::size_t start = 0;
  std::size_t newline = 0;
  while ((newline = partial_.find('\n', start)) != std::string::npos) {
    std::string line = partial_.substr(start, newline - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    HandleLine(line);
    start = newline + 1;
  }
  partial_.erase(0, start);
}

void StreamAccounting::Finish() {
  if (!partial_.empty()) {
    std::string line;
    line.swap(partial_);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    HandleLine(line);
  }
}

void StreamAccounting::HandleLine(const std::string &line) {
  static const std::string kPrefix = "data:";
  if (line.compare(0, kPrefix.size(), kPrefix) != 0) {
    return;
  }
  std::string payload = line.substr(kPrefix.size());
  if (!payload.empty() && payload.front() == ' ') {
    payload.erase(0, 1);
  }
  if (payload.empty() || payload == "[DONE]") {
    return;
  }
  auto event = nlohmann::json::parse(payload, nullptr, false);
  if (event.is_discarded() || !event.is_object()) {
    return;
  }
  HandleEvent(event);
}

void StreamAccounting::HandleEvent(const nlohmann::json &event) {
  std::string delta_text;
  const nlohmann::json *usage = nullptr;

  switch (endpoint_) {
  case ProxyEndpoint::kChatCompletions: {
    auto choices = event.find("choices");
    if (choices != event.end() && choices->is_array() && !choices->empty()) {
      const auto &first = choices->front();
      if (first.contains("delta") && first["delta"].is_object()) {
        delta_text = StringField(first["delta"], "content");
      }
    }
    break;
  }
  case ProxyEndpoint::kCompletions: {
    auto choices = event.find("choices");
    if (choices != event.end() && choices->is_array() && !choices->empty()) {
      delta_text = StringField(choices->front(), "text");
    }
    break;
  }
  case ProxyEndpoint::kResponses: {
    std::string type = StringField(event, "type");
    if (type == "response.output_text.delta") {
      delta_text = StringField(event, "delta");
    }
    auto response = event.find("response");
    if (response != event.end() && response->is_object()) {
      auto nested = response->find("usage");
      if (nested != response->end() && nested->is_object()) {
        usage = &*nested;
      }
      std::string model = StringField(*response, "model");
      if (!model.empty()) {
        usage_.model = model;
      }
    }
    break;
  }
  case ProxyEndpoint::kMessages: {
    std::string type = StringField(event, "type");
    if (type == "content_block_delta" && event.contains("delta") &&
        event["delta"].is_object()) {
      delta_text = StringField(event["delta"], "text");
    }
    auto message = event.find("message");
    if (message != event.end() && message->is_object()) {
      auto nested = message->find("usage");
      if (nested != message->end() && nested->is_object()) {
        usage = &*nested;
      }
      std::string model = StringField(*message, "model");
      if (!model.empty()) {
        usage_.model = model;
      }
    }
    break;
  }
  case ProxyEndpoint::kEmbeddings:
    break;
  }

  if (!delta_text.empty()) {
    usage_.text += delta_text;
    ++counted_tokens_;
    if (!usage_reported_) {
      usage_.completion_tokens = counted_tokens_;
    }
  }

  auto top_usage = event.find("usage");
  if (top_usage != event.end() && top_usage->is_object()) {
    usage = &*top_usage;
  }
  if (usage) {
    int prompt = FirstCount(*usage, "prompt_tokens", "input_tokens");
    int completion = FirstCount(*usage, "completion_tokens", "output_tokens");
    if (prompt != 0) {
      usage_.prompt_tokens = prompt;
    }
    if (completion != 0) {
      usage_.completion_tokens = completion;
      usage_reported_ = true;
    }
  }

  std::string model = StringField(event, "model");
  if (!model.empty()) {
    usage_.model = model;
  }
}

} // namespace enginectl
