#include <catch2/catch.hpp>

#include "proxy/stream_accounting.h"

#include <nlohmann/json.hpp>

using namespace enginectl;
using json = nlohmann::json;

TEST_CASE("Endpoint names map both ways", "[stream_accounting]") {
  REQUIRE(EndpointPath(ProxyEndpoint::kChatCompletions) == "/v1/chat/completions");
  REQUIRE(EndpointFromName("messages") == ProxyEndpoint::kMessages);
  REQUIRE_FALSE(EndpointFromName("rerank").has_value());
  REQUIRE(SupportsReasoningEffort(ProxyEndpoint::kResponses));
  REQUIRE_FALSE(SupportsReasoningEffort(ProxyEndpoint::kEmbeddings));
  REQUIRE_FALSE(SupportsReasoningEffort(ProxyEndpoint::kCompletions));
}

TEST_CASE("ExtractUsage reads chat completions", "[stream_accounting]") {
  json response = {
      {"model", "qwen3"},
      {"choices", json::array({{{"message", {{"role", "assistant"}, {"content", "hello"}}}}})},
      {"usage", {{"prompt_tokens", 12}, {"completion_tokens", 3}}}};
  auto usage = ExtractUsage(ProxyEndpoint::kChatCompletions, response);
  REQUIRE(usage.model == "qwen3");
  REQUIRE(usage.text == "hello");
  REQUIRE(usage.prompt_tokens == 12);
  REQUIRE(usage.completion_tokens == 3);
}

TEST_CASE("ExtractUsage reads Anthropic and Responses shapes",
          "[stream_accounting]") {
  json message = {
      {"content", json::array({{{"type", "text"}, {"text", "hi"}}})},
      {"usage", {{"input_tokens", 7}, {"output_tokens", 2}}}};
  auto usage = ExtractUsage(ProxyEndpoint::kMessages, message);
  REQUIRE(usage.text == "hi");
  REQUIRE(usage.prompt_tokens == 7);
  REQUIRE(usage.completion_tokens == 2);

  json response = {
      {"output",
       json::array({{{"type", "message"},
                     {"content", json::array({{{"type", "output_text"}, {"text", "a"}},
                                              {{"type", "output_text"}, {"text", "b"}}})}}})},
      {"usage", {{"input_tokens", 4}, {"output_tokens", 9}}}};
  usage = ExtractUsage(ProxyEndpoint::kResponses, response);
  REQUIRE(usage.text == "ab");
  REQUIRE(usage.completion_tokens == 9);

  REQUIRE(ExtractUsage(ProxyEndpoint::kEmbeddings, json::array()).prompt_tokens == 0);
}

TEST_CASE("StreamAccounting joins lines split across chunks",
          "[stream_accounting]") {
  StreamAccounting accounting(ProxyEndpoint::kChatCompletions, "qwen3");
  accounting.Feed("data: {\"choices\":[{\"delta\":{\"content\":\"Hel\"}}]}\n\ndata: {\"cho");
  accounting.Feed("ices\":[{\"delta\":{\"content\":\"lo\"}}]}\r\n\r\n");
  accounting.Feed(": keep-alive\n\ndata: not-json\n\n");
  REQUIRE(accounting.Usage().text == "Hello");
  REQUIRE(accounting.Usage().completion_tokens == 2);

  accounting.Feed(
      "data: {\"choices\":[],\"usage\":{\"prompt_tokens\":5,\"completion_tokens\":4}}\n\n"
      "data: [DONE]\n\n");
  accounting.Finish();
  REQUIRE(accounting.Usage().prompt_tokens == 5);
  REQUIRE(accounting.Usage().completion_tokens == 4);
  REQUIRE(accounting.Usage().model == "qwen3");
}

TEST_CASE("StreamAccounting handles Anthropic message events",
          "[stream_accounting]") {
  StreamAccounting accounting(ProxyEndpoint::kMessages, "");
  accounting.Feed(
      "event: message_start\n"
      "data: {\"type\":\"message_start\",\"message\":{\"model\":\"gpt-oss\","
      "\"usage\":{\"input_tokens\":11,\"output_tokens\":1}}}\n\n"
      "event: content_block_delta\n"
      "data: {\"type\":\"content_block_delta\",\"delta\":{\"type\":\"text_delta\","
      "\"text\":\"ok\"}}\n\n"
      "event: message_delta\n"
      "data: {\"type\":\"message_delta\",\"usage\":{\"output_tokens\":6}}");
  accounting.Finish();
  REQUIRE(accounting.Usage().model == "gpt-oss");
  REQUIRE(accounting.Usage().text == "ok");
  REQUIRE(accounting.Usage().prompt_tokens == 11);
  REQUIRE(accounting.Usage().completion_tokens == 6);
}

TEST_CASE("StreamAccounting handles Responses deltas", "[stream_accounting]") {
  StreamAccounting accounting(ProxyEndpoint::kResponses, "m");
  accounting.Feed(
      "data: {\"type\":\"response.output_text.delta\",\"delta\":\"a\"}\n"
      "data: {\"type\":\"response.output_text.delta\",\"delta\":\"b\"}\n"
      "data: {\"type\":\"response.completed\",\"response\":{\"usage\":"
      "{\"input_tokens\":3,\"output_tokens\":2}}}\n");
  REQUIRE(accounting.Usage().text == "ab");
  REQUIRE(accounting.Usage().prompt_tokens == 3);
  REQUIRE(accounting.Usage().completion_tokens == 2);
}
