#include <catch2/catch.hpp>

#include "proxy/request_rewriter.h"

#include <nlohmann/json.hpp>

using namespace enginectl;
using json = nlohmann::json;

TEST_CASE("ApplyPresetDefaults fills only unset sampling fields",
          "[request_rewriter]") {
  Preset preset;
  preset.config.temp = 1.0;
  preset.config.top_p = 0.95;
  preset.config.top_k = 40;
  preset.config.min_p = 0.05;

  json body = {{"model", "qwen3"}, {"temperature", 0.2}, {"top_k", nullptr}};
  ApplyPresetDefaults(preset, &body);
  REQUIRE(body["temperature"] == 0.2);
  REQUIRE(body["top_p"] == 0.95);
  REQUIRE(body["top_k"] == 40);
  REQUIRE(body["min_p"] == 0.05);
  REQUIRE_FALSE(body.contains("chat_template_kwargs"));
}

TEST_CASE("ApplyPresetDefaults merges template kwargs under the request's",
          "[request_rewriter]") {
  Preset preset;
  preset.config.chat_template_kwargs =
      R"({"reasoning_effort":"high","enable_thinking":true})";
  json body = {{"chat_template_kwargs", {{"enable_thinking", false}}}};
  ApplyPresetDefaults(preset, &body);
  REQUIRE(body["chat_template_kwargs"]["reasoning_effort"] == "high");
  REQUIRE(body["chat_template_kwargs"]["enable_thinking"] == false);
}

TEST_CASE("GlobMatch supports star and question mark", "[request_rewriter]") {
  REQUIRE(GlobMatch("gpt-oss*", "gpt-oss-120b"));
  REQUIRE(GlobMatch("*coder*", "qwen3-coder-30b"));
  REQUIRE(GlobMatch("qwen?", "qwen3"));
  REQUIRE(GlobMatch("*", ""));
  REQUIRE_FALSE(GlobMatch("gpt-oss*", "my-gpt-oss"));
  REQUIRE_FALSE(GlobMatch("qwen?", "qwen"));
  REQUIRE_FALSE(GlobMatch("gpt.oss", "gpt-oss"));
}

TEST_CASE("InjectReasoningEffort moves a top-level effort into kwargs",
          "[request_rewriter]") {
  Settings settings;
  settings.default_reasoning_effort = "high";
  json body = {{"model", "gpt-oss-120b"}, {"reasoning_effort", "medium"}};
  REQUIRE(InjectReasoningEffort(settings, &body) == "medium");
  REQUIRE_FALSE(body.contains("reasoning_effort"));
  REQUIRE(body["chat_template_kwargs"]["reasoning_effort"] == "medium");
}

TEST_CASE("InjectReasoningEffort keeps an explicit kwargs effort",
          "[request_rewriter]") {
  Settings settings;
  settings.default_reasoning_effort = "high";
  json body = {{"model", "x"},
               {"chat_template_kwargs", {{"reasoning_effort", "low"}}}};
  REQUIRE(InjectReasoningEffort(settings, &body) == "low");
  REQUIRE(body["chat_template_kwargs"]["reasoning_effort"] == "low");
}

TEST_CASE("InjectReasoningEffort picks the first matching glob",
          "[request_rewriter]") {
  Settings settings;
  settings.default_reasoning_effort = "high";
  settings.model_reasoning_effort = {{"gpt-oss*", "low"}, {"gpt*", "medium"}};

  json gpt = {{"model", "gpt-oss-120b"}};
  REQUIRE(InjectReasoningEffort(settings, &gpt) == "low");
  REQUIRE(gpt["chat_template_kwargs"]["reasoning_effort"] == "low");

  json other = {{"model", "qwen3"}};
  REQUIRE(InjectReasoningEffort(settings, &other) == "high");
  REQUIRE(other["chat_template_kwargs"]["reasoning_effort"] == "high");
}

TEST_CASE("InjectReasoningEffort leaves the body alone without a match",
          "[request_rewriter]") {
  Settings settings;
  json body = {{"model", "qwen3"}};
  REQUIRE(InjectReasoningEffort(settings, &body).empty());
  REQUIRE_FALSE(body.contains("chat_template_kwargs"));
}

TEST_CASE("SanitizeMessages folds content into thinking", "[request_rewriter]") {
  json messages = json::array(
      {{{"role", "user"}, {"content", "hi"}},
       {{"role", "assistant"},
        {"content", "x"},
        {"thinking", "y"},
        {"tool_calls", json::array()}},
       {{"role", "assistant"}, {"content", "plain"}, {"thinking", "t"}}});
  REQUIRE(SanitizeMessages(&messages) == 1);

  const auto &fixed = messages[1];
  REQUIRE_FALSE(fixed.contains("content"));
  REQUIRE(fixed["thinking"] == "y\nx");
  REQUIRE(messages[2]["content"] == "plain");
  REQUIRE(messages[0]["content"] == "hi");
}

TEST_CASE("SanitizeMessages handles empty content and non-arrays",
          "[request_rewriter]") {
  json messages = json::array({{{"role", "assistant"},
                                {"content", nullptr},
                                {"thinking", "only"},
                                {"tool_calls", json::array()}}});
  REQUIRE(SanitizeMessages(&messages) == 1);
  REQUIRE(messages[0]["thinking"] == "only");

  json not_array = "text";
  REQUIRE(SanitizeMessages(&not_array) == 0);
}

TEST_CASE("SanitizeMessages ignores null tool calls", "[request_rewriter]") {
  json messages = json::array({{{"role", "assistant"},
                                {"content", "x"},
                                {"thinking", "y"},
                                {"tool_calls", nullptr}}});
  REQUIRE(SanitizeMessages(&messages) == 0);
  REQUIRE(messages[0]["content"] == "x");
  REQUIRE(messages[0]["thinking"] == "y");
}
