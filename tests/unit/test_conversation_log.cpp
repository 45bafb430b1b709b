#include <catch2/catch.hpp>

#include "server/logging/conversation_log.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <string>

using namespace enginectl;
using json = nlohmann::json;

namespace {

ConversationRecord MakeRecord(const std::string &endpoint) {
  ConversationRecord record;
  record.endpoint = endpoint;
  record.model = "qwen3";
  record.status = 200;
  record.messages = json::array({{{"role", "user"}, {"content", "hi"}}});
  record.response = "hello there";
  return record;
}

std::string TempPath(const std::string &name) {
  return (std::filesystem::temp_directory_path() /
          (name + "-" + std::to_string(::getpid()) + ".jsonl"))
      .string();
}

} // namespace

TEST_CASE("ConversationLog assigns ids and keeps a bounded ring",
          "[conversation_log]") {
  ConversationLog log("", false, 2);
  auto first = log.Record(MakeRecord("chat/completions"));
  auto second = log.Record(MakeRecord("completions"));
  auto third = log.Record(MakeRecord("embeddings"));

  REQUIRE(first.size() == 16);
  REQUIRE(first != second);
  REQUIRE(log.Size() == 2);
  REQUIRE_FALSE(log.Find(first).has_value());

  auto found = log.Find(third);
  REQUIRE(found.has_value());
  REQUIRE(found->endpoint == "embeddings");
  REQUIRE_FALSE(found->timestamp.empty());

  auto snapshot = log.Snapshot();
  REQUIRE(snapshot.front().id == second);

  log.Clear();
  REQUIRE(log.Size() == 0);
}

TEST_CASE("ConversationLog hashes content in the JSONL file by default",
          "[conversation_log]") {
  auto path = TempPath("enginectl-conv-hash");
  std::remove(path.c_str());
  {
    ConversationLog log(path);
    REQUIRE(log.FileEnabled());
    log.Record(MakeRecord("chat/completions"));
    // The in-memory ring keeps the full text.
    REQUIRE(log.Snapshot().at(0).response == "hello there");
  }
  std::ifstream in(path);
  std::string line;
  REQUIRE(std::getline(in, line));
  auto j = json::parse(line);
  REQUIRE_FALSE(j.contains("response"));
  REQUIRE_FALSE(j.contains("messages"));
  REQUIRE(j["response_sha256"] == ConversationLog::HashContent("hello there"));
  REQUIRE(j["prompt_sha256"].get<std::string>().size() == 64);
  std::remove(path.c_str());
}

TEST_CASE("ConversationLog content mode writes raw text", "[conversation_log]") {
  auto path = TempPath("enginectl-conv-raw");
  std::remove(path.c_str());
  {
    ConversationLog log(path, true);
    log.Record(MakeRecord("chat/completions"));
  }
  std::ifstream in(path);
  std::string line;
  REQUIRE(std::getline(in, line));
  auto j = json::parse(line);
  REQUIRE(j["response"] == "hello there");
  REQUIRE(j["messages"][0]["content"] == "hi");
  std::remove(path.c_str());
}

TEST_CASE("HashContent is SHA-256 hex", "[conversation_log]") {
  REQUIRE(ConversationLog::HashContent("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
