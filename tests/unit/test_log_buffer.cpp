#include <catch2/catch.hpp>

#include "server/logging/log_buffer.h"

using namespace enginectl;

TEST_CASE("LogBuffer splits multi-line messages and drops blanks",
          "[log_buffer]") {
  LogBuffer buffer;
  buffer.Add("llama", "first line\n\n   \nsecond line\r\n");
  auto lines = buffer.Snapshot();
  REQUIRE(lines.size() == 2);
  REQUIRE(lines[0].message == "first line");
  REQUIRE(lines[1].message == "second line");
  REQUIRE(lines[0].source == "llama");
  REQUIRE(lines[1].id > lines[0].id);
}

TEST_CASE("LogBuffer collapses consecutive repeats", "[log_buffer]") {
  LogBuffer buffer;
  buffer.Add("llama", "slot busy");
  buffer.Add("llama", "slot busy");
  buffer.Add("llama", "slot busy");
  buffer.Add("system", "slot busy");

  auto lines = buffer.Snapshot();
  REQUIRE(lines.size() == 2);
  REQUIRE(lines[0].count == 3);
  REQUIRE(lines[1].count == 1);
  REQUIRE(lines[1].source == "system");
}

TEST_CASE("LogBuffer drops health and model polling noise", "[log_buffer]") {
  LogBuffer buffer;
  buffer.Add("llama", "srv  log_server_r: request: GET /health 127.0.0.1 200");
  buffer.Add("llama", "request: get /models 127.0.0.1 200");
  buffer.Add("llama", "request: GET /health 127.0.0.1 503");
  auto lines = buffer.Snapshot();
  REQUIRE(lines.size() == 1);
  REQUIRE(lines[0].message.find("503") != std::string::npos);
}

TEST_CASE("LogBuffer custom filters accept regex and plain text",
          "[log_buffer]") {
  LogBuffer buffer;
  // "[unclosed" is not a valid regex and is matched as a substring.
  buffer.SetCustomFilters({"^prompt eval", "[unclosed"});
  REQUIRE(buffer.CustomFilters().size() == 2);

  buffer.Add("llama", "prompt eval time = 12 ms");
  buffer.Add("llama", "token [unclosed bracket");
  buffer.Add("llama", "kept");
  auto lines = buffer.Snapshot();
  REQUIRE(lines.size() == 1);
  REQUIRE(lines[0].message == "kept");

  buffer.SetCustomFilters({});
  buffer.Add("llama", "prompt eval time = 13 ms");
  REQUIRE(buffer.Size() == 2);
}

TEST_CASE("LogBuffer is bounded and snapshots the newest lines",
          "[log_buffer]") {
  LogBuffer buffer(3);
  for (int i = 0; i < 5; ++i) {
    buffer.Add("llama", "line " + std::to_string(i));
  }
  REQUIRE(buffer.Size() == 3);
  auto all = buffer.Snapshot();
  REQUIRE(all.front().message == "line 2");
  auto last = buffer.Snapshot(1);
  REQUIRE(last.size() == 1);
  REQUIRE(last[0].message == "line 4");

  buffer.Clear();
  REQUIRE(buffer.Size() == 0);
}

TEST_CASE("LogLine serialises to JSON", "[log_buffer]") {
  LogBuffer buffer;
  buffer.Add("manager", "hello");
  auto j = ToJson(buffer.Snapshot().at(0));
  REQUIRE(j["source"] == "manager");
  REQUIRE(j["message"] == "hello");
  REQUIRE(j["count"] == 1);
  REQUIRE(j["timestamp"].get<std::string>().back() == 'Z');
}
