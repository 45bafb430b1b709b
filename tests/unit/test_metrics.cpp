#include <catch2/catch.hpp>

#include "server/metrics/metrics.h"

#include <string>

namespace {

bool Contains(const std::string &text, const std::string &needle) {
  return text.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("MetricsRegistry records request outcomes and tokens", "[metrics]") {
  enginectl::MetricsRegistry registry;
  registry.RecordRequest("chat/completions", true, 10, 20);
  registry.RecordRequest("chat/completions", true, 5, 15);
  registry.RecordRequest("embeddings", false, 0, 0);

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "enginectl_requests_total 2"));
  REQUIRE(Contains(output, "enginectl_errors_total 1"));
  REQUIRE(Contains(output, "enginectl_prompt_tokens_total 15"));
  REQUIRE(Contains(output, "enginectl_completion_tokens_total 35"));
  REQUIRE(Contains(output, "enginectl_endpoint_requests_total{endpoint=\""
                           "chat/completions\",outcome=\"ok\"} 2"));
  REQUIRE(Contains(output, "enginectl_endpoint_requests_total{endpoint=\""
                           "embeddings\",outcome=\"error\"} 1"));
}

TEST_CASE("MetricsRegistry counts retries by cause", "[metrics]") {
  enginectl::MetricsRegistry registry;
  registry.RecordRetry(enginectl::RetryKind::kConnection);
  registry.RecordRetry(enginectl::RetryKind::kConnection);
  registry.RecordRetry(enginectl::RetryKind::kEviction);
  registry.RecordRetry(enginectl::RetryKind::kSanitize);
  registry.RecordEviction(3);
  registry.RecordEviction(0);

  auto snap = registry.GetSnapshot();
  REQUIRE(snap.connection_retries == 2);
  REQUIRE(snap.eviction_retries == 1);
  REQUIRE(snap.sanitize_retries == 1);
  REQUIRE(snap.evicted_models == 3);

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "enginectl_retries_total{kind=\"connection\"} 2"));
  REQUIRE(Contains(output, "enginectl_evicted_models_total 3"));
}

TEST_CASE("MetricsRegistry tracks restarts and engine gauges", "[metrics]") {
  enginectl::MetricsRegistry registry;
  registry.RecordRestart(true, 1200.0);
  registry.RecordRestart(false, 60000.0);
  registry.SetEngineUp(true);
  registry.SetSingleMode(true);

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "enginectl_restarts_total{result=\"success\"} 1"));
  REQUIRE(Contains(output, "enginectl_restarts_total{result=\"failure\"} 1"));
  REQUIRE(Contains(output, "enginectl_engine_up 1"));
  REQUIRE(Contains(output, "enginectl_single_mode 1"));
  REQUIRE(Contains(output, "enginectl_restart_duration_ms_count 2"));
}

TEST_CASE("MetricsRegistry latency histogram is cumulative", "[metrics]") {
  enginectl::MetricsRegistry registry;
  registry.RecordLatency(40.0);
  registry.RecordLatency(300.0);
  registry.RecordLatency(500000.0);

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "enginectl_request_duration_ms_bucket{le=\"50\"} 1"));
  REQUIRE(Contains(output, "enginectl_request_duration_ms_bucket{le=\"1000\"} 2"));
  REQUIRE(Contains(output, "enginectl_request_duration_ms_bucket{le=\"+Inf\"} 3"));
  REQUIRE(Contains(output, "enginectl_request_duration_ms_count 3"));
}

TEST_CASE("MetricsRegistry active connection gauge", "[metrics]") {
  enginectl::MetricsRegistry registry;
  registry.IncrementConnections();
  registry.IncrementConnections();
  registry.DecrementConnections();
  REQUIRE(Contains(registry.RenderPrometheus(), "enginectl_active_connections 1"));
}
