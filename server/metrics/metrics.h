#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace enginectl {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Proxied inference requests run from milliseconds (embeddings) to minutes
  // (long generations, cold restarts).
  static constexpr std::array<double, 9> kBuckets{
      50.0, 250.0, 1000.0, 2500.0, 5000.0, 10000.0, 30000.0, 60000.0, 120000.0};
  std::array<std::atomic<uint64_t>, 10> counts{}; // 9 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

enum class RetryKind { kConnection, kEviction, kSanitize };

class MetricsRegistry {
public:
  // Per-endpoint request outcome plus token totals.
  void RecordRequest(const std::string &endpoint, bool ok, int prompt_tokens,
                     int completion_tokens);
  void RecordRetry(RetryKind kind);
  void RecordRestart(bool success, double duration_ms);
  void RecordEviction(int unloaded_models);

  // Latency recording: full client-visible duration in milliseconds.
  void RecordLatency(double request_ms);

  void IncrementConnections();
  void DecrementConnections();

  // 1 while the engine process is alive, 0 otherwise.
  void SetEngineUp(bool up);
  // 1 in single-preset mode, 0 in router mode.
  void SetSingleMode(bool single);

  struct Snapshot {
    uint64_t requests{0};
    uint64_t errors{0};
    uint64_t prompt_tokens{0};
    uint64_t completion_tokens{0};
    uint64_t restarts{0};
    uint64_t restart_failures{0};
    uint64_t connection_retries{0};
    uint64_t eviction_retries{0};
    uint64_t sanitize_retries{0};
    uint64_t evicted_models{0};
  };
  Snapshot GetSnapshot() const;

  std::string RenderPrometheus() const;

private:
  std::atomic<uint64_t> total_requests_{0};
  std::atomic<uint64_t> total_errors_{0};
  std::atomic<uint64_t> total_prompt_tokens_{0};
  std::atomic<uint64_t> total_completion_tokens_{0};
  std::atomic<uint64_t> restarts_{0};
  std::atomic<uint64_t> restart_failures_{0};
  std::atomic<uint64_t> connection_retries_{0};
  std::atomic<uint64_t> eviction_retries_{0};
  std::atomic<uint64_t> sanitize_retries_{0};
  std::atomic<uint64_t> evicted_models_{0};

  LatencyHistogram request_latency_;
  LatencyHistogram restart_latency_;

  std::atomic<int> active_connections_{0};
  std::atomic<int> engine_up_{0};
  std::atomic<int> single_mode_{0};

  struct EndpointStats {
    uint64_t ok{0};
    uint64_t errors{0};
  };
  mutable std::mutex endpoint_mutex_;
  std::map<std::string, EndpointStats> endpoint_stats_;
};

MetricsRegistry &GlobalMetrics();

} // namespace enginectl
