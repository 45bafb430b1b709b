#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace enginectl {

namespace {
MetricsRegistry g_metrics;

void RenderHistogram(std::ostringstream &out, const std::string &name,
                     const std::string &help, const LatencyHistogram &hist) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << name << "_bucket{le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} " << hist.counts[i].load()
        << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} "
      << hist.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << name << "_sum " << hist.sum_ms.load() << "\n";
  out << name << "_count " << hist.total.load() << "\n";
}

void RenderCounter(std::ostringstream &out, const std::string &name,
                   const std::string &help, uint64_t value) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " counter\n";
  out << name << " " << value << "\n";
}
} // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)),
                   std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRequest(const std::string &endpoint, bool ok,
                                    int prompt_tokens, int completion_tokens) {
  if (ok) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
  } else {
    total_errors_.fetch_add(1, std::memory_order_relaxed);
  }
  total_prompt_tokens_.fetch_add(
      static_cast<uint64_t>(std::max(0, prompt_tokens)),
      std::memory_order_relaxed);
  total_completion_tokens_.fetch_add(
      static_cast<uint64_t>(std::max(0, completion_tokens)),
      std::memory_order_relaxed);
  std::lock_guard<std::mutex> lock(endpoint_mutex_);
  auto &stats = endpoint_stats_[endpoint];
  if (ok) {
    stats.ok++;
  } else {
    stats.errors++;
  }
}

void MetricsRegistry::RecordRetry(RetryKind kind) {
  switch (kind) {
  case RetryKind::kConnection:
    connection_retries_.fetch_add(1, std::memory_order_relaxed);
    break;
  case RetryKind::kEviction:
    eviction_retries_.fetch_add(1, std::memory_order_relaxed);
    break;
  case RetryKind::kSanitize:
    sanitize_retries_.fetch_add(1, std::memory_order_relaxed);
    break;
  }
}

void MetricsRegistry::RecordRestart(bool success, double duration_ms) {
  if (success) {
    restarts_.fetch_add(1, std::memory_order_relaxed);
  } else {
    restart_failures_.fetch_add(1, std::memory_order_relaxed);
  }
  restart_latency_.Record(duration_ms);
}

void MetricsRegistry::RecordEviction(int unloaded_models) {
  if (unloaded_models > 0) {
    evicted_models_.fetch_add(static_cast<uint64_t>(unloaded_models),
                              std::memory_order_relaxed);
  }
}

void MetricsRegistry::RecordLatency(double request_ms) {
  request_latency_.Record(request_ms);
}

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetEngineUp(bool up) { engine_up_.store(up ? 1 : 0); }

void MetricsRegistry::SetSingleMode(bool single) {
  single_mode_.store(single ? 1 : 0);
}

MetricsRegistry::Snapshot MetricsRegistry::GetSnapshot() const {
  Snapshot s;
  s.requests = total_requests_.load();
  s.errors = total_errors_.load();
  s.prompt_tokens = total_prompt_tokens_.load();
  s.completion_tokens = total_completion_tokens_.load();
  s.restarts = restarts_.load();
  s.restart_failures = restart_failures_.load();
  s.connection_retries = connection_retries_.load();
  s.eviction_retries = eviction_retries_.load();
  s.sanitize_retries = sanitize_retries_.load();
  s.evicted_models = evicted_models_.load();
  return s;
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;

  RenderCounter(out, "enginectl_requests_total",
                "Proxied inference requests that completed successfully",
                total_requests_.load());
  RenderCounter(out, "enginectl_errors_total",
                "Proxied inference requests that ended in an error",
                total_errors_.load());
  RenderCounter(out, "enginectl_prompt_tokens_total",
                "Prompt tokens reported by the engine",
                total_prompt_tokens_.load());
  RenderCounter(out, "enginectl_completion_tokens_total",
                "Completion tokens reported or counted from streams",
                total_completion_tokens_.load());

  {
    std::lock_guard<std::mutex> lock(endpoint_mutex_);
    out << "# HELP enginectl_endpoint_requests_total Requests per proxy "
           "endpoint and outcome\n";
    out << "# TYPE enginectl_endpoint_requests_total counter\n";
    for (const auto &[endpoint, stats] : endpoint_stats_) {
      out << "enginectl_endpoint_requests_total{endpoint=\"" << endpoint
          << "\",outcome=\"ok\"} " << stats.ok << "\n";
      out << "enginectl_endpoint_requests_total{endpoint=\"" << endpoint
          << "\",outcome=\"error\"} " << stats.errors << "\n";
    }
  }

  out << "# HELP enginectl_restarts_total Engine restart sequences by result\n";
  out << "# TYPE enginectl_restarts_total counter\n";
  out << "enginectl_restarts_total{result=\"success\"} " << restarts_.load()
      << "\n";
  out << "enginectl_restarts_total{result=\"failure\"} "
      << restart_failures_.load() << "\n";

  out << "# HELP enginectl_retries_total Upstream retries by cause\n";
  out << "# TYPE enginectl_retries_total counter\n";
  out << "enginectl_retries_total{kind=\"connection\"} "
      << connection_retries_.load() << "\n";
  out << "enginectl_retries_total{kind=\"eviction\"} "
      << eviction_retries_.load() << "\n";
  out << "enginectl_retries_total{kind=\"sanitize\"} "
      << sanitize_retries_.load() << "\n";

  RenderCounter(out, "enginectl_evicted_models_total",
                "Models unloaded to recover from load failures",
                evicted_models_.load());

  out << "# HELP enginectl_active_connections Open client connections\n";
  out << "# TYPE enginectl_active_connections gauge\n";
  out << "enginectl_active_connections " << active_connections_.load() << "\n";
  out << "# HELP enginectl_engine_up Engine process alive (1) or not (0)\n";
  out << "# TYPE enginectl_engine_up gauge\n";
  out << "enginectl_engine_up " << engine_up_.load() << "\n";
  out << "# HELP enginectl_single_mode Single-preset mode (1) or router (0)\n";
  out << "# TYPE enginectl_single_mode gauge\n";
  out << "enginectl_single_mode " << single_mode_.load() << "\n";

  RenderHistogram(out, "enginectl_request_duration_ms",
                  "Client-visible request latency in milliseconds",
                  request_latency_);
  RenderHistogram(out, "enginectl_restart_duration_ms",
                  "Engine restart sequence duration in milliseconds",
                  restart_latency_);
  return out.str();
}

MetricsRegistry &GlobalMetrics() { return g_metrics; }

} // namespace enginectl
