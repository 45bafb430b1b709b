#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace enginectl {

struct LogLine {
  uint64_t id{0};
  std::string timestamp; // ISO-8601, updated when a repeat is collapsed.
  std::string source;
  std::string message;
  int count{1};
};

nlohmann::json ToJson(const LogLine &line);

// Bounded, in-memory sink for engine and control-plane output. Multi-line
// messages are split, blank lines and noise patterns dropped, and
// consecutive identical lines from the same source collapse into one entry
// with a repeat count.
class LogBuffer {
public:
  static constexpr std::size_t kDefaultCapacity = 1000;

  explicit LogBuffer(std::size_t capacity = kDefaultCapacity);

  void Add(const std::string &source, const std::string &message);

  // Replaces the custom filters. The default health/model polling filters
  // always apply.
  void SetCustomFilters(const std::vector<std::string> &patterns);
  std::vector<std::string> CustomFilters() const;
  static const std::vector<std::string> &DefaultFilters();

  // Most recent `limit` lines (all when 0), oldest first.
  std::vector<LogLine> Snapshot(std::size_t limit = 0) const;
  std::size_t Size() const;
  void Clear();

private:
  struct Filter {
    std::string pattern;
    std::optional<std::regex> regex; // empty when the pattern is not a regex
  };

  static Filter CompileFilter(const std::string &pattern);
  bool IsFiltered(const std::string &line) const;

  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<LogLine> lines_;
  std::vector<Filter> default_filters_;
  std::vector<Filter> custom_filters_;
  uint64_t next_id_{1};
};

} // namespace enginectl
