#include "server/logging/log_buffer.h"

#include "server/logging/logger.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace enginectl {

namespace {

std::string NowIso8601() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return out;
}

bool IsBlank(const std::string &line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace

nlohmann::json ToJson(const LogLine &line) {
  return {{"id", line.id},
          {"timestamp", line.timestamp},
          {"source", line.source},
          {"message", line.message},
          {"count", line.count}};
}

LogBuffer::LogBuffer(std::size_t capacity)
    : capacity_(capacity > 0 ? capacity : kDefaultCapacity) {
  for (const auto &pattern : DefaultFilters()) {
    default_filters_.push_back(CompileFilter(pattern));
  }
}

const std::vector<std::string> &LogBuffer::DefaultFilters() {
  static const std::vector<std::string> kFilters{"GET /health.*200",
                                                 "GET /models.*200"};
  return kFilters;
}

LogBuffer::Filter LogBuffer::CompileFilter(const std::string &pattern) {
  Filter filter;
  filter.pattern = pattern;
  try {
    filter.regex.emplace(pattern, std::regex::ECMAScript | std::regex::icase);
  } catch (const std::regex_error &) {
    // Falls back to a plain substring match.
    filter.regex.reset();
  }
  return filter;
}

void LogBuffer::SetCustomFilters(const std::vector<std::string> &patterns) {
  std::vector<Filter> compiled;
  compiled.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    if (!pattern.empty()) {
      compiled.push_back(CompileFilter(pattern));
    }
  }
  std::lock_guard<std::mutex> lock(mutex_);
  custom_filters_ = std::move(compiled);
}

std::vector<std::string> LogBuffer::CustomFilters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto &filter : custom_filters_) {
    out.push_back(filter.pattern);
  }
  return out;
}

bool LogBuffer::IsFiltered(const std::string &line) const {
  auto matches = [&](const Filter &filter) {
    if (filter.regex) {
      return std::regex_search(line, *filter.regex);
    }
    return line.find(filter.pattern) != std::string::npos;
  };
  for (const auto &filter : default_filters_) {
    if (matches(filter)) {
      return true;
    }
  }
  for (const auto &filter : custom_filters_) {
    if (matches(filter)) {
      return true;
    }
  }
  return false;
}

void LogBuffer::Add(const std::string &source, const std::string &message) {
  std::istringstream stream(message);
  std::string line;
  std::lock_guard<std::mutex> lock(mutex_);
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (IsBlank(line) || IsFiltered(line)) {
      continue;
    }
    auto timestamp = NowIso8601();
    if (!lines_.empty() && lines_.back().source == source &&
        lines_.back().message == line) {
      lines_.back().count += 1;
      lines_.back().timestamp = timestamp;
      continue;
    }
    LogLine entry;
    entry.id = next_id_++;
    entry.timestamp = std::move(timestamp);
    entry.source = source;
    entry.message = line;
    lines_.push_back(std::move(entry));
    if (lines_.size() > capacity_) {
      lines_.pop_front();
    }
    log::Debug(source, line);
  }
}

std::vector<LogLine> LogBuffer::Snapshot(std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t start = 0;
  if (limit > 0 && lines_.size() > limit) {
    start = lines_.size() - limit;
  }
  return std::vector<LogLine>(lines_.begin() + static_cast<std::ptrdiff_t>(start),
                              lines_.end());
}

std::size_t LogBuffer::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_.size();
}

void LogBuffer::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  lines_.clear();
}

} // namespace enginectl
