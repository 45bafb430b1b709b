#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace enginectl {

// One proxied inference request, as seen by the client.
struct ConversationRecord {
  std::string id;        // assigned by ConversationLog::Record
  std::string timestamp; // assigned by ConversationLog::Record
  std::string endpoint;
  std::string model;
  bool stream{false};
  int status{0};
  int64_t duration_ms{0};
  int prompt_tokens{0};
  int completion_tokens{0};
  double tokens_per_second{0.0};
  nlohmann::json messages; // null for prompt-style endpoints
  std::string prompt;
  std::string response;
  std::string error;
  // Original client body. Kept only for failed requests so they can be
  // replayed.
  nlohmann::json request_body;
};

nlohmann::json ToJson(const ConversationRecord &record);

class ConversationLog {
public:
  static constexpr std::size_t kDefaultCapacity = 50;

  ConversationLog() = default;

  // path: optional JSONL file. content_mode: when false the file gets SHA-256
  // digests of prompt and response instead of the raw text. The in-memory
  // ring always keeps the full record.
  explicit ConversationLog(const std::string &path, bool content_mode = false,
                           std::size_t capacity = kDefaultCapacity);

  bool FileEnabled() const { return stream_.is_open(); }

  // Stores the record and returns the id it was given.
  std::string Record(ConversationRecord record);

  std::vector<ConversationRecord> Snapshot() const;
  std::optional<ConversationRecord> Find(const std::string &id) const;
  std::size_t Size() const;
  void Clear();

  // SHA-256 hex digest (64 chars).
  static std::string HashContent(const std::string &content);

private:
  std::size_t capacity_{kDefaultCapacity};
  bool content_mode_{false};
  std::ofstream stream_;
  mutable std::mutex mutex_;
  std::deque<ConversationRecord> records_;
  uint64_t sequence_{0};
};

} // namespace enginectl
