#include "server/logging/conversation_log.h"

#include "server/logging/logger.h"

#include <openssl/sha.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

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

} // namespace

json ToJson(const ConversationRecord &record) {
  json j;
  j["id"] = record.id;
  j["timestamp"] = record.timestamp;
  j["endpoint"] = record.endpoint;
  j["model"] = record.model;
  j["stream"] = record.stream;
  j["status"] = record.status;
  j["duration"] = record.duration_ms;
  j["promptTokens"] = record.prompt_tokens;
  j["completionTokens"] = record.completion_tokens;
  j["tokensPerSecond"] = record.tokens_per_second;
  j["messages"] = record.messages;
  j["prompt"] = record.prompt.empty() ? json() : json(record.prompt);
  j["response"] = record.response;
  j["error"] = record.error.empty() ? json() : json(record.error);
  if (!record.request_body.is_null()) {
    j["requestBody"] = record.request_body;
  }
  return j;
}

ConversationLog::ConversationLog(const std::string &path, bool content_mode,
                                 std::size_t capacity)
    : capacity_(capacity > 0 ? capacity : kDefaultCapacity),
      content_mode_(content_mode) {
  if (!path.empty()) {
    stream_.open(path, std::ios::app);
    if (!stream_.is_open()) {
      log::Warn("conversation_log", "cannot open conversation log file",
                "path=" + path);
    }
  }
}

std::string ConversationLog::HashContent(const std::string &content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(content.data()),
         content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

std::string ConversationLog::Record(ConversationRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  record.timestamp = NowIso8601();
  record.id = HashContent(record.timestamp + "#" + std::to_string(++sequence_) +
                          "#" + record.endpoint)
                  .substr(0, 16);

  if (stream_.is_open()) {
    json line = ToJson(record);
    if (!content_mode_) {
      std::string prompt_text =
          record.messages.is_null() ? record.prompt : record.messages.dump();
      line.erase("messages");
      line.erase("prompt");
      line.erase("response");
      line.erase("requestBody");
      line["prompt_sha256"] = HashContent(prompt_text);
      line["response_sha256"] = HashContent(record.response);
    }
    stream_ << line.dump(-1, ' ', false, json::error_handler_t::replace)
            << "\n";
    stream_.flush();
  }

  std::string id = record.id;
  records_.push_back(std::move(record));
  if (records_.size() > capacity_) {
    records_.pop_front();
  }
  return id;
}

std::vector<ConversationRecord> ConversationLog::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<ConversationRecord>(records_.begin(), records_.end());
}

std::optional<ConversationRecord>
ConversationLog::Find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &record : records_) {
    if (record.id == id) {
      return record;
    }
  }
  return std::nullopt;
}

std::size_t ConversationLog::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

void ConversationLog::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
}

} // namespace enginectl
