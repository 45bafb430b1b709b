#pragma once

#include "engine/engine_client.h"
#include "engine/engine_process.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace enginectl {
namespace testing {

// Unique scratch directory removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string &tag) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("enginectl-" + tag + "-" + std::to_string(::getpid()) + "-" +
             std::to_string(counter++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &Path() const { return path_; }
  std::string Str() const { return path_.string(); }

  // Creates `relative` (and its parents) with `content`.
  std::string Touch(const std::string &relative,
                    const std::string &content = "gguf") const {
    auto full = path_ / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full);
    out << content;
    return full.string();
  }

private:
  std::filesystem::path path_;
};

// Records launches; health and start results are scripted.
class FakeEngineProcess : public EngineProcess {
public:
  bool Start(const LaunchParams &params) override {
    std::lock_guard<std::mutex> lock(mutex_);
    launches.push_back(params);
    if (start_delay.count() > 0) {
      std::this_thread::sleep_for(start_delay);
    }
    if (start_throws) {
      throw std::runtime_error("spawn: Resource temporarily unavailable");
    }
    running_ = start_ok.load();
    return start_ok.load();
  }
  void Stop() override {
    ++stops;
    running_ = false;
  }
  bool IsRunning() const override { return running_; }
  bool IsHealthy() override { return running_ && healthy; }

  std::size_t LaunchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return launches.size();
  }
  LaunchParams LastLaunch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return launches.back();
  }

  std::vector<LaunchParams> launches;
  std::atomic<int> stops{0};
  std::atomic<bool> start_ok{true};
  std::atomic<bool> start_throws{false};
  std::atomic<bool> healthy{true};
  std::chrono::milliseconds start_delay{0};

private:
  mutable std::mutex mutex_;
  std::atomic<bool> running_{false};
};

class FakeResponseStream : public EngineResponseStream {
public:
  FakeResponseStream(int status, std::string content_type,
                     std::vector<std::string> chunks)
      : status_(status), content_type_(std::move(content_type)),
        chunks_(chunks.begin(), chunks.end()) {}

  int Status() const override { return status_; }
  std::string ContentType() const override { return content_type_; }
  bool Next(std::string *chunk) override {
    if (chunks_.empty()) {
      return false;
    }
    *chunk = chunks_.front();
    chunks_.pop_front();
    return true;
  }

private:
  int status_;
  std::string content_type_;
  std::deque<std::string> chunks_;
};

// Replays queued responses in order; the last one repeats once the queue is
// down to a single entry. A queued status of 0 raises ConnectionError.
class FakeEngineClient : public EngineClient {
public:
  struct Call {
    std::string path;
    std::string body;
  };

  EngineHealth Health() override { return health; }
  std::vector<EngineModel> ListModels() override { return models; }
  bool UnloadModel(const std::string &model_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    unloaded.push_back(model_id);
    return true;
  }

  HttpResponse Forward(const std::string &path,
                       const std::string &body) override {
    HttpResponse response = NextResponse(path, body);
    if (response.status == 0) {
      throw ConnectionError("connect: Connection refused");
    }
    return response;
  }

  std::unique_ptr<EngineResponseStream>
  ForwardStream(const std::string &path, const std::string &body) override {
    HttpResponse response = NextResponse(path, body);
    if (response.status == 0) {
      throw ConnectionError("connect: Connection refused");
    }
    std::vector<std::string> chunks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!stream_chunks.empty() && response.status < 400) {
        chunks = stream_chunks;
      } else {
        chunks.push_back(response.body);
      }
    }
    return std::make_unique<FakeResponseStream>(
        response.status, response.status < 400 ? "text/event-stream"
                                               : "application/json",
        chunks);
  }

  void Queue(int status, std::string body) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses.push_back({status, std::move(body), {}});
  }

  std::vector<Call> Calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls;
  }

  EngineHealth health{true, 200, "ok"};
  std::vector<EngineModel> models;
  std::vector<std::string> unloaded;
  std::deque<HttpResponse> responses;
  std::vector<std::string> stream_chunks;

private:
  HttpResponse NextResponse(const std::string &path, const std::string &body) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls.push_back({path, body});
    if (responses.empty()) {
      return {200, "{}", {}};
    }
    HttpResponse response = responses.front();
    if (responses.size() > 1) {
      responses.pop_front();
    }
    return response;
  }

  mutable std::mutex mutex_;
  std::vector<Call> calls;
};

} // namespace testing
} // namespace enginectl
