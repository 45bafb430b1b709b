#pragma once

#include "engine/engine_process.h"

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace enginectl {

class EngineClient;
class LogBuffer;

// Runs the engine as `bash <script>` in its own process group. Output is
// forwarded line by line to the LogBuffer under the "llama" source.
class ScriptEngineProcess : public EngineProcess {
public:
  struct Options {
    std::chrono::milliseconds stop_timeout{10000};
    std::chrono::milliseconds kill_wait{1000};
    // Orphan sweep after every stop: `pkill -9 -f <process_name>` (inside the
    // container too when container_command is set) and
    // `fuser -k <port>/tcp`.
    bool sweep_orphans{true};
    std::string process_name{"llama-server"};
    int port{8080};
    // Prefix that runs a command inside the engine's container, e.g.
    // {"distrobox", "enter", "llama", "--"}.
    std::vector<std::string> container_command;
    std::chrono::milliseconds sweep_timeout{5000};
  };

  ScriptEngineProcess(Options options, EngineClient *client,
                      LogBuffer *log_buffer);
  ~ScriptEngineProcess() override;
  ScriptEngineProcess(const ScriptEngineProcess &) = delete;
  ScriptEngineProcess &operator=(const ScriptEngineProcess &) = delete;

  bool Start(const LaunchParams &params) override;
  void Stop() override;
  bool IsRunning() const override;
  bool IsHealthy() override;

  // Invoked from the monitor thread with the raw wait status.
  void SetExitCallback(std::function<void(int)> callback);

private:
  void MonitorLoop(pid_t pid, int out_fd);
  void EmitOutput(std::string *pending, const char *data, std::size_t length,
                  bool flush);
  void SweepOrphans();
  void JoinMonitor();

  Options options_;
  EngineClient *client_;
  LogBuffer *log_buffer_;

  mutable std::mutex mutex_;
  std::condition_variable exited_cv_;
  pid_t pid_{-1};
  bool running_{false};
  std::thread monitor_;
  std::function<void(int)> exit_callback_;
};

} // namespace enginectl
