#pragma once

#include <map>
#include <string>

namespace enginectl {

// How to launch the engine: `bash <script>` with extra environment.
struct LaunchParams {
  std::string script;
  std::map<std::string, std::string> env;
  std::string working_dir;
  std::string description; // for logs: "router", "preset qwen3", ...
};

// Lifecycle of the single engine child process.
class EngineProcess {
public:
  virtual ~EngineProcess() = default;

  // Spawns the engine. Returns false when the process could not be created.
  virtual bool Start(const LaunchParams &params) = 0;
  // Graceful stop with forced fallback. Safe to call when nothing runs.
  virtual void Stop() = 0;
  virtual bool IsRunning() const = 0;
  // True when the engine answers its health probe as ready.
  virtual bool IsHealthy() = 0;
};

} // namespace enginectl
