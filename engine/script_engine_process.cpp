#include "engine/script_engine_process.h"

#include "engine/engine_client.h"
#include "server/logging/log_buffer.h"
#include "server/logging/logger.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <map>

extern char **environ;

namespace enginectl {

namespace {

std::string DescribeStatus(int status) {
  if (WIFEXITED(status)) {
    return "code=" + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return "signal=" + std::to_string(WTERMSIG(status));
  }
  return "status=" + std::to_string(status);
}

std::vector<char *> CStringArray(std::vector<std::string> &strings) {
  std::vector<char *> out;
  out.reserve(strings.size() + 1);
  for (auto &s : strings) {
    out.push_back(const_cast<char *>(s.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

// Current environment with `overrides` applied, as KEY=VALUE strings.
std::vector<std::string>
BuildEnvironment(const std::map<std::string, std::string> &overrides) {
  std::map<std::string, std::string> merged;
  for (char **entry = environ; entry && *entry; ++entry) {
    std::string kv(*entry);
    auto eq = kv.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    merged[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  for (const auto &[key, value] : overrides) {
    merged[key] = value;
  }
  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto &[key, value] : merged) {
    out.push_back(key + "=" + value);
  }
  return out;
}

// Runs a helper command with output discarded. Returns its exit code, or -1
// when it could not be started or had to be killed after `timeout`.
int RunCommand(const std::vector<std::string> &args,
               std::chrono::milliseconds timeout) {
  std::vector<std::string> argv_strings = args;
  auto argv = CStringArray(argv_strings);
  pid_t pid = ::fork();
  if (pid < 0) {
    return -1;
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, 0);
      ::dup2(devnull, 1);
      ::dup2(devnull, 2);
    }
    ::execvp(argv[0], argv.data());
    _exit(127);
  }
  auto deadline = std::chrono::steady_clock::now() + timeout;
  int status = 0;
  while (true) {
    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    if (w < 0 && errno != EINTR) {
      return -1;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      return -1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

void SignalGroup(pid_t pid, int sig) {
  if (::kill(-pid, sig) != 0) {
    ::kill(pid, sig);
  }
}

} // namespace

ScriptEngineProcess::ScriptEngineProcess(Options options, EngineClient *client,
                                         LogBuffer *log_buffer)
    : options_(std::move(options)), client_(client), log_buffer_(log_buffer) {}

ScriptEngineProcess::~ScriptEngineProcess() {
  bool running = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running = running_;
  }
  if (running) {
    Stop();
  }
  JoinMonitor();
}

void ScriptEngineProcess::SetExitCallback(std::function<void(int)> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  exit_callback_ = std::move(callback);
}

bool ScriptEngineProcess::Start(const LaunchParams &params) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      log::Warn("engine", "start requested while engine is running",
                "pid=" + std::to_string(pid_));
      return false;
    }
  }
  JoinMonitor();

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    log::Error("engine", "cannot create output pipe", std::strerror(errno));
    return false;
  }

  std::vector<std::string> argv_strings{"bash", params.script};
  auto argv = CStringArray(argv_strings);
  auto env_strings = BuildEnvironment(params.env);
  auto envp = CStringArray(env_strings);
  std::string working_dir = params.working_dir;

  pid_t pid = ::fork();
  if (pid < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    log::Error("engine", "fork failed", std::strerror(errno));
    return false;
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(fds[1], 1);
    ::dup2(fds[1], 2);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, 0);
    }
    if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
      _exit(126);
    }
    ::execvpe("bash", argv.data(), envp.data());
    _exit(127);
  }

  ::setpgid(pid, pid);
  ::close(fds[1]);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = pid;
    running_ = true;
    monitor_ = std::thread(&ScriptEngineProcess::MonitorLoop, this, pid, fds[0]);
  }
  log::Info("engine", "engine started",
            "pid=" + std::to_string(pid) + " launch=" + params.description +
                " script=" + params.script);
  return true;
}

void ScriptEngineProcess::EmitOutput(std::string *pending, const char *data,
                                     std::size_t length, bool flush) {
  if (data && length > 0) {
    pending->append(data, length);
  }
  auto newline = pending->rfind('\n');
  if (newline != std::string::npos) {
    if (log_buffer_) {
      log_buffer_->Add("llama", pending->substr(0, newline));
    }
    pending->erase(0, newline + 1);
  }
  if (flush && !pending->empty()) {
    if (log_buffer_) {
      log_buffer_->Add("llama", *pending);
    }
    pending->clear();
  }
}

void ScriptEngineProcess::MonitorLoop(pid_t pid, int out_fd) {
  std::string pending;
  char buffer[4096];
  int status = 0;
  bool exited = false;
  bool pipe_open = true;

  while (!exited) {
    if (pipe_open) {
      pollfd pfd{out_fd, POLLIN, 0};
      int ready = ::poll(&pfd, 1, 200);
      if (ready > 0) {
        ssize_t n = ::read(out_fd, buffer, sizeof(buffer));
        if (n > 0) {
          EmitOutput(&pending, buffer, static_cast<std::size_t>(n), false);
        } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
          pipe_open = false;
        }
      }
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid || (w < 0 && errno == ECHILD)) {
      exited = true;
    }
  }

  if (pipe_open) {
    int flags = ::fcntl(out_fd, F_GETFL, 0);
    ::fcntl(out_fd, F_SETFL, flags | O_NONBLOCK);
    ssize_t n = 0;
    while ((n = ::read(out_fd, buffer, sizeof(buffer))) > 0) {
      EmitOutput(&pending, buffer, static_cast<std::size_t>(n), false);
    }
  }
  EmitOutput(&pending, nullptr, 0, true);
  ::close(out_fd);

  std::function<void(int)> callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ == pid) {
      running_ = false;
      pid_ = -1;
    }
    callback = exit_callback_;
  }
  exited_cv_.notify_all();

  log::Info("engine", "engine exited",
            "pid=" + std::to_string(pid) + " " + DescribeStatus(status));
  if (log_buffer_) {
    log_buffer_->Add("system", "llama-server exited (" + DescribeStatus(status) + ")");
  }
  if (callback) {
    callback(status);
  }
}

void ScriptEngineProcess::Stop() {
  pid_t pid = -1;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      pid = pid_;
    }
  }

  if (pid > 0) {
    log::Info("engine", "stopping engine", "pid=" + std::to_string(pid));
    SignalGroup(pid, SIGTERM);
    std::unique_lock<std::mutex> lock(mutex_);
    bool exited = exited_cv_.wait_for(lock, options_.stop_timeout,
                                      [&] { return pid_ != pid; });
    if (!exited) {
      log::Warn("engine", "engine ignored SIGTERM; sending SIGKILL",
                "pid=" + std::to_string(pid));
      SignalGroup(pid, SIGKILL);
      exited_cv_.wait_for(lock, options_.kill_wait, [&] { return pid_ != pid; });
    }
  }
  JoinMonitor();

  if (options_.sweep_orphans) {
    SweepOrphans();
  }
}

void ScriptEngineProcess::JoinMonitor() {
  std::thread monitor;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor = std::move(monitor_);
  }
  if (monitor.joinable()) {
    monitor.join();
  }
}

void ScriptEngineProcess::SweepOrphans() {
  std::vector<std::vector<std::string>> commands;
  if (!options_.process_name.empty()) {
    if (!options_.container_command.empty()) {
      auto in_container = options_.container_command;
      in_container.insert(in_container.end(),
                          {"pkill", "-9", "-f", options_.process_name});
      commands.push_back(std::move(in_container));
    }
    commands.push_back({"pkill", "-9", "-f", options_.process_name});
  }
  if (options_.port > 0) {
    commands.push_back({"fuser", "-k", std::to_string(options_.port) + "/tcp"});
  }
  for (const auto &command : commands) {
    int rc = RunCommand(command, options_.sweep_timeout);
    std::string joined;
    for (const auto &part : command) {
      joined += (joined.empty() ? "" : " ") + part;
    }
    log::Debug("engine", "orphan sweep", "cmd=\"" + joined + "\" rc=" + std::to_string(rc));
  }
}

bool ScriptEngineProcess::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

bool ScriptEngineProcess::IsHealthy() {
  return client_ != nullptr && client_->Health().Ready();
}

} // namespace enginectl
