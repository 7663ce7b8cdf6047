#ifndef INCLUDE_JUDGEBOX_RUNNER_H_
#define INCLUDE_JUDGEBOX_RUNNER_H_

#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <filesystem>
#include <condition_variable>

struct RunRequest {
  std::string command;
  std::vector<std::string> args;
  std::string input; // written to stdin, which is then closed
  long timeout_ms;
  long memory_mb; // 0 = no limit; enforced by the container backend only
  std::filesystem::path workdir; // empty = inherit
  std::string image; // container backend only

  RunRequest() : timeout_ms(0), memory_mb(0) {}
};

struct ProcessResult {
  std::string stdout_data, stderr_data;
  int exit_code; // 128+signo if killed by a signal; -1 on timeout
  bool timed_out;
  long duration_ms;

  ProcessResult() : exit_code(0), timed_out(false), duration_ms(0) {}
};

// Backend-agnostic execution contract shared by the process and container runners
class Runner {
 public:
  virtual ~Runner() = default;
  virtual ProcessResult Run(const RunRequest&) = 0;
};

class ProcessRunner : public Runner {
 public:
  // time allowed for a killed process tree to go away before the result is finalized
  static constexpr long kKillGraceMs = 500;
  // per stream; the rest is drained and discarded
  static constexpr size_t kMaxCaptureBytes = 8 << 20;
  // exit code reported when the command cannot be executed
  static constexpr int kExecFailureCode = 127;

  ProcessRunner();
  ProcessResult Run(const RunRequest&) override;
};

// Translate a host directory for a bind mount (C:\x\y -> /c/x/y); POSIX paths are unchanged
std::string TranslateHostPath(const std::string&);

class ContainerRunner : public Runner {
 public:
  // exit status of the container CLI when it fails before the program starts;
  // the program itself can exit with it too
  static constexpr int kRuntimeErrorCode = 125;

 private:
  Runner& spawner_;
  std::string binary_;
  double cpus_;

  // containers of timed-out runs are killed in the background
  std::mutex kill_mtx_;
  std::condition_variable kill_cv_;
  std::deque<std::string> kill_queue_;
  bool stopping_;
  std::thread killer_;

  void KillLoop();

 public:
  static constexpr long kKillTimeoutMs = 3000;

  // spawner runs the container CLI itself (normally a ProcessRunner); it must be safe to call
  // from two threads at once
  ContainerRunner(Runner& spawner, double cpus, std::string binary = "docker");
  // finishes the pending kills
  ~ContainerRunner();

  // the full container CLI command line for a request; name identifies the container for kill
  std::vector<std::string> BuildCommand(const RunRequest&, const std::string& name) const;
  // on timeout returns as soon as the CLI is gone; the container is killed afterwards
  ProcessResult Run(const RunRequest&) override;
};

#endif  // INCLUDE_JUDGEBOX_RUNNER_H_
