#include "judgebox/runner.h"

#include <unistd.h>
#include <atomic>
#include <random>
#include <cctype>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace {

constexpr char kContainerWorkdir[] = "/app";

std::atomic_long container_seq = 0;

std::string UniqueContainerName() {
  static const unsigned salt = std::random_device()();
  return fmt::format("judgebox-{}-{:x}-{}", getpid(), salt, ++container_seq);
}

std::string FormatCpus(double cpus) {
  std::string ret = fmt::format("{:.2f}", cpus);
  while (ret.back() == '0') ret.pop_back();
  if (ret.back() == '.') ret.pop_back();
  return ret;
}

} // namespace

std::string TranslateHostPath(const std::string& path) {
  // drive-letter paths of non-POSIX hosts; docker desktop mounts them as /<drive>/...
  if (path.size() >= 2 && std::isalpha((unsigned char)path[0]) && path[1] == ':') {
    std::string ret = "/";
    ret += (char)std::tolower((unsigned char)path[0]);
    for (size_t i = 2; i < path.size(); i++) ret += path[i] == '\\' ? '/' : path[i];
    if (ret.size() == 2) ret += '/';
    return ret;
  }
  return path;
}

ContainerRunner::ContainerRunner(Runner& spawner, double cpus, std::string binary) :
    spawner_(spawner), binary_(std::move(binary)), cpus_(cpus), stopping_(false),
    killer_(&ContainerRunner::KillLoop, this) {}

ContainerRunner::~ContainerRunner() {
  {
    std::lock_guard lck(kill_mtx_);
    stopping_ = true;
  }
  kill_cv_.notify_all();
  killer_.join();
}

void ContainerRunner::KillLoop() {
  std::unique_lock lck(kill_mtx_);
  while (true) {
    kill_cv_.wait(lck, [this]() { return stopping_ || kill_queue_.size(); });
    if (kill_queue_.empty()) return;
    std::string name = std::move(kill_queue_.front());
    kill_queue_.pop_front();
    lck.unlock();
    RunRequest req;
    req.command = binary_;
    req.args = {"kill", name};
    req.timeout_ms = kKillTimeoutMs;
    ProcessResult res = spawner_.Run(req);
    if (res.timed_out || res.exit_code != 0) {
      spdlog::debug("Container kill {} exited with {}: {}", name, res.exit_code, res.stderr_data);
    }
    lck.lock();
  }
}

std::vector<std::string> ContainerRunner::BuildCommand(const RunRequest& req, const std::string& name) const {
  std::vector<std::string> ret = {binary_, "run", "--rm", "-i", "--name", name, "--network", "none"};
  if (req.memory_mb > 0) {
    std::string mem = std::to_string(req.memory_mb) + 'm';
    // equal swap limit disables swap
    ret.insert(ret.end(), {"--memory", mem, "--memory-swap", mem});
  }
  if (cpus_ > 0) ret.insert(ret.end(), {"--cpus", FormatCpus(cpus_)});
  ret.insert(ret.end(), {"--pids-limit", "64", "--read-only", "--tmpfs", "/tmp:rw,size=16m"});
  if (!req.workdir.empty()) {
    ret.insert(ret.end(), {"-v", TranslateHostPath(req.workdir.string()) + ':' + kContainerWorkdir + ":ro",
                           "-w", kContainerWorkdir});
  }
  ret.insert(ret.end(), {"--pull=never", req.image, req.command});
  ret.insert(ret.end(), req.args.begin(), req.args.end());
  return ret;
}

ProcessResult ContainerRunner::Run(const RunRequest& req) {
  std::string name = UniqueContainerName();
  std::vector<std::string> cmd = BuildCommand(req, name);
  RunRequest cli;
  cli.command = cmd[0];
  cli.args.assign(cmd.begin() + 1, cmd.end());
  cli.input = req.input;
  cli.timeout_ms = req.timeout_ms;
  spdlog::debug("Container run: name={} image={} memory={}m", name, req.image, req.memory_mb);
  ProcessResult ret = spawner_.Run(cli);
  if (ret.timed_out) {
    // killing the CLI does not stop the container itself
    {
      std::lock_guard lck(kill_mtx_);
      kill_queue_.push_back(std::move(name));
    }
    kill_cv_.notify_one();
  }
  return ret;
}
