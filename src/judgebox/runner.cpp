#include "judgebox/runner.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <chrono>
#include <thread>
#include <algorithm>
#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
#define HAS_CLOSE_RANGE 1
#else
#include <dirent.h>
#endif

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "judgebox/utils.h"

namespace {

std::once_flag sigpipe_flag;

#ifdef HAS_CLOSE_RANGE
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // HAS_CLOSE_RANGE

inline void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

inline void SetNonblock(int fd) {
  fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
}

// Read what is available; closes fd on EOF or error
void DrainFd(int& fd, std::string& buf) {
  char chunk[65536];
  ssize_t n = read(fd, chunk, sizeof(chunk));
  if (n > 0) {
    size_t room = ProcessRunner::kMaxCaptureBytes - std::min(buf.size(), ProcessRunner::kMaxCaptureBytes);
    buf.append(chunk, std::min((size_t)n, room));
    return;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) return;
  CloseFd(fd);
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

// Poll for the child until deadline; true if it was reaped
bool WaitUntil(pid_t pid, int64_t deadline, int& status) {
  while (true) {
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid) return true;
    if (ret < 0 && errno != EINTR) {
      status = 0;
      return true;
    }
    if (MonotonicMs() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

ProcessResult SpawnFailure(const std::string& what) {
  spdlog::warn("Failed to spawn process: {}: {}", what, strerror(errno));
  ProcessResult ret;
  ret.exit_code = ProcessRunner::kExecFailureCode;
  ret.stderr_data = fmt::format("failed to spawn process: {}", strerror(errno));
  return ret;
}

} // namespace

ProcessRunner::ProcessRunner() {
  // writes to the stdin of an exited child must surface as EPIPE instead of killing us
  std::call_once(sigpipe_flag, []{ signal(SIGPIPE, SIG_IGN); });
}

ProcessResult ProcessRunner::Run(const RunRequest& req) {
  // everything the child needs is prepared before fork
  std::vector<char*> argv;
  argv.push_back(const_cast<char*>(req.command.c_str()));
  for (auto& i : req.args) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  const std::string not_found = req.command + ": command not found\n";
  const std::string exec_failed = req.command + ": cannot execute: ";
  const std::string workdir = req.workdir.string();

  int in_pipe[2], out_pipe[2], err_pipe[2];
  if (pipe2(in_pipe, O_CLOEXEC) < 0) return SpawnFailure("pipe");
  if (pipe2(out_pipe, O_CLOEXEC) < 0) {
    close(in_pipe[0]), close(in_pipe[1]);
    return SpawnFailure("pipe");
  }
  if (pipe2(err_pipe, O_CLOEXEC) < 0) {
    close(in_pipe[0]), close(in_pipe[1]), close(out_pipe[0]), close(out_pipe[1]);
    return SpawnFailure("pipe");
  }

  int64_t start = MonotonicMs();
  pid_t pid = fork();
  if (pid < 0) {
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
    return SpawnFailure("fork");
  }
  if (pid == 0) {
    // async-signal-safe calls only
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    dup2(in_pipe[0], 0);
    dup2(out_pipe[1], 1);
    dup2(err_pipe[1], 2);
    CloseFrom(3);
    if (!workdir.empty() && chdir(workdir.c_str()) < 0) {
      IGNORE_RETURN(write(2, exec_failed.data(), exec_failed.size()));
      _exit(kExecFailureCode);
    }
    execvp(argv[0], argv.data());
    if (errno == ENOENT) {
      IGNORE_RETURN(write(2, not_found.data(), not_found.size()));
    } else {
      const char* err = strerror(errno);
      IGNORE_RETURN(write(2, exec_failed.data(), exec_failed.size()));
      IGNORE_RETURN(write(2, err, strlen(err)));
    }
    _exit(kExecFailureCode);
  }
  setpgid(pid, pid); // also done by the child; whichever runs first wins
  spdlog::debug("Spawned pid={} command={} {} timeout={}ms",
                pid, req.command, fmt::format("{}", req.args), req.timeout_ms);
  close(in_pipe[0]);
  close(out_pipe[1]);
  close(err_pipe[1]);
  int in_fd = in_pipe[1], out_fd = out_pipe[0], err_fd = err_pipe[0];
  SetNonblock(in_fd);
  SetNonblock(out_fd);
  SetNonblock(err_fd);

  ProcessResult ret;
  const int64_t deadline = start + std::max(0L, req.timeout_ms);
  size_t written = 0;
  if (req.input.empty()) CloseFd(in_fd);

  while (in_fd >= 0 || out_fd >= 0 || err_fd >= 0) {
    int64_t remaining = deadline - MonotonicMs();
    if (remaining <= 0) {
      ret.timed_out = true;
      break;
    }
    struct pollfd fds[3];
    int nfds = 0, in_idx = -1, out_idx = -1, err_idx = -1;
    auto add_fd = [&](int fd, short events) {
      fds[nfds] = {fd, events, 0};
      return nfds++;
    };
    if (in_fd >= 0) in_idx = add_fd(in_fd, POLLOUT);
    if (out_fd >= 0) out_idx = add_fd(out_fd, POLLIN);
    if (err_fd >= 0) err_idx = add_fd(err_fd, POLLIN);
    int r = poll(fds, nfds, (int)remaining);
    if (r < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll failed for pid={}: {}", pid, strerror(errno));
      ret.timed_out = true;
      break;
    }
    if (r == 0) continue;
    if (in_idx != -1 && fds[in_idx].revents) {
      if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
        // the child closed its stdin or already exited; not an error of ours
        CloseFd(in_fd);
      } else {
        size_t len = std::min<size_t>(65536, req.input.size() - written);
        ssize_t n = write(in_fd, req.input.data() + written, len);
        if (n > 0) {
          written += n;
          if (written == req.input.size()) CloseFd(in_fd);
        } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
          spdlog::debug("stdin write to pid={} stopped: {}", pid, strerror(errno));
          CloseFd(in_fd);
        }
      }
    }
    if (out_idx != -1 && fds[out_idx].revents) DrainFd(out_fd, ret.stdout_data);
    if (err_idx != -1 && fds[err_idx].revents) DrainFd(err_fd, ret.stderr_data);
  }

  int status = 0;
  // output closed, but the process may still be alive
  if (!ret.timed_out && !WaitUntil(pid, deadline, status)) ret.timed_out = true;
  if (ret.timed_out) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    if (!WaitUntil(pid, MonotonicMs() + kKillGraceMs, status)) {
      spdlog::warn("pid={} still alive {}ms after SIGKILL; reaping in background", pid, kKillGraceMs);
      std::thread([pid]() { waitpid(pid, nullptr, 0); }).detach();
    }
    ret.exit_code = -1;
  } else {
    ret.exit_code = DecodeStatus(status);
  }
  CloseFd(in_fd);
  CloseFd(out_fd);
  CloseFd(err_fd);
  ret.duration_ms = MonotonicMs() - start;
  spdlog::debug("Process finished: pid={} exit_code={} timed_out={} duration={}ms",
                pid, ret.exit_code, ret.timed_out, ret.duration_ms);
  return ret;
}
