#include "utils.h"

#include <stdlib.h>
#include <unistd.h>

fs::path TestRoot() {
  return fs::temp_directory_path() / ("judgebox-test-" + std::to_string(getpid()));
}

fs::path UniqueTestDir(const std::string& prefix) {
  CreateDirs(TestRoot());
  std::string tmpl = (TestRoot() / (prefix + "-XXXXXX")).string();
  if (!mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp failed");
  return tmpl;
}

ProcessResult Exited(const std::string& out, int code, const std::string& err, long duration) {
  ProcessResult ret;
  ret.stdout_data = out;
  ret.stderr_data = err;
  ret.exit_code = code;
  ret.duration_ms = duration;
  return ret;
}

ProcessResult TimedOut(long duration) {
  ProcessResult ret;
  ret.exit_code = -1;
  ret.timed_out = true;
  ret.duration_ms = duration;
  return ret;
}

std::vector<TestCase> EchoTests(int n, long timeout_ms, long memory_mb) {
  std::vector<TestCase> ret;
  for (int i = 0; i < n; i++) {
    std::string val = std::to_string(i + 1);
    ret.push_back({"t" + val, val + "\n", val + "\n", timeout_ms, memory_mb, 1, i});
  }
  return ret;
}
