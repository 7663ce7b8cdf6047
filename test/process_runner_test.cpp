#include <gtest/gtest.h>
#include "judgebox/runner.h"
#include "utils.h"

namespace {

RunRequest Shell(const std::string& script, long timeout_ms = 5000) {
  RunRequest req;
  req.command = "/bin/sh";
  req.args = {"-c", script};
  req.timeout_ms = timeout_ms;
  return req;
}

} // namespace

TEST(ProcessRunner, EchoesStdin) {
  ProcessRunner runner;
  RunRequest req = Shell("cat");
  req.input = "hello\nworld\n";
  ProcessResult res = runner.Run(req);
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_data, "hello\nworld\n");
  EXPECT_EQ(res.stderr_data, "");
}

TEST(ProcessRunner, ExitCodeAndStderr) {
  ProcessRunner runner;
  ProcessResult res = runner.Run(Shell("echo oops >&2; exit 3"));
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_EQ(res.stderr_data, "oops\n");
}

TEST(ProcessRunner, KilledBySignal) {
  ProcessRunner runner;
  ProcessResult res = runner.Run(Shell("kill -9 $$"));
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.exit_code, 128 + 9);
}

TEST(ProcessRunner, TimeoutWithinGrace) {
  ProcessRunner runner;
  constexpr long kTimeout = 300;
  int64_t start = MonotonicMs();
  // the background sleep keeps the pipes open; the whole group must go
  ProcessResult res = runner.Run(Shell("sleep 10 & sleep 10", kTimeout));
  int64_t elapsed = MonotonicMs() - start;
  EXPECT_TRUE(res.timed_out);
  EXPECT_EQ(res.exit_code, -1);
  EXPECT_GE(elapsed, kTimeout);
  EXPECT_LT(elapsed, kTimeout + ProcessRunner::kKillGraceMs + 1000);
}

TEST(ProcessRunner, CommandNotFound) {
  ProcessRunner runner;
  RunRequest req;
  req.command = "judgebox-no-such-command";
  req.timeout_ms = 2000;
  ProcessResult res = runner.Run(req);
  EXPECT_EQ(res.exit_code, ProcessRunner::kExecFailureCode);
  EXPECT_NE(res.stderr_data.find("command not found"), std::string::npos);
}

TEST(ProcessRunner, UnreadInputIsNotAnError) {
  ProcessRunner runner;
  RunRequest req = Shell("exit 0");
  req.input = std::string(4 << 20, 'x');
  ProcessResult res = runner.Run(req);
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.exit_code, 0);
}

TEST(ProcessRunner, WorkingDirectory) {
  ProcessRunner runner;
  fs::path dir = UniqueTestDir("cwd");
  ASSERT_TRUE(WriteFile(dir / "data.txt", "42"));
  RunRequest req = Shell("cat data.txt");
  req.workdir = dir;
  ProcessResult res = runner.Run(req);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_data, "42");
}
