#include <atomic>
#include <chrono>
#include <thread>
#include <algorithm>
#include <gtest/gtest.h>
#include "judgebox/runner.h"
#include "utils.h"

namespace {

bool HasPair(const std::vector<std::string>& cmd, const std::string& flag, const std::string& value) {
  for (size_t i = 0; i + 1 < cmd.size(); i++) {
    if (cmd[i] == flag && cmd[i + 1] == value) return true;
  }
  return false;
}

bool Has(const std::vector<std::string>& cmd, const std::string& arg) {
  return std::find(cmd.begin(), cmd.end(), arg) != cmd.end();
}

RunRequest PythonRequest() {
  RunRequest req;
  req.command = "python";
  req.args = {"solution.py"};
  req.image = "python:3.11-alpine";
  req.memory_mb = 128;
  req.timeout_ms = 1000;
  req.workdir = "/tmp/judgebox/run-abc";
  return req;
}

} // namespace

TEST(ContainerRunner, IsolationFlags) {
  FakeRunner spawner;
  ContainerRunner runner(spawner, 0.5);
  auto cmd = runner.BuildCommand(PythonRequest(), "box1");
  ASSERT_GE(cmd.size(), 3u);
  EXPECT_EQ(cmd[0], "docker");
  EXPECT_EQ(cmd[1], "run");
  EXPECT_TRUE(Has(cmd, "--rm"));
  EXPECT_TRUE(Has(cmd, "--read-only"));
  EXPECT_TRUE(Has(cmd, "--pull=never"));
  EXPECT_TRUE(HasPair(cmd, "--name", "box1"));
  EXPECT_TRUE(HasPair(cmd, "--network", "none"));
  EXPECT_TRUE(HasPair(cmd, "--memory", "128m"));
  EXPECT_TRUE(HasPair(cmd, "--memory-swap", "128m"));
  EXPECT_TRUE(HasPair(cmd, "--cpus", "0.5"));
  EXPECT_TRUE(HasPair(cmd, "-v", "/tmp/judgebox/run-abc:/app:ro"));
  EXPECT_TRUE(HasPair(cmd, "-w", "/app"));
  // image, then the command inside it
  std::vector<std::string> tail(cmd.end() - 3, cmd.end());
  EXPECT_EQ(tail, (std::vector<std::string>{"python:3.11-alpine", "python", "solution.py"}));
}

TEST(ContainerRunner, NoMemoryLimit) {
  FakeRunner spawner;
  ContainerRunner runner(spawner, 1);
  RunRequest req = PythonRequest();
  req.memory_mb = 0;
  auto cmd = runner.BuildCommand(req, "box2");
  EXPECT_FALSE(Has(cmd, "--memory"));
  EXPECT_TRUE(HasPair(cmd, "--cpus", "1"));
}

TEST(ContainerRunner, TranslateHostPath) {
  EXPECT_EQ(TranslateHostPath("C:\\Users\\judge\\tmp"), "/c/Users/judge/tmp");
  EXPECT_EQ(TranslateHostPath("d:\\"), "/d/");
  EXPECT_EQ(TranslateHostPath("/var/tmp/x"), "/var/tmp/x");
}

TEST(ContainerRunner, PassesInputThroughCli) {
  FakeRunner spawner([](const RunRequest&) { return Exited("3\n"); });
  ContainerRunner runner(spawner, 0.5);
  RunRequest req = PythonRequest();
  req.input = "1 2\n";
  ProcessResult res = runner.Run(req);
  EXPECT_EQ(res.stdout_data, "3\n");
  ASSERT_EQ(spawner.requests.size(), 1u);
  EXPECT_EQ(spawner.requests[0].command, "docker");
  EXPECT_EQ(spawner.requests[0].input, "1 2\n");
  EXPECT_EQ(spawner.requests[0].timeout_ms, 1000);
}

TEST(ContainerRunner, KillsContainerOnTimeout) {
  FakeRunner spawner([](const RunRequest& req) {
    return req.args.size() && req.args[0] == "run" ? TimedOut(1500) : Exited("");
  });
  {
    ContainerRunner runner(spawner, 0.5);
    ProcessResult res = runner.Run(PythonRequest());
    EXPECT_TRUE(res.timed_out);
  }
  // the destructor waits for the pending kill
  ASSERT_EQ(spawner.requests.size(), 2u);
  auto& run_args = spawner.requests[0].args;
  auto name = std::find(run_args.begin(), run_args.end(), "--name");
  ASSERT_NE(name, run_args.end());
  EXPECT_EQ(spawner.requests[1].args, (std::vector<std::string>{"kill", *(name + 1)}));
  EXPECT_EQ(spawner.requests[1].timeout_ms, ContainerRunner::kKillTimeoutMs);
}

TEST(ContainerRunner, HungKillDoesNotDelayTimeout) {
  std::atomic_int kills = 0;
  FakeRunner spawner([&](const RunRequest& req) {
    if (req.args.size() && req.args[0] == "run") return TimedOut(1000 + ProcessRunner::kKillGraceMs);
    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    kills++;
    return TimedOut(800);
  });
  ContainerRunner runner(spawner, 0.5);
  int64_t start = MonotonicMs();
  ProcessResult res = runner.Run(PythonRequest());
  EXPECT_TRUE(res.timed_out);
  EXPECT_LT(MonotonicMs() - start, ProcessRunner::kKillGraceMs);
  EXPECT_EQ(kills.load(), 0);
}

TEST(ContainerRunner, UniqueNames) {
  FakeRunner spawner;
  ContainerRunner runner(spawner, 0.5);
  runner.Run(PythonRequest());
  runner.Run(PythonRequest());
  ASSERT_EQ(spawner.requests.size(), 2u);
  EXPECT_NE(spawner.requests[0].args, spawner.requests[1].args);
}
