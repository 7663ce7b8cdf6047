#include <fstream>
#include <sstream>
#include <gtest/gtest.h>
#include "judgebox/errors.h"
#include "judgebox/runner_service.h"
#include "utils.h"

namespace {

constexpr char kDaemonDown[] =
    "docker: Cannot connect to the Docker daemon at unix:///var/run/docker.sock. Is the docker daemon running?";

std::string ReadSource(const RunRequest& req, Language lang) {
  std::ifstream fin(req.workdir / LanguageFileName(lang));
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

ProcessResult Echo(const RunRequest& req) {
  return Exited(req.input, 0, "", 25);
}

class RunnerServiceTest : public ::testing::Test {
 protected:
  FakeProbe probe;
  FakeRunner process{Echo};
  FakeRunner container{Echo};
  fs::path work_root;

  void SetUp() override {
    work_root = UniqueTestDir("work");
  }

  RunnerService Service(ExecutionMode mode) {
    return RunnerService(probe, process, container, mode, work_root);
  }
};

} // namespace

TEST_F(RunnerServiceTest, LocalRunsEveryTestInOrder) {
  std::string seen_source;
  process.handler = [&](const RunRequest& req) {
    seen_source = ReadSource(req, Language::PYTHON);
    return Echo(req);
  };
  auto service = Service(ExecutionMode::LOCAL);
  auto res = service.RunCode(Language::PYTHON, "print(input())", EchoTests(3));
  ASSERT_TRUE(res.has_value());
  ASSERT_EQ(res->tests.size(), 3u);
  for (int i = 0; i < 3; i++) {
    EXPECT_EQ(res->tests[i].test_case_id, "t" + std::to_string(i + 1));
    EXPECT_EQ(res->tests[i].status, TestStatus::PASSED);
    EXPECT_EQ(res->tests[i].points_awarded, 1);
    EXPECT_EQ(res->tests[i].backend, Backend::LOCAL);
  }
  EXPECT_EQ(seen_source, "print(input())");
  EXPECT_EQ(res->runtime_ms, 75);
  EXPECT_EQ(res->stdout_data, "1\n2\n3\n");
  // the process backend enforces no memory limit
  EXPECT_EQ(res->memory_mb, 0);
  EXPECT_TRUE(container.requests.empty());
  EXPECT_EQ(probe.container_checks, 0);

  ASSERT_EQ(process.requests.size(), 3u);
  EXPECT_EQ(process.requests[0].command, "python3");
  EXPECT_EQ(process.requests[0].args, std::vector<std::string>{"solution.py"});
  EXPECT_EQ(process.requests[0].timeout_ms, 1000);
  // per-execution directory is gone afterwards
  EXPECT_FALSE(fs::exists(process.requests[0].workdir));
}

TEST_F(RunnerServiceTest, Verdicts) {
  process.handler = [](const RunRequest& req) {
    if (req.input == "1\n") return Exited(" 1 \n\n");
    if (req.input == "2\n") return Exited("wrong\n", 0, "warning: deprecated");
    if (req.input == "3\n") return Exited("", 2);
    if (req.input == "4\n") return Exited("", 1, "Traceback: ZeroDivisionError\n");
    return TimedOut(1700);
  };
  auto service = Service(ExecutionMode::LOCAL);
  auto res = service.RunCode(Language::JAVASCRIPT, "x", EchoTests(5));
  ASSERT_TRUE(res.has_value());
  auto& tests = res->tests;
  ASSERT_EQ(tests.size(), 5u);
  EXPECT_EQ(tests[0].status, TestStatus::PASSED);
  EXPECT_EQ(tests[0].output, "1");

  EXPECT_EQ(tests[1].status, TestStatus::FAILED);
  EXPECT_EQ(tests[1].error, "warning: deprecated");
  EXPECT_EQ(tests[1].points_awarded, 0);

  EXPECT_EQ(tests[2].status, TestStatus::ERROR);
  EXPECT_EQ(tests[2].error, "Process exited with code 2");

  EXPECT_EQ(tests[3].status, TestStatus::ERROR);
  EXPECT_EQ(tests[3].error, "Traceback: ZeroDivisionError");

  EXPECT_EQ(tests[4].status, TestStatus::ERROR);
  EXPECT_EQ(tests[4].error, "Time limit exceeded (1000 ms)");
  EXPECT_EQ(tests[4].runtime_ms, 1700);
  EXPECT_EQ(process.requests[0].command, "node");
}

TEST_F(RunnerServiceTest, NoTests) {
  auto service = Service(ExecutionMode::AUTO);
  EXPECT_FALSE(service.RunCode(Language::PYTHON, "x", {}).has_value());
  EXPECT_TRUE(process.requests.empty());
}

TEST_F(RunnerServiceTest, RemoteLanguageRejected) {
  auto service = Service(ExecutionMode::LOCAL);
  EXPECT_THROW(service.RunCode(Language::JAVA, "class Main {}", EchoTests(1)), ValidationError);
}

TEST_F(RunnerServiceTest, DefaultLimits) {
  auto tests = EchoTests(1, 0, 0);
  probe.container_available = true;
  auto service = Service(ExecutionMode::CONTAINER);
  auto res = service.RunCode(Language::PYTHON, "x", tests);
  ASSERT_TRUE(res.has_value());
  ASSERT_EQ(container.requests.size(), 1u);
  EXPECT_EQ(container.requests[0].timeout_ms, kDefaultTimeoutMs);
  EXPECT_EQ(container.requests[0].memory_mb, kDefaultMemoryMb);
  EXPECT_EQ(res->memory_mb, kDefaultMemoryMb);
}

TEST_F(RunnerServiceTest, ContainerRequest) {
  probe.container_available = true;
  auto service = Service(ExecutionMode::AUTO);
  auto res = service.RunCode(Language::JAVASCRIPT, "x", EchoTests(2, 1500, 128));
  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(process.requests.empty());
  ASSERT_EQ(container.requests.size(), 2u);
  auto& req = container.requests[0];
  EXPECT_EQ(req.command, "node");
  EXPECT_EQ(req.image, "node:18-alpine");
  EXPECT_EQ(req.memory_mb, 128);
  EXPECT_EQ(req.timeout_ms, 1500);
  EXPECT_EQ(res->tests[1].backend, Backend::CONTAINER);
  EXPECT_EQ(res->memory_mb, 128);
}

TEST_F(RunnerServiceTest, AutoFallsBackMidRun) {
  probe.container_available = true;
  int calls = 0;
  container.handler = [&](const RunRequest& req) {
    if (++calls == 1) return Echo(req);
    // the daemon goes away after the first test
    probe.container_available = false;
    return Exited("", 125, kDaemonDown);
  };
  auto service = Service(ExecutionMode::AUTO);
  auto res = service.RunCode(Language::PYTHON, "x", EchoTests(3));
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(container.requests.size(), 2u);
  ASSERT_EQ(process.requests.size(), 2u);
  // the failing test is retried locally, later tests stay local
  EXPECT_EQ(process.requests[0].input, "2\n");
  EXPECT_EQ(process.requests[1].input, "3\n");
  ASSERT_EQ(res->tests.size(), 3u);
  EXPECT_EQ(res->tests[0].backend, Backend::CONTAINER);
  EXPECT_EQ(res->tests[1].backend, Backend::LOCAL);
  EXPECT_EQ(res->tests[2].backend, Backend::LOCAL);
  for (auto& test : res->tests) EXPECT_EQ(test.status, TestStatus::PASSED);
  EXPECT_EQ(probe.image_checks, std::vector<std::string>{"python:3.11-alpine"});
}

TEST_F(RunnerServiceTest, UserErrorDoesNotFallBack) {
  probe.container_available = true;
  container.handler = [](const RunRequest&) { return Exited("", 1, "SyntaxError: Unexpected token"); };
  auto service = Service(ExecutionMode::AUTO);
  auto res = service.RunCode(Language::JAVASCRIPT, "x", EchoTests(2));
  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(process.requests.empty());
  for (auto& test : res->tests) {
    EXPECT_EQ(test.status, TestStatus::ERROR);
    EXPECT_EQ(test.backend, Backend::CONTAINER);
  }
}

TEST_F(RunnerServiceTest, ProgramOutputNeverLeavesContainer) {
  probe.container_available = true;
  container.handler = [](const RunRequest& req) {
    if (req.input == "1\n") return Exited("", 1, "PermissionError: [Errno 13] Permission denied: '/etc/shadow'");
    if (req.input == "2\n") return Exited("", 126, "permission denied");
    return Exited("", 1, "docker: Cannot connect to the Docker daemon");
  };
  auto service = Service(ExecutionMode::AUTO);
  auto res = service.RunCode(Language::PYTHON, "x", EchoTests(3));
  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(process.requests.empty());
  EXPECT_TRUE(probe.image_checks.empty());
  for (auto& test : res->tests) {
    EXPECT_EQ(test.status, TestStatus::ERROR);
    EXPECT_EQ(test.backend, Backend::CONTAINER);
    EXPECT_EQ(test.points_awarded, 0);
  }
}

TEST_F(RunnerServiceTest, ProgramExitingWithRuntimeCode) {
  // the runtime is healthy, so status 125 came from the program
  probe.container_available = true;
  container.handler = [](const RunRequest&) { return Exited("", 125, kDaemonDown); };
  auto service = Service(ExecutionMode::AUTO);
  auto res = service.RunCode(Language::JAVASCRIPT, "x", EchoTests(2));
  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(process.requests.empty());
  EXPECT_EQ(probe.image_checks.size(), 2u);
  EXPECT_EQ(probe.image_checks[0], "node:18-alpine");
  for (auto& test : res->tests) EXPECT_EQ(test.backend, Backend::CONTAINER);

  AdhocResult adhoc = service.RunAdhoc(Language::JAVASCRIPT, "x", "", 2000, 64);
  EXPECT_FALSE(adhoc.infrastructure_error);
  EXPECT_EQ(adhoc.backend, Backend::CONTAINER);
  EXPECT_TRUE(process.requests.empty());
}

TEST_F(RunnerServiceTest, StrictContainerNeverRunsLocally) {
  probe.container_available = true;
  container.handler = [&](const RunRequest&) {
    probe.container_available = false;
    return Exited("", 125, kDaemonDown);
  };
  auto service = Service(ExecutionMode::CONTAINER);
  auto res = service.RunCode(Language::PYTHON, "x", EchoTests(3));
  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(process.requests.empty());
  EXPECT_EQ(container.requests.size(), 3u);
  for (auto& test : res->tests) {
    EXPECT_EQ(test.status, TestStatus::ERROR);
    EXPECT_EQ(test.error, kDaemonDown);
  }
}

TEST_F(RunnerServiceTest, ContainerModeWithoutRuntime) {
  auto service = Service(ExecutionMode::CONTAINER);
  auto res = service.RunCode(Language::PYTHON, "x", EchoTests(2));
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(probe.container_checks, 1);
  EXPECT_TRUE(container.requests.empty());
  EXPECT_EQ(process.requests.size(), 2u);
}

TEST_F(RunnerServiceTest, MissingInterpreter) {
  probe.interpreters.erase(Language::PYTHON);
  auto service = Service(ExecutionMode::LOCAL);
  auto res = service.RunCode(Language::PYTHON, "x", EchoTests(2));
  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(process.requests.empty());
  for (auto& test : res->tests) {
    EXPECT_EQ(test.status, TestStatus::ERROR);
    EXPECT_EQ(test.error, "Python interpreter not found on host");
  }
}

TEST_F(RunnerServiceTest, AdhocLocal) {
  process.handler = [](const RunRequest& req) { return Exited("out:" + req.input, 3, "err", 40); };
  auto service = Service(ExecutionMode::LOCAL);
  AdhocResult res = service.RunAdhoc(Language::PYTHON, "x", "abc", 2000, 64);
  EXPECT_EQ(res.stdout_data, "out:abc");
  EXPECT_EQ(res.stderr_data, "err");
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_EQ(res.runtime_ms, 40);
  EXPECT_EQ(res.memory_mb, 0);
  EXPECT_FALSE(res.infrastructure_error);
  EXPECT_EQ(res.backend, Backend::LOCAL);
  EXPECT_EQ(process.requests[0].timeout_ms, 2000);
}

TEST_F(RunnerServiceTest, AdhocFallback) {
  probe.container_available = true;
  container.handler = [&](const RunRequest&) {
    probe.container_available = false;
    return Exited("", 125, kDaemonDown);
  };
  auto service = Service(ExecutionMode::AUTO);
  AdhocResult res = service.RunAdhoc(Language::JAVASCRIPT, "x", "hi\n", 2000, 64);
  EXPECT_EQ(container.requests.size(), 1u);
  EXPECT_EQ(process.requests.size(), 1u);
  EXPECT_EQ(res.backend, Backend::LOCAL);
  EXPECT_EQ(res.stdout_data, "hi\n");
  EXPECT_FALSE(res.infrastructure_error);
}

TEST_F(RunnerServiceTest, AdhocUserOutputMentioningDocker) {
  probe.container_available = true;
  container.handler = [](const RunRequest&) { return Exited("", 1, "docker is my favourite word"); };
  auto service = Service(ExecutionMode::AUTO);
  AdhocResult res = service.RunAdhoc(Language::JAVASCRIPT, "x", "", 2000, 64);
  EXPECT_FALSE(res.infrastructure_error);
  EXPECT_TRUE(process.requests.empty());
  EXPECT_EQ(res.memory_mb, 64);

  container.handler = [](const RunRequest&) { return Exited("", 126, "permission denied"); };
  res = service.RunAdhoc(Language::JAVASCRIPT, "x", "", 2000, 64);
  EXPECT_FALSE(res.infrastructure_error);
  EXPECT_TRUE(process.requests.empty());
}

TEST_F(RunnerServiceTest, AdhocMissingInterpreter) {
  probe.interpreters.clear();
  auto service = Service(ExecutionMode::LOCAL);
  AdhocResult res = service.RunAdhoc(Language::JAVASCRIPT, "x", "", 2000, 64);
  EXPECT_TRUE(res.infrastructure_error);
  EXPECT_EQ(res.exit_code, ProcessRunner::kExecFailureCode);
  EXPECT_EQ(res.stderr_data, "JavaScript interpreter not found on host");
}

TEST(ScoreTest, TrimmedComparison) {
  TestCase test{"t", "", "  a b \n", 1000, 64, 7, 0};
  TestOutcome outcome = ScoreTest(test, Exited("a b\n\n"));
  EXPECT_EQ(outcome.status, TestStatus::PASSED);
  EXPECT_EQ(outcome.points_awarded, 7);
  EXPECT_FALSE(outcome.error.has_value());
}
