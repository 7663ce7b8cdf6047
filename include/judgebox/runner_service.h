#ifndef INCLUDE_JUDGEBOX_RUNNER_SERVICE_H_
#define INCLUDE_JUDGEBOX_RUNNER_SERVICE_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "challenge.h"
#include "execution_plan.h"
#include "probe.h"
#include "runner.h"
#include "submission.h"

struct TestOutcome {
  std::string test_case_id;
  TestStatus status;
  long runtime_ms;
  std::string output; // trimmed stdout
  std::optional<std::string> error;
  int points_awarded;
  Backend backend;
};

struct RunResult {
  std::vector<TestOutcome> tests;
  std::string stdout_data, stderr_data; // all tests, concatenated
  long runtime_ms; // sum over tests
  long memory_mb; // largest limit enforced; 0 if no backend enforced one
};

struct AdhocResult {
  std::string stdout_data, stderr_data;
  int exit_code;
  bool timed_out;
  long runtime_ms;
  long memory_mb;
  bool infrastructure_error;
  Backend backend;
};

class RunnerService {
 public:
  // captured output kept in RunResult::stdout_data / stderr_data
  static constexpr size_t kMaxAggregateBytes = 1 << 20;

  RunnerService(CapabilityProbe& probe, Runner& process_runner, Runner& container_runner,
                ExecutionMode mode, std::filesystem::path work_root);

  // Runs code against tests in order. nullopt only if there are no tests;
  // per-test failures (including an unusable sandbox) are reported on the tests.
  // Throws ValidationError for languages that have no local runner.
  std::optional<RunResult> RunCode(Language, const std::string& code, const std::vector<TestCase>& tests);

  // Single execution with arbitrary stdin
  AdhocResult RunAdhoc(Language, const std::string& code, const std::string& input,
                       long timeout_ms, long memory_mb);

  ExecutionMode Mode() const { return mode_; }

 private:
  ExecutionPlan Plan();
  ProcessResult Execute(Backend, Language, const std::filesystem::path& dir, const std::string& interpreter,
                        const std::string& input, long timeout_ms, long memory_mb);
  // container result caused by the runtime rather than the program
  bool ContainerRuntimeFailed(Language, const ProcessResult&);

  CapabilityProbe& probe_;
  Runner& process_runner_;
  Runner& container_runner_;
  ExecutionMode mode_;
  std::filesystem::path work_root_;
};

// Verdict of one finished process against the expected output
TestOutcome ScoreTest(const TestCase&, const ProcessResult&);

#endif  // INCLUDE_JUDGEBOX_RUNNER_SERVICE_H_
