#include "judgebox/runner_service.h"

#include <stdlib.h>
#include <cstring>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "judgebox/config.h"
#include "judgebox/errors.h"
#include "judgebox/utils.h"

namespace {

// Fresh per-execution directory; removed best-effort on destruction
class WorkDir {
  fs::path path_;

 public:
  explicit WorkDir(const fs::path& root) {
    if (!CreateDirs(root)) return;
    std::string tmpl = (root / "run-XXXXXX").string();
    if (!mkdtemp(tmpl.data())) {
      spdlog::warn("Failed creating work directory under {}: {}", root.c_str(), strerror(errno));
      return;
    }
    path_ = tmpl;
  }
  ~WorkDir() {
    if (!path_.empty()) RemoveAll(path_);
  }
  WorkDir(const WorkDir&) = delete;
  WorkDir& operator=(const WorkDir&) = delete;

  bool Valid() const { return !path_.empty(); }
  const fs::path& Path() const { return path_; }
};

void AppendCapped(std::string& buf, const std::string& data) {
  if (buf.size() >= RunnerService::kMaxAggregateBytes) return;
  buf += Utf8Prefix(data, RunnerService::kMaxAggregateBytes - buf.size());
}

TestOutcome ErrorOutcome(const TestCase& test, Backend backend, const std::string& error) {
  TestOutcome ret;
  ret.test_case_id = test.id;
  ret.status = TestStatus::ERROR;
  ret.runtime_ms = 0;
  ret.error = error;
  ret.points_awarded = 0;
  ret.backend = backend;
  return ret;
}

std::string InterpreterMissing(Language lang) {
  return std::string(LanguageDisplayName(lang)) + " interpreter not found on host";
}

} // namespace

TestOutcome ScoreTest(const TestCase& test, const ProcessResult& res) {
  TestOutcome ret;
  ret.test_case_id = test.id;
  ret.runtime_ms = res.duration_ms;
  ret.output = Trim(res.stdout_data);
  ret.points_awarded = 0;
  ret.backend = Backend::LOCAL;
  std::string err = Trim(res.stderr_data);
  if (res.timed_out) {
    ret.status = TestStatus::ERROR;
    ret.error = "Time limit exceeded (" + std::to_string(test.timeout_ms) + " ms)";
  } else if (res.exit_code != 0) {
    ret.status = TestStatus::ERROR;
    ret.error = err.size() ? err : "Process exited with code " + std::to_string(res.exit_code);
  } else if (ret.output == Trim(test.expected_output)) {
    ret.status = TestStatus::PASSED;
    ret.points_awarded = test.points;
  } else {
    ret.status = TestStatus::FAILED;
    if (err.size()) ret.error = err;
  }
  return ret;
}

RunnerService::RunnerService(CapabilityProbe& probe, Runner& process_runner, Runner& container_runner,
                             ExecutionMode mode, fs::path work_root) :
    probe_(probe), process_runner_(process_runner), container_runner_(container_runner),
    mode_(mode), work_root_(std::move(work_root)) {}

ExecutionPlan RunnerService::Plan() {
  bool available = mode_ != ExecutionMode::LOCAL && probe_.ContainerRuntimeAvailable();
  if (!available && mode_ == ExecutionMode::CONTAINER) {
    spdlog::warn("Container runtime unavailable; falling back to local process execution");
  } else if (!available && mode_ == ExecutionMode::AUTO) {
    spdlog::debug("Container runtime unavailable; using local process execution");
  }
  return ExecutionPlan::Build(mode_, available);
}

ProcessResult RunnerService::Execute(Backend backend, Language lang, const fs::path& dir,
                                     const std::string& interpreter, const std::string& input,
                                     long timeout_ms, long memory_mb) {
  RunRequest req;
  req.args = {LanguageFileName(lang)};
  req.input = input;
  req.timeout_ms = timeout_ms;
  req.workdir = dir;
  switch (backend) {
    case Backend::CONTAINER:
      req.command = ContainerInterpreter(lang);
      req.image = LanguageImage(lang);
      req.memory_mb = memory_mb;
      return container_runner_.Run(req);
    case Backend::LOCAL:
      req.command = interpreter;
      return process_runner_.Run(req);
  }
  __builtin_unreachable();
}

// The program can print anything and exit with any status, so its output is never consulted
bool RunnerService::ContainerRuntimeFailed(Language lang, const ProcessResult& res) {
  if (res.timed_out || res.exit_code != ContainerRunner::kRuntimeErrorCode) return false;
  return !probe_.ContainerImageUsable(LanguageImage(lang));
}

std::optional<RunResult> RunnerService::RunCode(
    Language lang, const std::string& code, const std::vector<TestCase>& tests) {
  if (tests.empty()) return std::nullopt;
  if (!IsLocalLanguage(lang)) {
    throw ValidationError(std::string(LanguageDisplayName(lang)) + " cannot be judged by the local runners");
  }
  ExecutionPlan plan = Plan();
  WorkDir dir(work_root_);
  bool prepared = dir.Valid() && WriteFile(dir.Path() / LanguageFileName(lang), code);
  spdlog::info("Running {} tests for {} on {}", tests.size(), LanguageName(lang), BackendName(plan.Current()));

  RunResult ret{};
  for (const TestCase& orig : tests) {
    TestCase test = orig;
    if (test.timeout_ms <= 0) test.timeout_ms = kDefaultTimeoutMs;
    if (test.memory_mb <= 0) test.memory_mb = kDefaultMemoryMb;
    TestOutcome outcome;
    while (true) {
      Backend backend = plan.Current();
      std::optional<std::string> interpreter;
      if (backend == Backend::LOCAL) interpreter = probe_.Interpreter(lang);
      bool runtime_failed = false;
      if (!prepared) {
        outcome = ErrorOutcome(test, backend, "Failed to prepare sandbox working directory");
      } else if (backend == Backend::LOCAL && !interpreter) {
        outcome = ErrorOutcome(test, backend, InterpreterMissing(lang));
      } else {
        ProcessResult res = Execute(backend, lang, dir.Path(), interpreter.value_or(""),
                                    test.input, test.timeout_ms, test.memory_mb);
        outcome = ScoreTest(test, res);
        outcome.backend = backend;
        AppendCapped(ret.stdout_data, res.stdout_data);
        AppendCapped(ret.stderr_data, res.stderr_data);
        ret.runtime_ms += outcome.runtime_ms;
        if (backend == Backend::CONTAINER) {
          ret.memory_mb = std::max(ret.memory_mb, test.memory_mb);
          runtime_failed = ContainerRuntimeFailed(lang, res);
        }
      }
      if (runtime_failed && plan.Fallback()) {
        spdlog::warn("Container backend failed on test {} ({}); continuing on {}",
                     test.id, outcome.error.value_or(""), BackendName(plan.Current()));
        continue;
      }
      break;
    }
    spdlog::debug("Test {}: {} {}ms", test.id, TestStatusName(outcome.status), outcome.runtime_ms);
    ret.tests.push_back(std::move(outcome));
  }
  return ret;
}

AdhocResult RunnerService::RunAdhoc(Language lang, const std::string& code, const std::string& input,
                                    long timeout_ms, long memory_mb) {
  if (!IsLocalLanguage(lang)) {
    throw ValidationError(std::string(LanguageDisplayName(lang)) + " cannot run on the local runners");
  }
  ExecutionPlan plan = Plan();
  WorkDir dir(work_root_);
  bool prepared = dir.Valid() && WriteFile(dir.Path() / LanguageFileName(lang), code);

  AdhocResult ret{};
  while (true) {
    Backend backend = plan.Current();
    ret.backend = backend;
    std::optional<std::string> interpreter;
    if (backend == Backend::LOCAL) interpreter = probe_.Interpreter(lang);
    if (!prepared || (backend == Backend::LOCAL && !interpreter)) {
      ret.stdout_data.clear();
      ret.stderr_data = prepared ? InterpreterMissing(lang) : "Failed to prepare sandbox working directory";
      ret.exit_code = ProcessRunner::kExecFailureCode;
      ret.timed_out = false;
      ret.runtime_ms = 0;
      ret.memory_mb = 0;
      ret.infrastructure_error = true;
      return ret;
    }
    ProcessResult res = Execute(backend, lang, dir.Path(), interpreter.value_or(""), input, timeout_ms, memory_mb);
    ret.stdout_data = std::move(res.stdout_data);
    ret.stderr_data = std::move(res.stderr_data);
    ret.exit_code = res.exit_code;
    ret.timed_out = res.timed_out;
    ret.runtime_ms = res.duration_ms;
    ret.memory_mb = backend == Backend::CONTAINER ? memory_mb : 0;
    if (backend == Backend::CONTAINER) {
      ret.infrastructure_error = ContainerRuntimeFailed(lang, res);
    } else {
      // reported only; a local failure never changes the backend
      ret.infrastructure_error = !res.timed_out && res.exit_code == ProcessRunner::kExecFailureCode &&
                                 IsInfrastructureErrorText(ret.stderr_data);
    }
    if (ret.infrastructure_error && backend == Backend::CONTAINER && plan.Fallback()) {
      spdlog::warn("Container backend failed ({}); retrying on {}", Trim(ret.stderr_data), BackendName(plan.Current()));
      continue;
    }
    return ret;
  }
}
