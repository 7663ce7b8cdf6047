#ifndef INCLUDE_JUDGEBOX_SUBMISSION_H_
#define INCLUDE_JUDGEBOX_SUBMISSION_H_

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <nlohmann/json_fwd.hpp>
#include "language.h"

#define ENUM_SUBMISSION_STATUS_ \
  X(PENDING, "pending") \
  X(GRADED, "graded") \
  X(FAILED, "failed")
enum class SubmissionStatus {
#define X(name, str) name,
  ENUM_SUBMISSION_STATUS_
#undef X
};

#define ENUM_JUDGE_STATUS_ \
  X(QUEUED, "queued") \
  X(RUNNING, "running") \
  X(COMPLETED, "completed") \
  X(FAILED, "failed")
enum class JudgeStatus {
#define X(name, str) name,
  ENUM_JUDGE_STATUS_
#undef X
};

#define ENUM_RUN_STATUS_ \
  X(RUNNING, "running") \
  X(COMPLETED, "completed") \
  X(FAILED, "failed")
enum class RunStatus {
#define X(name, str) name,
  ENUM_RUN_STATUS_
#undef X
};

#define ENUM_TEST_STATUS_ \
  X(PASSED, "passed") \
  X(FAILED, "failed") \
  X(ERROR, "error")
enum class TestStatus {
#define X(name, str) name,
  ENUM_TEST_STATUS_
#undef X
};

class Submission {
 public:
  std::string id;
  std::string challenge_id;
  std::string user_id;
  std::optional<std::string> session_id;
  // immutable once created
  std::string code;
  Language language;

  SubmissionStatus status;
  JudgeStatus judge_status;
  std::optional<std::string> judge_error;
  std::optional<int64_t> judge_run_id;

  // written by the scoring engine
  std::optional<int> score;
  std::optional<int> trust_score;
  std::optional<std::string> trust_level;

  Submission() :
      language(Language::JAVASCRIPT),
      status(SubmissionStatus::PENDING),
      judge_status(JudgeStatus::QUEUED) {}
};

struct RunTest {
  int64_t run_id;
  std::string test_case_id;
  TestStatus status;
  long runtime_ms;
  std::string output;
  std::optional<std::string> error;
  int points_awarded;
};

struct Run {
  int64_t id;
  std::string submission_id;
  Language language;
  RunStatus status;
  int score_correctness, score_efficiency, score_style;
  int test_passed, test_total;
  long runtime_ms;
  long memory_mb;
  std::optional<std::string> error_message;
  int64_t started_at; // UNIX timestamp, milliseconds
  std::optional<int64_t> finished_at;
  std::vector<RunTest> tests; // only filled by Database::GetRunDetails

  Run() :
      id(0), language(Language::JAVASCRIPT), status(RunStatus::RUNNING),
      score_correctness(0), score_efficiency(0), score_style(0),
      test_passed(0), test_total(0), runtime_ms(0), memory_mb(0),
      started_at(0) {}
};

// Queue payload; a snapshot that stays valid even if the submission row changes
struct JudgeJob {
  std::string submission_id;
  std::string challenge_id;
  std::string user_id;
  std::string code;
  Language language;
  std::optional<std::string> session_id;

  static JudgeJob FromSubmission(const Submission&);
  std::string Serialize() const;
  // throws nlohmann::json::exception or ValidationError on malformed payloads
  static JudgeJob Deserialize(const std::string&);
};

const char* SubmissionStatusName(SubmissionStatus);
const char* JudgeStatusName(JudgeStatus);
const char* RunStatusName(RunStatus);
const char* TestStatusName(TestStatus);
SubmissionStatus GetSubmissionStatus(const std::string&);
JudgeStatus GetJudgeStatus(const std::string&);
RunStatus GetRunStatus(const std::string&);
TestStatus GetTestStatus(const std::string&);

#endif  // INCLUDE_JUDGEBOX_SUBMISSION_H_
