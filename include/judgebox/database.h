#ifndef INCLUDE_JUDGEBOX_DATABASE_H_
#define INCLUDE_JUDGEBOX_DATABASE_H_

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <sqlite_orm/sqlite_orm.h>
#include "challenge.h"
#include "submission.h"

// Row types; enums are stored by name
struct SubmissionRow {
  std::string id;
  std::string challenge_id;
  std::string user_id;
  std::optional<std::string> session_id;
  std::string code;
  std::string language;
  std::string status;
  std::string judge_status;
  std::optional<std::string> judge_error;
  std::optional<int64_t> judge_run_id;
  std::optional<int> score;
  std::optional<int> trust_score;
  std::optional<std::string> trust_level;
  int64_t created_at;
};

struct RunRow {
  int64_t id;
  std::string submission_id;
  std::string language;
  std::string status;
  int score_correctness;
  int score_efficiency;
  int score_style;
  int test_passed;
  int test_total;
  int64_t runtime_ms;
  int64_t memory_mb;
  std::optional<std::string> error_message;
  int64_t started_at;
  std::optional<int64_t> finished_at;
};

struct RunTestRow {
  int64_t id;
  int64_t run_id;
  std::string test_case_id;
  std::string status;
  int64_t runtime_ms;
  std::string output;
  std::optional<std::string> error;
  int points_awarded;
};

struct TestCaseRow {
  std::string id;
  std::string challenge_id;
  std::string input;
  std::string expected_output;
  int64_t timeout_ms;
  int64_t memory_mb;
  int points;
  int order_index;
};

struct BaselineRow {
  std::string challenge_id;
  std::string language;
  int64_t runtime_ms;
};

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_index("idx_runs_submission", &RunRow::submission_id),
      make_index("idx_run_tests_run", &RunTestRow::run_id),
      make_index("idx_test_cases_challenge_order", &TestCaseRow::challenge_id, &TestCaseRow::order_index),
      make_table("submissions",
                 make_column("id", &SubmissionRow::id, primary_key()),
                 make_column("challenge_id", &SubmissionRow::challenge_id),
                 make_column("user_id", &SubmissionRow::user_id),
                 make_column("session_id", &SubmissionRow::session_id),
                 make_column("code", &SubmissionRow::code),
                 make_column("language", &SubmissionRow::language),
                 make_column("status", &SubmissionRow::status),
                 make_column("judge_status", &SubmissionRow::judge_status),
                 make_column("judge_error", &SubmissionRow::judge_error),
                 make_column("judge_run_id", &SubmissionRow::judge_run_id),
                 make_column("score", &SubmissionRow::score),
                 make_column("trust_score", &SubmissionRow::trust_score),
                 make_column("trust_level", &SubmissionRow::trust_level),
                 make_column("created_at", &SubmissionRow::created_at, default_value(0))),
      make_table("submission_runs",
                 make_column("id", &RunRow::id, primary_key()),
                 make_column("submission_id", &RunRow::submission_id),
                 make_column("language", &RunRow::language),
                 make_column("status", &RunRow::status),
                 make_column("score_correctness", &RunRow::score_correctness, default_value(0)),
                 make_column("score_efficiency", &RunRow::score_efficiency, default_value(0)),
                 make_column("score_style", &RunRow::score_style, default_value(0)),
                 make_column("test_passed", &RunRow::test_passed, default_value(0)),
                 make_column("test_total", &RunRow::test_total, default_value(0)),
                 make_column("runtime_ms", &RunRow::runtime_ms, default_value(0)),
                 make_column("memory_mb", &RunRow::memory_mb, default_value(0)),
                 make_column("error_message", &RunRow::error_message),
                 make_column("started_at", &RunRow::started_at),
                 make_column("finished_at", &RunRow::finished_at)),
      make_table("submission_run_tests",
                 make_column("id", &RunTestRow::id, primary_key()),
                 make_column("run_id", &RunTestRow::run_id),
                 make_column("test_case_id", &RunTestRow::test_case_id),
                 make_column("status", &RunTestRow::status),
                 make_column("runtime_ms", &RunTestRow::runtime_ms),
                 make_column("output", &RunTestRow::output),
                 make_column("error", &RunTestRow::error),
                 make_column("points_awarded", &RunTestRow::points_awarded, default_value(0))),
      make_table("challenge_test_cases",
                 make_column("id", &TestCaseRow::id, primary_key()),
                 make_column("challenge_id", &TestCaseRow::challenge_id),
                 make_column("input", &TestCaseRow::input),
                 make_column("expected_output", &TestCaseRow::expected_output),
                 make_column("timeout_ms", &TestCaseRow::timeout_ms),
                 make_column("memory_mb", &TestCaseRow::memory_mb),
                 make_column("points", &TestCaseRow::points),
                 make_column("order_index", &TestCaseRow::order_index)),
      make_table("challenge_baselines",
                 make_column("challenge_id", &BaselineRow::challenge_id),
                 make_column("language", &BaselineRow::language),
                 make_column("runtime_ms", &BaselineRow::runtime_ms),
                 primary_key(&BaselineRow::challenge_id, &BaselineRow::language)));
  storage.sync_schema(true);
  return storage;
}

// Submission / run store; also serves the read-only authoring tables
class Database : public ChallengeStore {
 public:
  using Storage = decltype(InitStorage(""));
  // RunTest output and error are cut to this many bytes when persisted
  static constexpr size_t kMaxPersistedText = 32000;

 private:
  std::string path_;
  std::unique_ptr<Storage> db_;
  std::mutex mtx_;

  void Init();

 public:
  explicit Database(const std::filesystem::path& path);

  void InsertSubmission(const Submission&);
  std::optional<Submission> GetSubmission(const std::string& id);
  // returns false if the submission does not exist
  bool UpdateSubmission(const Submission&);

  // Inserts a running Run and returns its id. Other running runs of the same
  // submission are failed so that at most one stays running.
  int64_t CreateRun(const Run&);
  bool UpdateRun(const Run&);
  void InsertRunTests(int64_t run_id, const std::vector<RunTest>&);
  // with its tests in insertion order
  std::optional<Run> GetRunDetails(int64_t run_id);
  // newest first, without tests
  std::vector<Run> ListRuns(const std::string& submission_id);

  void UpsertTestCase(const std::string& challenge_id, const TestCase&);
  void UpsertBaseline(const Baseline&);
  std::vector<TestCase> GetTestCases(const std::string& challenge_id) override;
  std::optional<Baseline> GetBaseline(const std::string& challenge_id, Language) override;
};

#endif  // INCLUDE_JUDGEBOX_DATABASE_H_
