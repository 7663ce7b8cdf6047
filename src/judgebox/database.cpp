#include "judgebox/database.h"

#include <spdlog/spdlog.h>
#include "judgebox/utils.h"

namespace {

SubmissionRow ToRow(const Submission& sub) {
  SubmissionRow row;
  row.id = sub.id;
  row.challenge_id = sub.challenge_id;
  row.user_id = sub.user_id;
  row.session_id = sub.session_id;
  row.code = sub.code;
  row.language = LanguageName(sub.language);
  row.status = SubmissionStatusName(sub.status);
  row.judge_status = JudgeStatusName(sub.judge_status);
  row.judge_error = sub.judge_error;
  row.judge_run_id = sub.judge_run_id;
  row.score = sub.score;
  row.trust_score = sub.trust_score;
  row.trust_level = sub.trust_level;
  row.created_at = 0;
  return row;
}

Submission FromRow(const SubmissionRow& row) {
  Submission sub;
  sub.id = row.id;
  sub.challenge_id = row.challenge_id;
  sub.user_id = row.user_id;
  sub.session_id = row.session_id;
  sub.code = row.code;
  sub.language = NormalizeLanguage(row.language);
  sub.status = GetSubmissionStatus(row.status);
  sub.judge_status = GetJudgeStatus(row.judge_status);
  sub.judge_error = row.judge_error;
  sub.judge_run_id = row.judge_run_id;
  sub.score = row.score;
  sub.trust_score = row.trust_score;
  sub.trust_level = row.trust_level;
  return sub;
}

RunRow ToRow(const Run& run) {
  RunRow row;
  row.id = run.id;
  row.submission_id = run.submission_id;
  row.language = LanguageName(run.language);
  row.status = RunStatusName(run.status);
  row.score_correctness = run.score_correctness;
  row.score_efficiency = run.score_efficiency;
  row.score_style = run.score_style;
  row.test_passed = run.test_passed;
  row.test_total = run.test_total;
  row.runtime_ms = run.runtime_ms;
  row.memory_mb = run.memory_mb;
  row.error_message = run.error_message;
  row.started_at = run.started_at;
  row.finished_at = run.finished_at;
  return row;
}

Run FromRow(const RunRow& row) {
  Run run;
  run.id = row.id;
  run.submission_id = row.submission_id;
  run.language = NormalizeLanguage(row.language);
  run.status = GetRunStatus(row.status);
  run.score_correctness = row.score_correctness;
  run.score_efficiency = row.score_efficiency;
  run.score_style = row.score_style;
  run.test_passed = row.test_passed;
  run.test_total = row.test_total;
  run.runtime_ms = row.runtime_ms;
  run.memory_mb = row.memory_mb;
  run.error_message = row.error_message;
  run.started_at = row.started_at;
  run.finished_at = row.finished_at;
  return run;
}

} // namespace

Database::Database(const fs::path& path) : path_(path.string()) {}

void Database::Init() {
  if (db_) return;
  spdlog::debug("Open database {}", path_);
  if (path_ != ":memory:" && fs::path(path_).has_parent_path()) CreateDirs(fs::path(path_).parent_path());
  db_ = std::make_unique<Storage>(InitStorage(path_));
  db_->open_forever();
  db_->busy_timeout(5000);
}

void Database::InsertSubmission(const Submission& sub) {
  std::lock_guard lck(mtx_);
  Init();
  SubmissionRow row = ToRow(sub);
  row.created_at = NowMs();
  db_->replace(row);
}

std::optional<Submission> Database::GetSubmission(const std::string& id) {
  std::lock_guard lck(mtx_);
  Init();
  auto row = db_->get_pointer<SubmissionRow>(id);
  if (!row) return std::nullopt;
  return FromRow(*row);
}

bool Database::UpdateSubmission(const Submission& sub) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  auto old = db_->get_pointer<SubmissionRow>(sub.id);
  if (!old) return false;
  SubmissionRow row = ToRow(sub);
  row.created_at = old->created_at;
  db_->update(row);
  return true;
}

int64_t Database::CreateRun(const Run& run) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  int64_t id = 0;
  db_->transaction([&] {
    db_->update_all(
        set(c(&RunRow::status) = std::string(RunStatusName(RunStatus::FAILED)),
            c(&RunRow::error_message) = std::string("Superseded by a newer judge run"),
            c(&RunRow::finished_at) = NowMs()),
        where(c(&RunRow::submission_id) == run.submission_id &&
              c(&RunRow::status) == std::string(RunStatusName(RunStatus::RUNNING))));
    id = db_->insert(ToRow(run));
    return true;
  });
  return id;
}

bool Database::UpdateRun(const Run& run) {
  std::lock_guard lck(mtx_);
  Init();
  if (!db_->get_pointer<RunRow>(run.id)) return false;
  db_->update(ToRow(run));
  return true;
}

void Database::InsertRunTests(int64_t run_id, const std::vector<RunTest>& tests) {
  std::lock_guard lck(mtx_);
  Init();
  db_->transaction([&] {
    for (auto& test : tests) {
      RunTestRow row;
      row.id = 0;
      row.run_id = run_id;
      row.test_case_id = test.test_case_id;
      row.status = TestStatusName(test.status);
      row.runtime_ms = test.runtime_ms;
      row.output = Utf8Prefix(test.output, kMaxPersistedText);
      if (test.error) row.error = Utf8Prefix(*test.error, kMaxPersistedText);
      row.points_awarded = test.points_awarded;
      db_->insert(row);
    }
    return true;
  });
}

std::optional<Run> Database::GetRunDetails(int64_t run_id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  auto row = db_->get_pointer<RunRow>(run_id);
  if (!row) return std::nullopt;
  Run run = FromRow(*row);
  for (auto& i : db_->get_all<RunTestRow>(where(c(&RunTestRow::run_id) == run_id), order_by(&RunTestRow::id))) {
    RunTest test;
    test.run_id = i.run_id;
    test.test_case_id = i.test_case_id;
    test.status = GetTestStatus(i.status);
    test.runtime_ms = i.runtime_ms;
    test.output = i.output;
    test.error = i.error;
    test.points_awarded = i.points_awarded;
    run.tests.push_back(std::move(test));
  }
  return run;
}

std::vector<Run> Database::ListRuns(const std::string& submission_id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  std::vector<Run> ret;
  for (auto& i : db_->get_all<RunRow>(where(c(&RunRow::submission_id) == submission_id),
                                       order_by(&RunRow::id).desc())) {
    ret.push_back(FromRow(i));
  }
  return ret;
}

void Database::UpsertTestCase(const std::string& challenge_id, const TestCase& test) {
  std::lock_guard lck(mtx_);
  Init();
  db_->replace(TestCaseRow{test.id, challenge_id, test.input, test.expected_output,
                           test.timeout_ms, test.memory_mb, test.points, test.order_index});
}

void Database::UpsertBaseline(const Baseline& baseline) {
  std::lock_guard lck(mtx_);
  Init();
  db_->replace(BaselineRow{baseline.challenge_id, LanguageName(baseline.language), baseline.runtime_ms});
}

std::vector<TestCase> Database::GetTestCases(const std::string& challenge_id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  std::vector<TestCase> ret;
  for (auto& i : db_->get_all<TestCaseRow>(where(c(&TestCaseRow::challenge_id) == challenge_id),
                                            multi_order_by(order_by(&TestCaseRow::order_index),
                                                           order_by(&TestCaseRow::id)))) {
    ret.push_back({i.id, i.input, i.expected_output, (long)i.timeout_ms, (long)i.memory_mb, i.points, i.order_index});
  }
  return ret;
}

std::optional<Baseline> Database::GetBaseline(const std::string& challenge_id, Language lang) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  auto rows = db_->get_all<BaselineRow>(where(c(&BaselineRow::challenge_id) == challenge_id &&
                                              c(&BaselineRow::language) == std::string(LanguageName(lang))));
  if (rows.empty()) return std::nullopt;
  return Baseline{challenge_id, lang, (long)rows[0].runtime_ms};
}
