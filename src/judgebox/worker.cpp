#include "judgebox/worker.h"

#include <mutex>
#include <chrono>
#include <thread>
#include <algorithm>
#include <condition_variable>

#include <spdlog/spdlog.h>
#include "judgebox/errors.h"
#include "judgebox/utils.h"

namespace {

// Renews the lease of a claimed job until destroyed
class LeaseKeeper {
  WorkQueue& queue_;
  QueuedJob job_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool done_;
  std::thread thread_;

 public:
  LeaseKeeper(WorkQueue& queue, const QueuedJob& job, long interval_ms) :
      queue_(queue), job_(job), done_(false), thread_([this, interval_ms]() {
        std::unique_lock lck(mtx_);
        while (!cv_.wait_for(lck, std::chrono::milliseconds(interval_ms), [this]() { return done_; })) {
          lck.unlock();
          try {
            queue_.Renew(job_);
          } catch (const std::exception& err) {
            spdlog::warn("Failed renewing lease of judge job {}: {}", job_.id, err.what());
          }
          lck.lock();
        }
      }) {}
  ~LeaseKeeper() {
    {
      std::lock_guard lck(mtx_);
      done_ = true;
    }
    cv_.notify_all();
    thread_.join();
  }
  LeaseKeeper(const LeaseKeeper&) = delete;
  LeaseKeeper& operator=(const LeaseKeeper&) = delete;
};

} // namespace

JudgeWorker::JudgeWorker(Database& db, WorkQueue& queue, JudgeService& judge, ScoringEngine& scoring,
                         long lease_renew_ms) :
    db_(db), queue_(queue), judge_(judge), scoring_(scoring),
    lease_renew_ms_(std::max(1L, lease_renew_ms)), stop_(false) {}

void JudgeWorker::ProcessJob(const JudgeJob& job) {
  auto sub = db_.GetSubmission(job.submission_id);
  if (!sub) throw ValidationError("Submission " + job.submission_id + " not found");
  spdlog::info("Judging submission {} (challenge {}, {})", job.submission_id, job.challenge_id,
               LanguageName(job.language));
  sub->judge_status = JudgeStatus::RUNNING;
  sub->judge_error.reset();
  db_.UpdateSubmission(*sub);

  Run run;
  run.submission_id = job.submission_id;
  run.language = job.language;
  run.status = RunStatus::RUNNING;
  run.started_at = NowMs();
  run.id = db_.CreateRun(run);
  sub->judge_run_id = run.id;
  db_.UpdateSubmission(*sub);

  // set once the run, the score and the submission are all written
  bool finalized = false;
  bool recorded = false;
  auto fail = [&](const std::string& msg) {
    spdlog::warn("Judge run {} of submission {} failed: {}", run.id, job.submission_id, msg);
    // also a run already marked completed when a later step threw
    run.status = RunStatus::FAILED;
    run.score_correctness = run.score_efficiency = run.score_style = 0;
    run.test_passed = 0;
    run.error_message = msg;
    run.finished_at = NowMs();
    db_.UpdateRun(run);
    // the scoring engine may have touched the row
    if (auto cur = db_.GetSubmission(job.submission_id)) sub = std::move(cur);
    sub->status = SubmissionStatus::FAILED;
    sub->judge_status = JudgeStatus::FAILED;
    sub->judge_error = msg;
    sub->judge_run_id = run.id;
    sub->score.reset();
    sub->trust_score.reset();
    sub->trust_level.reset();
    db_.UpdateSubmission(*sub);
    recorded = true;
  };

  try {
    if (!judge_.IsJudgeReady(job.challenge_id, job.language)) {
      fail(kNotJudgeReadyMessage);
      return;
    }
    auto result = judge_.RunTests(job.challenge_id, job.language, job.code);
    if (!result) {
      fail(kCannotExecuteMessage);
      return;
    }
    run.test_total = result->test_total;
    run.runtime_ms = result->runtime_ms;
    run.memory_mb = result->memory_mb;
    if (result->infrastructure_error) {
      std::string msg = *result->infrastructure_error;
      fail(msg);
      throw InfrastructureError(msg);
    }

    std::vector<RunTest> tests;
    for (auto& i : result->tests) {
      tests.push_back({run.id, i.test_case_id, i.status, i.runtime_ms, i.output, i.error, i.points_awarded});
    }
    db_.InsertRunTests(run.id, tests);
    run.status = RunStatus::COMPLETED;
    run.score_correctness = result->correctness;
    run.score_efficiency = result->efficiency;
    run.score_style = result->style;
    run.test_passed = result->test_passed;
    run.finished_at = NowMs();
    db_.UpdateRun(run);

    scoring_.FinalizeSubmissionScore(job.submission_id, job.user_id, job.session_id,
                                     {result->correctness, result->efficiency, result->style});
    if (auto cur = db_.GetSubmission(job.submission_id)) {
      cur->judge_status = JudgeStatus::COMPLETED;
      cur->judge_error.reset();
      cur->judge_run_id = run.id;
      db_.UpdateSubmission(*cur);
    }
    finalized = true;
    spdlog::info("Submission {} judged: run {} {}/{} passed", job.submission_id, run.id,
                 run.test_passed, run.test_total);
  } catch (const InfrastructureError& err) {
    if (!recorded) fail(err.what());
    throw;
  } catch (const std::exception& err) {
    if (!finalized) fail(err.what());
    throw;
  }
}

bool JudgeWorker::WorkOnce(long wait_ms) {
  auto queued = queue_.Dequeue(wait_ms);
  if (!queued) return false;
  JudgeJob job;
  try {
    job = JudgeJob::Deserialize(queued->payload);
  } catch (const std::exception& err) {
    spdlog::error("Malformed judge job {}: {}", queued->id, err.what());
    queue_.Fail(*queued, std::string("Malformed job payload: ") + err.what(), false);
    return true;
  }
  try {
    {
      LeaseKeeper lease(queue_, *queued, lease_renew_ms_);
      ProcessJob(job);
    }
    queue_.Complete(*queued);
  } catch (const ValidationError& err) {
    queue_.Fail(*queued, err.what(), false);
  } catch (const ConfigurationError& err) {
    queue_.Fail(*queued, err.what(), false);
  } catch (const std::exception& err) {
    queue_.Fail(*queued, err.what(), true);
  }
  return true;
}

void JudgeWorker::WorkLoop() {
  spdlog::info("Judge worker started");
  while (!stop_) {
    try {
      WorkOnce(kDequeueWaitMs);
    } catch (const std::exception& err) {
      // queue / database trouble; keep serving
      spdlog::error("Judge worker iteration failed: {}", err.what());
      std::this_thread::sleep_for(std::chrono::milliseconds(kDequeueWaitMs));
    }
  }
  spdlog::info("Judge worker stopped");
}
