#include "judgebox/dispatcher.h"

#include <atomic>
#include <chrono>
#include <random>
#include <thread>
#include <condition_variable>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "judgebox/config.h"
#include "judgebox/errors.h"

namespace {

std::string GenerateSubmissionId() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return fmt::format("{:016x}{:016x}", rng(), rng());
}

} // namespace

struct Dispatcher::PendingEnqueue {
  std::mutex mtx;
  std::condition_variable cv;
  bool finished = false; // Enqueue returned or threw
  bool abandoned = false; // the caller gave up waiting
  std::optional<int64_t> job_id;
  std::string error;
  std::atomic_bool exited = false;
};

Dispatcher::Dispatcher(Database& db, WorkQueue& queue, long enqueue_timeout_ms,
                       JobOptions opts, ProctoringGate gate) :
    db_(db), queue_(queue), enqueue_timeout_ms_(enqueue_timeout_ms),
    opts_(opts), gate_(std::move(gate)) {}

Dispatcher::~Dispatcher() {
  std::lock_guard lck(pending_mtx_);
  if (pending_.size()) spdlog::info("Waiting for {} outstanding judge enqueues", pending_.size());
  for (auto& i : pending_) i.first.join();
}

void Dispatcher::ReapPending() {
  std::lock_guard lck(pending_mtx_);
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (it->second->exited) {
      it->first.join();
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
}

void Dispatcher::Enqueue(Submission& sub) {
  ReapPending();
  JudgeJob job = JudgeJob::FromSubmission(sub);
  auto state = std::make_shared<PendingEnqueue>();
  // a hung broker must not block the caller; the thread is joined by the destructor
  std::thread thread([state, &queue = queue_, job, opts = opts_]() {
    std::optional<int64_t> job_id;
    std::string error;
    try {
      job_id = queue.Enqueue(job, opts);
    } catch (const std::exception& err) {
      error = err.what();
    }
    bool abandoned;
    {
      std::lock_guard lck(state->mtx);
      state->finished = true;
      state->job_id = job_id;
      state->error = error;
      abandoned = state->abandoned;
    }
    state->cv.notify_all();
    if (abandoned && job_id) {
      // the submission was already failed; do not judge it behind the caller's back
      try {
        if (queue.Remove(*job_id)) {
          spdlog::warn("Removed judge job {} of submission {}: enqueue finished after its deadline",
                       *job_id, job.submission_id);
        } else {
          spdlog::warn("Judge job {} of submission {} finished enqueueing after its deadline "
                       "and was already claimed", *job_id, job.submission_id);
        }
      } catch (const std::exception& err) {
        spdlog::error("Failed removing late judge job {}: {}", *job_id, err.what());
      }
    }
    state->exited = true;
  });
  {
    std::lock_guard lck(pending_mtx_);
    pending_.emplace_back(std::move(thread), state);
  }

  std::string reason;
  {
    std::unique_lock lck(state->mtx);
    if (!state->cv.wait_for(lck, std::chrono::milliseconds(enqueue_timeout_ms_), [&]() { return state->finished; })) {
      state->abandoned = true;
      reason = fmt::format("timed out after {}ms", enqueue_timeout_ms_);
    } else if (state->job_id) {
      spdlog::info("Submission {} queued as job {}", sub.id, *state->job_id);
      return;
    } else {
      reason = state->error;
    }
  }
  spdlog::error("Failed to enqueue submission {}: {}", sub.id, reason);
  sub.status = SubmissionStatus::FAILED;
  sub.judge_status = JudgeStatus::FAILED;
  sub.judge_error = "Failed to enqueue judge job: " + reason;
  db_.UpdateSubmission(sub);
}

Submission Dispatcher::Submit(const NewSubmission& req) {
  Language lang = NormalizeLanguage(req.language);
  if (!IsLocalLanguage(lang)) {
    throw ValidationError(fmt::format("{} submissions cannot be judged", LanguageDisplayName(lang)));
  }
  if (req.code.size() > (size_t)kMaxCodeBytes) {
    throw ValidationError(fmt::format("code payload exceeds {} bytes", kMaxCodeBytes));
  }
  if (gate_ && !gate_(req.user_id, req.session_id)) {
    throw ValidationError("Submission rejected by proctoring check");
  }
  Submission sub;
  sub.id = req.id.empty() ? GenerateSubmissionId() : req.id;
  sub.challenge_id = req.challenge_id;
  sub.user_id = req.user_id;
  sub.session_id = req.session_id;
  sub.code = req.code;
  sub.language = lang;
  sub.status = SubmissionStatus::PENDING;
  sub.judge_status = JudgeStatus::QUEUED;
  db_.InsertSubmission(sub);
  Enqueue(sub);
  return sub;
}

Submission Dispatcher::RetrySubmission(const std::string& submission_id) {
  auto sub = db_.GetSubmission(submission_id);
  if (!sub) throw ValidationError("Submission " + submission_id + " not found");
  spdlog::info("Retrying judge of submission {} (was {}/{})", submission_id,
               SubmissionStatusName(sub->status), JudgeStatusName(sub->judge_status));
  sub->status = SubmissionStatus::PENDING;
  sub->judge_status = JudgeStatus::QUEUED;
  sub->judge_error.reset();
  db_.UpdateSubmission(*sub);
  Enqueue(*sub);
  return *sub;
}

Submission Dispatcher::RetryRun(int64_t run_id) {
  auto run = db_.GetRunDetails(run_id);
  if (!run) throw ValidationError("Run " + std::to_string(run_id) + " not found");
  return RetrySubmission(run->submission_id);
}
