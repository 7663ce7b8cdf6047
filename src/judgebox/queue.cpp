#include "judgebox/queue.h"

#include <chrono>
#include <thread>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "judgebox/errors.h"
#include "judgebox/utils.h"

namespace {

constexpr char kWaiting[] = "waiting";
constexpr char kActive[] = "active";
constexpr char kCompleted[] = "completed";
constexpr char kFailed[] = "failed";
constexpr char kLeaseExpired[] = "Job lease expired";

// at most 2^kMaxBackoffShift times the base delay
constexpr int kMaxBackoffShift = 20;

} // namespace

SqliteWorkQueue::SqliteWorkQueue(const fs::path& path, long lease_ms) : lease_ms_(std::max(1L, lease_ms)) {
  if (path.has_parent_path()) CreateDirs(path.parent_path());
  db_ = std::make_unique<Storage>(InitQueueStorage(path.string()));
  db_->open_forever();
  db_->busy_timeout(5000);
}

int64_t SqliteWorkQueue::Enqueue(const JudgeJob& job, const JobOptions& opts) {
  int64_t now = NowMs();
  JobRow row{0, job.Serialize(), kWaiting, 0, std::max(1, opts.attempts), opts.backoff_ms,
             opts.remove_on_complete, std::max(0, opts.keep_failed), now, now, std::nullopt, std::nullopt, std::nullopt};
  int64_t id;
  {
    std::lock_guard lck(mtx_);
    id = db_->insert(row);
  }
  cv_.notify_all();
  spdlog::info("Enqueued judge job {} for submission {}", id, job.submission_id);
  return id;
}

void SqliteWorkQueue::ReclaimExpired(int64_t now) {
  using namespace sqlite_orm;
  db_->update_all(set(c(&JobRow::state) = std::string(kWaiting),
                      c(&JobRow::attempts_made) = c(&JobRow::attempts_made) + 1,
                      c(&JobRow::available_at) = now,
                      c(&JobRow::last_error) = std::string(kLeaseExpired)),
                  where(c(&JobRow::state) == std::string(kActive) && c(&JobRow::lease_until) < now));
  int reclaimed = db_->changes();
  if (!reclaimed) return;
  // out of attempts; retryable failures never wait with attempts_made >= max_attempts
  db_->update_all(set(c(&JobRow::state) = std::string(kFailed), c(&JobRow::finished_at) = now),
                  where(c(&JobRow::state) == std::string(kWaiting) &&
                        c(&JobRow::attempts_made) >= c(&JobRow::max_attempts)));
  spdlog::warn("Reclaimed {} judge jobs with expired leases, {} of them out of attempts",
               reclaimed, db_->changes());
}

std::optional<QueuedJob> SqliteWorkQueue::TryClaim() {
  using namespace sqlite_orm;
  ReclaimExpired(NowMs());
  while (true) {
    auto ids = db_->select(&JobRow::id,
        where(c(&JobRow::state) == std::string(kWaiting) && c(&JobRow::available_at) <= NowMs()),
        multi_order_by(order_by(&JobRow::available_at), order_by(&JobRow::id)), limit(1));
    if (ids.empty()) return std::nullopt;
    int64_t id = ids[0];
    // conditional on the state so only one claimer wins, even across processes
    db_->update_all(set(c(&JobRow::state) = std::string(kActive), c(&JobRow::lease_until) = NowMs() + lease_ms_),
                    where(c(&JobRow::id) == id && c(&JobRow::state) == std::string(kWaiting)));
    if (db_->changes() != 1) continue;
    auto row = db_->get<JobRow>(id);
    return QueuedJob{row.id, row.payload, row.attempts_made};
  }
}

std::optional<QueuedJob> SqliteWorkQueue::Dequeue(long wait_ms) {
  const int64_t deadline = MonotonicMs() + std::max(0L, wait_ms);
  std::unique_lock lck(mtx_);
  while (true) {
    if (auto job = TryClaim()) return job;
    int64_t remaining = deadline - MonotonicMs();
    if (remaining <= 0) return std::nullopt;
    // other processes cannot notify us; poll as well
    cv_.wait_for(lck, std::chrono::milliseconds(std::min<int64_t>(remaining, kPollIntervalMs)));
  }
}

void SqliteWorkQueue::Complete(const QueuedJob& job) {
  std::lock_guard lck(mtx_);
  auto row = db_->get_pointer<JobRow>(job.id);
  if (!row) return;
  if (row->remove_on_complete) {
    db_->remove<JobRow>(job.id);
  } else {
    row->state = kCompleted;
    row->finished_at = NowMs();
    db_->update(*row);
  }
}

void SqliteWorkQueue::Fail(const QueuedJob& job, const std::string& error, bool retryable) {
  using namespace sqlite_orm;
  bool requeued = false;
  {
    std::lock_guard lck(mtx_);
    auto row = db_->get_pointer<JobRow>(job.id);
    if (!row) return;
    row->attempts_made++;
    row->last_error = error;
    int64_t now = NowMs();
    if (retryable && row->attempts_made < row->max_attempts) {
      int shift = std::min(row->attempts_made - 1, kMaxBackoffShift);
      int64_t delay = row->backoff_ms * (int64_t(1) << shift);
      row->state = kWaiting;
      row->available_at = now + delay;
      db_->update(*row);
      requeued = true;
      spdlog::info("Judge job {} failed (attempt {}/{}), retrying in {}ms: {}",
                   job.id, row->attempts_made, row->max_attempts, delay, error);
    } else {
      row->state = kFailed;
      row->finished_at = now;
      db_->update(*row);
      spdlog::warn("Judge job {} failed permanently after {} attempts: {}", job.id, row->attempts_made, error);
      auto ids = db_->select(&JobRow::id, where(c(&JobRow::state) == std::string(kFailed)),
                             multi_order_by(order_by(&JobRow::finished_at).desc(), order_by(&JobRow::id).desc()));
      if (ids.size() > (size_t)row->keep_failed) {
        std::vector<int64_t> stale(ids.begin() + row->keep_failed, ids.end());
        db_->remove_all<JobRow>(where(in(&JobRow::id, stale)));
      }
    }
  }
  if (requeued) cv_.notify_all();
}

void SqliteWorkQueue::Renew(const QueuedJob& job) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  db_->update_all(set(c(&JobRow::lease_until) = NowMs() + lease_ms_),
                  where(c(&JobRow::id) == job.id && c(&JobRow::state) == std::string(kActive)));
}

bool SqliteWorkQueue::Remove(int64_t id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  db_->remove_all<JobRow>(where(c(&JobRow::id) == id && c(&JobRow::state) == std::string(kWaiting)));
  return db_->changes() == 1;
}

JobCounts SqliteWorkQueue::Counts() {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  int64_t now = NowMs();
  JobCounts ret;
  ret.waiting = db_->count<JobRow>(
      where(c(&JobRow::state) == std::string(kWaiting) && c(&JobRow::available_at) <= now));
  ret.delayed = db_->count<JobRow>(
      where(c(&JobRow::state) == std::string(kWaiting) && c(&JobRow::available_at) > now));
  ret.active = db_->count<JobRow>(where(c(&JobRow::state) == std::string(kActive)));
  ret.failed = db_->count<JobRow>(where(c(&JobRow::state) == std::string(kFailed)));
  return ret;
}

std::optional<std::string> SqliteWorkQueue::LastError(int64_t id) {
  std::lock_guard lck(mtx_);
  auto row = db_->get_pointer<JobRow>(id);
  if (!row) return std::nullopt;
  return row->last_error;
}

int64_t DisabledWorkQueue::Enqueue(const JudgeJob&, const JobOptions&) {
  throw ConfigurationError("Judge queue is disabled");
}

std::optional<QueuedJob> DisabledWorkQueue::Dequeue(long wait_ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(std::max(0L, wait_ms)));
  return std::nullopt;
}
