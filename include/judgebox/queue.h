#ifndef INCLUDE_JUDGEBOX_QUEUE_H_
#define INCLUDE_JUDGEBOX_QUEUE_H_

#include <mutex>
#include <memory>
#include <string>
#include <optional>
#include <filesystem>
#include <condition_variable>

#include <sqlite_orm/sqlite_orm.h>
#include "submission.h"

struct JobOptions {
  int attempts = 3;
  long backoff_ms = 3000; // exponential: backoff_ms * 2^(attempts_made - 1)
  bool remove_on_complete = true;
  int keep_failed = 50;
};

struct QueuedJob {
  int64_t id;
  std::string payload; // serialized JudgeJob
  int attempts_made; // failures so far
};

struct JobCounts {
  long waiting, active, delayed, failed;
};

class WorkQueue {
 public:
  virtual ~WorkQueue() = default;
  // returns the job id
  virtual int64_t Enqueue(const JudgeJob&, const JobOptions&) = 0;
  // waits up to wait_ms for a job
  virtual std::optional<QueuedJob> Dequeue(long wait_ms) = 0;
  virtual void Complete(const QueuedJob&) = 0;
  // retryable failures go back to waiting with backoff until the attempts are used up
  virtual void Fail(const QueuedJob&, const std::string& error, bool retryable) = 0;
  // keeps a claimed job from being handed to another worker
  virtual void Renew(const QueuedJob&) = 0;
  // drops a job no worker has claimed; false if it is claimed or gone
  virtual bool Remove(int64_t id) = 0;
  virtual JobCounts Counts() = 0;
};

struct JobRow {
  int64_t id;
  std::string payload;
  std::string state; // waiting, active, completed, failed
  int attempts_made;
  int max_attempts;
  int64_t backoff_ms;
  bool remove_on_complete;
  int keep_failed;
  int64_t available_at;
  int64_t created_at;
  std::optional<std::string> last_error;
  std::optional<int64_t> finished_at;
  std::optional<int64_t> lease_until; // while active
};

inline auto InitQueueStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_index("idx_jobs_state_available", &JobRow::state, &JobRow::available_at),
      make_table("judge_jobs",
                 make_column("id", &JobRow::id, primary_key()),
                 make_column("payload", &JobRow::payload),
                 make_column("state", &JobRow::state),
                 make_column("attempts_made", &JobRow::attempts_made, default_value(0)),
                 make_column("max_attempts", &JobRow::max_attempts),
                 make_column("backoff_ms", &JobRow::backoff_ms),
                 make_column("remove_on_complete", &JobRow::remove_on_complete),
                 make_column("keep_failed", &JobRow::keep_failed),
                 make_column("available_at", &JobRow::available_at),
                 make_column("created_at", &JobRow::created_at),
                 make_column("last_error", &JobRow::last_error),
                 make_column("finished_at", &JobRow::finished_at),
                 make_column("lease_until", &JobRow::lease_until)));
  storage.sync_schema(true);
  return storage;
}

// Durable, at-least-once queue in a SQLite file; several processes may share one file.
// A claim holds a lease; a job whose lease runs out (its worker died) is claimable again,
// which uses up one of its attempts.
class SqliteWorkQueue : public WorkQueue {
 public:
  using Storage = decltype(InitQueueStorage(""));
  static constexpr long kPollIntervalMs = 200;
  static constexpr long kDefaultLeaseMs = 60000;

  explicit SqliteWorkQueue(const std::filesystem::path& path, long lease_ms = kDefaultLeaseMs);

  int64_t Enqueue(const JudgeJob&, const JobOptions&) override;
  std::optional<QueuedJob> Dequeue(long wait_ms) override;
  void Complete(const QueuedJob&) override;
  void Fail(const QueuedJob&, const std::string& error, bool retryable) override;
  void Renew(const QueuedJob&) override;
  bool Remove(int64_t id) override;
  JobCounts Counts() override;

  // last error of a job; empty if unknown or removed
  std::optional<std::string> LastError(int64_t id);

 private:
  std::optional<QueuedJob> TryClaim();
  void ReclaimExpired(int64_t now);

  std::unique_ptr<Storage> db_;
  long lease_ms_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

// Used when judging is disabled
class DisabledWorkQueue : public WorkQueue {
 public:
  int64_t Enqueue(const JudgeJob&, const JobOptions&) override;
  std::optional<QueuedJob> Dequeue(long wait_ms) override;
  void Complete(const QueuedJob&) override {}
  void Fail(const QueuedJob&, const std::string&, bool) override {}
  void Renew(const QueuedJob&) override {}
  bool Remove(int64_t) override { return false; }
  JobCounts Counts() override { return {0, 0, 0, 0}; }
};

#endif  // INCLUDE_JUDGEBOX_QUEUE_H_
