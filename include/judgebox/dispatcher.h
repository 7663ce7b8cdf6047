#ifndef INCLUDE_JUDGEBOX_DISPATCHER_H_
#define INCLUDE_JUDGEBOX_DISPATCHER_H_

#include <list>
#include <mutex>
#include <memory>
#include <string>
#include <thread>
#include <optional>
#include <functional>

#include "database.h"
#include "queue.h"
#include "submission.h"

struct NewSubmission {
  std::string id; // generated if empty
  std::string challenge_id;
  std::string user_id;
  std::optional<std::string> session_id;
  std::string code;
  std::string language; // any accepted alias
};

// Creates submissions and hands them to the judge queue
class Dispatcher {
 public:
  // false rejects the submission (e.g. the proctored session was flagged)
  using ProctoringGate = std::function<bool(const std::string& user_id, const std::optional<std::string>& session_id)>;

  // db and queue must outlive the dispatcher
  Dispatcher(Database& db, WorkQueue& queue, long enqueue_timeout_ms,
             JobOptions opts = {}, ProctoringGate gate = nullptr);
  // waits for enqueues that are still running after their deadline
  ~Dispatcher();
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // Throws ValidationError for an unjudgeable language, oversized code or a rejected session.
  // An enqueue failure does not throw; the returned submission is then failed.
  // A job whose enqueue finishes after the deadline is removed again unless a worker already took it.
  Submission Submit(const NewSubmission&);
  // Administrative retry: resets the submission to pending/queued and enqueues a fresh job.
  // Throws ValidationError if the submission / run does not exist.
  Submission RetrySubmission(const std::string& submission_id);
  Submission RetryRun(int64_t run_id);

 private:
  struct PendingEnqueue;

  void Enqueue(Submission&);
  // joins the enqueue threads that have finished
  void ReapPending();

  Database& db_;
  WorkQueue& queue_;
  long enqueue_timeout_ms_;
  JobOptions opts_;
  ProctoringGate gate_;
  std::mutex pending_mtx_;
  std::list<std::pair<std::thread, std::shared_ptr<PendingEnqueue>>> pending_;
};

#endif  // INCLUDE_JUDGEBOX_DISPATCHER_H_
