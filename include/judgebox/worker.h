#ifndef INCLUDE_JUDGEBOX_WORKER_H_
#define INCLUDE_JUDGEBOX_WORKER_H_

#include <atomic>

#include "database.h"
#include "judge.h"
#include "queue.h"
#include "scoring.h"
#include "submission.h"

constexpr char kNotJudgeReadyMessage[] =
    "Challenge is not judge-ready for selected language. Configure tests and baseline first.";
constexpr char kCannotExecuteMessage[] = "Judge cannot execute: missing tests or baseline.";

class JudgeWorker {
 public:
  static constexpr long kDequeueWaitMs = 1000;
  // well under SqliteWorkQueue::kDefaultLeaseMs
  static constexpr long kLeaseRenewMs = 10000;

  JudgeWorker(Database& db, WorkQueue& queue, JudgeService& judge, ScoringEngine& scoring,
              long lease_renew_ms = kLeaseRenewMs);

  // Judges one job and records the outcome on the Run and Submission.
  // Configuration problems return normally. Throws InfrastructureError when the sandbox
  // was unusable for every test, and rethrows anything else after recording it.
  void ProcessJob(const JudgeJob&);

  // Takes at most one job from the queue; returns whether a job was handled
  bool WorkOnce(long wait_ms);
  // until Stop()
  void WorkLoop();
  void Stop() { stop_ = true; }

 private:
  Database& db_;
  WorkQueue& queue_;
  JudgeService& judge_;
  ScoringEngine& scoring_;
  long lease_renew_ms_;
  std::atomic_bool stop_;
};

#endif  // INCLUDE_JUDGEBOX_WORKER_H_
