#ifndef INCLUDE_JUDGEBOX_JUDGE_H_
#define INCLUDE_JUDGEBOX_JUDGE_H_

#include <string>
#include <vector>
#include <optional>

#include "challenge.h"
#include "runner_service.h"

constexpr char kInfrastructureMessage[] = "Judge infrastructure unavailable (sandbox/runner).";

struct JudgeRunResult {
  std::vector<TestOutcome> tests;
  int correctness; // 0..40
  int efficiency; // 0..15
  int style; // 0..5
  int test_passed;
  int test_total;
  long runtime_ms;
  long memory_mb;
  // set when every test failed because of the sandbox rather than the code
  std::optional<std::string> infrastructure_error;
};

class JudgeService {
 public:
  static constexpr int kMaxCorrectness = 40;
  static constexpr int kMaxEfficiency = 15;
  static constexpr int kMaxStyle = 5;

  JudgeService(ChallengeStore& store, RunnerService& runner, bool enabled);

  // judgeable language, at least one test case and a baseline for the language
  bool IsJudgeReady(const std::string& challenge_id, Language);
  // nullopt if judging is disabled or the challenge is not judge-ready
  std::optional<JudgeRunResult> RunTests(const std::string& challenge_id, Language, const std::string& code);

 private:
  ChallengeStore& store_;
  RunnerService& runner_;
  bool enabled_;
};

int CorrectnessScore(int earned_points, int total_points);
int EfficiencyScore(double mean_runtime_ms, long baseline_ms);
// static heuristics; no execution involved
int StyleScore(Language, const std::string& code);
// "No tests executed" for an empty list; the infrastructure message if every test
// is an error whose text names the sandbox; nullopt otherwise
std::optional<std::string> DetectInfrastructureError(const std::vector<TestOutcome>&);

#endif  // INCLUDE_JUDGEBOX_JUDGE_H_
