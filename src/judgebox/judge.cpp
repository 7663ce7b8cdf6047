#include "judgebox/judge.h"

#include <cmath>
#include <regex>
#include <sstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "judgebox/utils.h"

namespace {

// round half up
inline int RoundHalfUp(double x) {
  return (int)std::floor(x + 0.5);
}

long CountMatches(const std::string& str, const std::regex& re) {
  return std::distance(std::sregex_iterator(str.begin(), str.end(), re), std::sregex_iterator());
}

} // namespace

int CorrectnessScore(int earned_points, int total_points) {
  double ratio = (double)earned_points / std::max(1, total_points);
  return std::clamp(RoundHalfUp(ratio * JudgeService::kMaxCorrectness), 0, JudgeService::kMaxCorrectness);
}

int EfficiencyScore(double mean_runtime_ms, long baseline_ms) {
  double ratio = std::min(2.0, mean_runtime_ms / std::max(1L, baseline_ms));
  return std::clamp(RoundHalfUp(JudgeService::kMaxEfficiency * (2 - ratio)), 0, JudgeService::kMaxEfficiency);
}

int StyleScore(Language lang, const std::string& code) {
  static const std::regex kPlaceholder("todo|fixme|placeholder|write your solution here|implement me",
                                       std::regex::icase);
  static const std::regex kJsFunction("\\bfunction\\b|=>");
  static const std::regex kJsPrint("console\\.log");
  static const std::regex kPyFunction("\\bdef\\s+\\w+\\s*\\(");
  static const std::regex kPyPrint("\\bprint\\s*\\(");

  std::string trimmed = Trim(code);
  if (trimmed.empty()) return 0;
  int score = JudgeService::kMaxStyle;
  if (std::regex_search(trimmed, kPlaceholder)) score -= 2;

  int long_lines = 0;
  std::istringstream lines(trimmed);
  for (std::string line; std::getline(lines, line);) {
    if (line.size() && line.back() == '\r') line.pop_back();
    if (Trim(line).size() && line.size() > 120) long_lines++;
  }
  if (long_lines > 0) score--;
  if (long_lines > 5) score--;

  const std::regex& function_re = lang == Language::PYTHON ? kPyFunction : kJsFunction;
  const std::regex& print_re = lang == Language::PYTHON ? kPyPrint : kJsPrint;
  if (!std::regex_search(trimmed, function_re)) score--;
  if (CountMatches(trimmed, print_re) > 3) score--;
  return std::clamp(score, 0, JudgeService::kMaxStyle);
}

std::optional<std::string> DetectInfrastructureError(const std::vector<TestOutcome>& tests) {
  if (tests.empty()) return "No tests executed";
  for (auto& test : tests) {
    if (test.status != TestStatus::ERROR || !IsInfrastructureErrorText(test.error.value_or(""))) {
      return std::nullopt;
    }
  }
  return kInfrastructureMessage;
}

JudgeService::JudgeService(ChallengeStore& store, RunnerService& runner, bool enabled) :
    store_(store), runner_(runner), enabled_(enabled) {}

bool JudgeService::IsJudgeReady(const std::string& challenge_id, Language lang) {
  if (!IsLocalLanguage(lang)) return false;
  return !store_.GetTestCases(challenge_id).empty() && store_.GetBaseline(challenge_id, lang).has_value();
}

std::optional<JudgeRunResult> JudgeService::RunTests(
    const std::string& challenge_id, Language lang, const std::string& code) {
  if (!enabled_) return std::nullopt;
  if (!IsLocalLanguage(lang)) return std::nullopt;
  std::vector<TestCase> tests = store_.GetTestCases(challenge_id);
  if (tests.empty()) return std::nullopt;
  auto baseline = store_.GetBaseline(challenge_id, lang);
  if (!baseline) return std::nullopt;

  auto run = runner_.RunCode(lang, code, tests);
  if (!run) return std::nullopt;

  JudgeRunResult ret;
  int total_points = 0, earned_points = 0;
  double runtime_sum = 0;
  for (auto& i : tests) total_points += i.points;
  ret.test_passed = 0;
  for (auto& i : run->tests) {
    earned_points += i.points_awarded;
    runtime_sum += i.runtime_ms;
    if (i.status == TestStatus::PASSED) ret.test_passed++;
  }
  ret.test_total = run->tests.size();
  ret.correctness = CorrectnessScore(earned_points, total_points);
  ret.efficiency = EfficiencyScore(runtime_sum / std::max(1, ret.test_total), baseline->runtime_ms);
  ret.style = StyleScore(lang, code);
  ret.runtime_ms = run->runtime_ms;
  ret.memory_mb = run->memory_mb;
  ret.infrastructure_error = DetectInfrastructureError(run->tests);
  ret.tests = std::move(run->tests);
  spdlog::info("Judged challenge {} ({}): {}/{} passed, scores {}/{}/{}", challenge_id, LanguageName(lang),
               ret.test_passed, ret.test_total, ret.correctness, ret.efficiency, ret.style);
  return ret;
}
