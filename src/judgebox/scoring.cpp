#include "judgebox/scoring.h"

#include <cmath>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "judgebox/database.h"

FinalScore ComputeFinalScore(const ScoreComponents& comp, int behavior, int work_experience) {
  int challenge = std::clamp(comp.correctness + comp.efficiency + comp.style, 0, 60);
  behavior = std::clamp(behavior, 0, 20);
  work_experience = std::clamp(work_experience, 0, 20);
  FinalScore ret;
  ret.submission_score = std::clamp(challenge + behavior, 0, 80);
  ret.trust_score = std::clamp((int)std::floor(ret.submission_score * 0.8 + work_experience + 0.5), 0, 100);
  if (ret.trust_score >= 80) {
    ret.trust_level = "High";
  } else if (ret.trust_score >= 55) {
    ret.trust_level = "Medium";
  } else {
    ret.trust_level = "Low";
  }
  return ret;
}

DefaultScoringEngine::DefaultScoringEngine(Database& db, ScoringSources sources) :
    db_(db), sources_(std::move(sources)) {}

FinalScore DefaultScoringEngine::FinalizeSubmissionScore(
    const std::string& submission_id, const std::string& user_id,
    const std::optional<std::string>& session_id, const ScoreComponents& comp) {
  int behavior = sources_.behavior ? sources_.behavior(user_id, session_id) : kDefaultBehavior;
  int work = sources_.work_experience ? sources_.work_experience(user_id) : 0;
  FinalScore ret = ComputeFinalScore(comp, behavior, work);
  if (auto sub = db_.GetSubmission(submission_id)) {
    sub->score = ret.submission_score;
    sub->trust_score = ret.trust_score;
    sub->trust_level = ret.trust_level;
    sub->status = SubmissionStatus::GRADED;
    db_.UpdateSubmission(*sub);
  } else {
    spdlog::warn("Scoring: submission {} not found", submission_id);
  }
  spdlog::info("Submission {} scored {} (trust {} {})", submission_id, ret.submission_score,
               ret.trust_score, ret.trust_level);
  return ret;
}
