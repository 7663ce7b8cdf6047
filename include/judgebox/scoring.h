#ifndef INCLUDE_JUDGEBOX_SCORING_H_
#define INCLUDE_JUDGEBOX_SCORING_H_

#include <string>
#include <optional>
#include <functional>

class Database;

struct ScoreComponents {
  int correctness;
  int efficiency;
  int style;
};

struct FinalScore {
  int submission_score; // 0..80
  int trust_score; // 0..100
  std::string trust_level; // High, Medium, Low
};

// Turns the judge scores into the submission's final score
class ScoringEngine {
 public:
  virtual ~ScoringEngine() = default;
  virtual FinalScore FinalizeSubmissionScore(const std::string& submission_id, const std::string& user_id,
                                             const std::optional<std::string>& session_id,
                                             const ScoreComponents&) = 0;
};

// Behavior and work experience come from other subsystems (proctoring, profiles)
struct ScoringSources {
  // 0..20; proctoring behavior of the session
  std::function<int(const std::string& user_id, const std::optional<std::string>& session_id)> behavior;
  // 0..20
  std::function<int(const std::string& user_id)> work_experience;
};

FinalScore ComputeFinalScore(const ScoreComponents&, int behavior, int work_experience);

class DefaultScoringEngine : public ScoringEngine {
 public:
  static constexpr int kDefaultBehavior = 20;

  DefaultScoringEngine(Database& db, ScoringSources sources = {});
  // also writes the score and status graded onto the submission
  FinalScore FinalizeSubmissionScore(const std::string& submission_id, const std::string& user_id,
                                     const std::optional<std::string>& session_id,
                                     const ScoreComponents&) override;

 private:
  Database& db_;
  ScoringSources sources_;
};

#endif  // INCLUDE_JUDGEBOX_SCORING_H_
