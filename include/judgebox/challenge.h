#ifndef INCLUDE_JUDGEBOX_CHALLENGE_H_
#define INCLUDE_JUDGEBOX_CHALLENGE_H_

#include <string>
#include <vector>
#include <optional>

#include "language.h"

// Read-only authoring data
struct TestCase {
  std::string id;
  std::string input;
  std::string expected_output;
  long timeout_ms;
  long memory_mb;
  int points;
  int order_index;
};

struct Baseline {
  std::string challenge_id;
  Language language;
  long runtime_ms;
};

class ChallengeStore {
 public:
  virtual ~ChallengeStore() = default;
  // ordered by order_index
  virtual std::vector<TestCase> GetTestCases(const std::string& challenge_id) = 0;
  virtual std::optional<Baseline> GetBaseline(const std::string& challenge_id, Language) = 0;
};

#endif  // INCLUDE_JUDGEBOX_CHALLENGE_H_
