#include "judgebox/submission.h"

#include <nlohmann/json.hpp>

#include "judgebox/errors.h"

namespace {

const char* kSubmissionStatusTable[] = {
#define X(name, str) str,
  ENUM_SUBMISSION_STATUS_
#undef X
};
const char* kJudgeStatusTable[] = {
#define X(name, str) str,
  ENUM_JUDGE_STATUS_
#undef X
};
const char* kRunStatusTable[] = {
#define X(name, str) str,
  ENUM_RUN_STATUS_
#undef X
};
const char* kTestStatusTable[] = {
#define X(name, str) str,
  ENUM_TEST_STATUS_
#undef X
};

template <class T, size_t N>
T FindInTable(const char* (&table)[N], const std::string& str, const char* what) {
  for (size_t i = 0; i < N; i++) {
    if (str == table[i]) return (T)i;
  }
  throw ValidationError(std::string("Invalid ") + what + " \"" + str + "\"");
}

} // namespace

const char* SubmissionStatusName(SubmissionStatus s) { return kSubmissionStatusTable[(int)s]; }
const char* JudgeStatusName(JudgeStatus s) { return kJudgeStatusTable[(int)s]; }
const char* RunStatusName(RunStatus s) { return kRunStatusTable[(int)s]; }
const char* TestStatusName(TestStatus s) { return kTestStatusTable[(int)s]; }

SubmissionStatus GetSubmissionStatus(const std::string& str) {
  return FindInTable<SubmissionStatus>(kSubmissionStatusTable, str, "submission status");
}
JudgeStatus GetJudgeStatus(const std::string& str) {
  return FindInTable<JudgeStatus>(kJudgeStatusTable, str, "judge status");
}
RunStatus GetRunStatus(const std::string& str) {
  return FindInTable<RunStatus>(kRunStatusTable, str, "run status");
}
TestStatus GetTestStatus(const std::string& str) {
  return FindInTable<TestStatus>(kTestStatusTable, str, "test status");
}

JudgeJob JudgeJob::FromSubmission(const Submission& sub) {
  JudgeJob ret;
  ret.submission_id = sub.id;
  ret.challenge_id = sub.challenge_id;
  ret.user_id = sub.user_id;
  ret.code = sub.code;
  ret.language = sub.language;
  ret.session_id = sub.session_id;
  return ret;
}

std::string JudgeJob::Serialize() const {
  nlohmann::json body = {
    {"submissionId", submission_id},
    {"challengeId", challenge_id},
    {"userId", user_id},
    {"code", code},
    {"language", LanguageName(language)},
  };
  if (session_id) body["sessionId"] = *session_id;
  return body.dump();
}

JudgeJob JudgeJob::Deserialize(const std::string& str) {
  nlohmann::json body = nlohmann::json::parse(str);
  JudgeJob ret;
  body.at("submissionId").get_to(ret.submission_id);
  body.at("challengeId").get_to(ret.challenge_id);
  body.at("userId").get_to(ret.user_id);
  body.at("code").get_to(ret.code);
  ret.language = NormalizeLanguage(body.at("language").get<std::string>());
  if (auto it = body.find("sessionId"); it != body.end() && it->is_string()) {
    ret.session_id = it->get<std::string>();
  }
  return ret;
}
