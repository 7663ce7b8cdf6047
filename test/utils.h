#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <deque>
#include <string>
#include <vector>
#include <functional>

#include <gtest/gtest.h>
#include "judgebox/challenge.h"
#include "judgebox/execution.h"
#include "judgebox/probe.h"
#include "judgebox/runner.h"
#include "judgebox/utils.h"

// Scratch space shared by all tests; removed after the run
fs::path TestRoot();
// Fresh directory under TestRoot()
fs::path UniqueTestDir(const std::string& prefix);

ProcessResult Exited(const std::string& out, int code = 0, const std::string& err = "", long duration = 10);
ProcessResult TimedOut(long duration);

class FakeRunner : public Runner {
 public:
  using Handler = std::function<ProcessResult(const RunRequest&)>;

  Handler handler;
  std::vector<RunRequest> requests;

  explicit FakeRunner(Handler h = nullptr) : handler(std::move(h)) {}
  ProcessResult Run(const RunRequest& req) override {
    requests.push_back(req);
    return handler ? handler(req) : Exited("");
  }
};

class FakeProbe : public CapabilityProbe {
 public:
  bool container_available;
  std::map<Language, std::string> interpreters;
  int container_checks;
  std::vector<std::string> image_checks;

  explicit FakeProbe(bool container = false) : container_available(container), container_checks(0) {
    interpreters[Language::JAVASCRIPT] = "node";
    interpreters[Language::PYTHON] = "python3";
  }
  bool ContainerRuntimeAvailable() override {
    container_checks++;
    return container_available;
  }
  bool ContainerImageUsable(const std::string& image) override {
    image_checks.push_back(image);
    return container_available;
  }
  std::optional<std::string> Interpreter(Language lang) override {
    auto it = interpreters.find(lang);
    if (it == interpreters.end()) return std::nullopt;
    return it->second;
  }
};

class FakeChallengeStore : public ChallengeStore {
 public:
  std::map<std::string, std::vector<TestCase>> tests;
  std::map<std::pair<std::string, Language>, long> baselines;

  std::vector<TestCase> GetTestCases(const std::string& challenge_id) override {
    auto it = tests.find(challenge_id);
    return it == tests.end() ? std::vector<TestCase>() : it->second;
  }
  std::optional<Baseline> GetBaseline(const std::string& challenge_id, Language lang) override {
    auto it = baselines.find({challenge_id, lang});
    if (it == baselines.end()) return std::nullopt;
    return Baseline{challenge_id, lang, it->second};
  }
};

class FakeRemoteExecutor : public RemoteExecutor {
 public:
  // consumed front to back; the last one repeats
  std::deque<std::function<ProviderResult(const RemoteRequest&)>> responses;
  int calls = 0;

  ProviderResult Execute(const RemoteRequest& req) override {
    calls++;
    auto func = responses.front();
    if (responses.size() > 1) responses.pop_front();
    return func(req);
  }
};

// n tests echoing their input, 1 point each
std::vector<TestCase> EchoTests(int n, long timeout_ms = 1000, long memory_mb = 64);

#endif // TEST_UTILS_H_
