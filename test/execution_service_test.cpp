#include <cmath>
#include <limits>
#include <cstring>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "judgebox/errors.h"
#include "judgebox/execution.h"
#include "utils.h"

using nlohmann::json;

namespace {

size_t CountOccurrences(const std::string& str, const std::string& needle) {
  size_t ret = 0;
  for (size_t pos = str.find(needle); pos != std::string::npos; pos = str.find(needle, pos + 1)) ret++;
  return ret;
}

ProviderResult RemoteOk(const std::string& out) {
  ProviderResult ret{};
  ret.stdout_data = out;
  ret.runtime_ms = 120;
  ret.memory_kb = 2048;
  return ret;
}

class ExecutionServiceTest : public ::testing::Test {
 protected:
  FakeProbe probe;
  FakeRunner process;
  FakeRunner container;
  FakeRemoteExecutor remote;
  RunnerService runner{probe, process, container, ExecutionMode::LOCAL, UniqueTestDir("exec")};
  ExecutionService service{runner, remote};

  void SetUp() override {
    remote.responses.push_back([](const RemoteRequest&) { return RemoteOk("remote\n"); });
  }
};

} // namespace

TEST(TruncateOutput, FitsUnchanged) {
  auto out = TruncateOutput("abc", "def", 6);
  EXPECT_FALSE(out.truncated);
  EXPECT_EQ(out.stdout_data, "abc");
  EXPECT_EQ(out.stderr_data, "def");
}

TEST(TruncateOutput, StderrGoesFirst) {
  std::string out(3000, 'o'), err(3000, 'e');
  auto res = TruncateOutput(out, err, 4096);
  EXPECT_TRUE(res.truncated);
  EXPECT_EQ(res.stdout_data, out);
  EXPECT_EQ(res.stdout_data.size() + res.stderr_data.size(), 4096u);
  EXPECT_EQ(CountOccurrences(res.stderr_data, kTruncationMarker), 1u);
}

TEST(TruncateOutput, KeepsUtf8Intact) {
  // 3-byte characters; the cut point falls in the middle of one
  std::string out;
  for (int i = 0; i < 1000; i++) out += "\xe4\xb8\xad";
  auto res = TruncateOutput(out, "", 2048);
  ASSERT_TRUE(res.truncated);
  std::string body = res.stdout_data.substr(0, res.stdout_data.size() - strlen(kTruncationMarker));
  EXPECT_EQ(body.size() % 3, 0u);
  EXPECT_LE(res.stdout_data.size(), 2048u);
}

TEST(InferErrorClass, Classes) {
  EXPECT_EQ(InferErrorClass(0, false, "warning"), std::nullopt);
  EXPECT_EQ(InferErrorClass(-1, true, ""), ErrorClass::TIMEOUT);
  EXPECT_EQ(InferErrorClass(1, false, "SyntaxError: Unexpected token ')'\n"), ErrorClass::COMPILE);
  EXPECT_EQ(InferErrorClass(2, false, ""), ErrorClass::RUNTIME);
  EXPECT_EQ(InferErrorClass(1, false, "Main.java:3: error: cannot find symbol"), ErrorClass::COMPILE);
  EXPECT_EQ(InferErrorClass(1, false, "  File \"s.py\"\nSyntaxError: invalid syntax\nTraceback"),
            ErrorClass::COMPILE);
  EXPECT_EQ(InferErrorClass(1, false, "ZeroDivisionError: division by zero\nTraceback"), ErrorClass::RUNTIME);
  EXPECT_EQ(InferErrorClass(127, false, "node: command not found", true), ErrorClass::INFRASTRUCTURE);
}

TEST(ParseProviderResponse, Variants) {
  auto res = ParseProviderResponse(json::parse(R"({"stdout":"hi\n","stderr":null,"exitCode":0,
                                                   "executionTime":42,"memory":1024})"));
  EXPECT_EQ(res.stdout_data, "hi\n");
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.runtime_ms, 42);
  EXPECT_EQ(res.memory_kb, 1024);

  res = ParseProviderResponse(json::parse(R"({"output":"x","status":"success"})"), 77);
  EXPECT_EQ(res.stdout_data, "x");
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.runtime_ms, 77);

  res = ParseProviderResponse(json::parse(R"({"status":"failed"})"));
  EXPECT_EQ(res.exit_code, 1);

  res = ParseProviderResponse(json::parse(R"({"exit_code":"3","stderr":"boom"})"));
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_EQ(res.stderr_data, "boom");

  res = ParseProviderResponse(json::parse(R"({"stderr":"Time limit exceeded"})"));
  EXPECT_TRUE(res.timed_out);
  EXPECT_EQ(res.exit_code, 1);

  res = ParseProviderResponse(json::parse(R"({"stdout":"","exception":{"type":"Crash"}})"));
  EXPECT_EQ(res.exit_code, 1);
  EXPECT_NE(res.stderr_data.find("Crash"), std::string::npos);

  res = ParseProviderResponse(json::parse(R"({"success":false})"));
  EXPECT_EQ(res.exit_code, 1);
}

TEST(ParseProviderResponse, OutOfRangeNumbers) {
  auto res = ParseProviderResponse(json::parse(R"({"stdout":"x","exitCode":1e20,"executionTime":1e30,"memory":-5})"));
  EXPECT_EQ(res.exit_code, std::numeric_limits<int>::max());
  EXPECT_EQ(res.runtime_ms, std::numeric_limits<long>::max());
  EXPECT_EQ(res.memory_kb, 0);

  res = ParseProviderResponse(json::parse(R"({"stdout":"x","exitCode":-1e20})"));
  EXPECT_EQ(res.exit_code, std::numeric_limits<int>::min());

  // treated as missing
  res = ParseProviderResponse(json{{"stdout", "x"}, {"exitCode", std::nan("")}}, 5);
  EXPECT_EQ(res.exit_code, 0);
  res = ParseProviderResponse(json::parse(R"({"stderr":"boom","exit_code":"inf","executionTime":"nan"})"), 5);
  EXPECT_EQ(res.exit_code, 1);
  EXPECT_EQ(res.runtime_ms, 5);
}

TEST(ParseProviderResponse, EmptyPayload) {
  EXPECT_THROW(ParseProviderResponse(json::object()), InfrastructureError);
  EXPECT_THROW(ParseProviderResponse(json::parse(R"({"stdout":"","unrelated":1})")), InfrastructureError);
  EXPECT_THROW(ParseProviderResponse(json::array()), InfrastructureError);
  EXPECT_THROW(ParseProviderResponse(json::value_t::discarded), InfrastructureError);
}

TEST(HttpRemoteExecutor, Payload) {
  RemoteRequest req{Language::JAVA, "class Main {}", "1 2\n", 5000};
  json payload = HttpRemoteExecutor::BuildPayload(req);
  EXPECT_EQ(payload["language"], "java");
  EXPECT_EQ(payload["stdin"], "1 2\n");
  ASSERT_EQ(payload["files"].size(), 1u);
  EXPECT_EQ(payload["files"][0]["name"], "Main.java");
  EXPECT_EQ(payload["files"][0]["content"], "class Main {}");
}

TEST(HttpRemoteExecutor, MissingCredentials) {
  HttpRemoteExecutor executor("http://127.0.0.1:9/api/v1", " ", "", 1000);
  try {
    executor.Execute({Language::GO, "package main", "", 1000});
    FAIL() << "expected InfrastructureError";
  } catch (const ProviderError&) {
    FAIL() << "credentials must be checked before any request";
  } catch (const InfrastructureError& err) {
    EXPECT_STREQ(err.what(), "Remote execution provider credentials are not configured.");
  }
}

TEST(HttpRemoteExecutor, ConnectionRefused) {
  // port 9 (discard) is not served on the loopback interface of the test hosts
  HttpRemoteExecutor executor("http://127.0.0.1:9/api/v1", "token", "", 1000);
  try {
    executor.Execute({Language::GO, "package main", "", 1000});
    FAIL() << "expected ProviderError";
  } catch (const ProviderError& err) {
    EXPECT_TRUE(err.IsConnectionError());
    EXPECT_TRUE(err.IsRetryable());
  }
}

TEST_F(ExecutionServiceTest, ScenarioTruncatedStdout) {
  process.handler = [](const RunRequest&) { return Exited(std::string(200 * 1024, 'a'), 0, "also noisy"); };
  ExecuteCodeInput input;
  input.language = "py";
  input.code = "print('a' * 204800)";
  input.limits.max_output_bytes = 128 * 1024;
  ExecuteCodeResult res = service.RunCode(input);
  EXPECT_TRUE(res.truncated);
  EXPECT_EQ(res.stderr_data, "");
  EXPECT_LE(res.stdout_data.size(), 128u * 1024);
  EXPECT_EQ(res.stdout_data.rfind(kTruncationMarker), res.stdout_data.size() - strlen(kTruncationMarker));
  EXPECT_EQ(CountOccurrences(res.stdout_data, kTruncationMarker), 1u);
  EXPECT_EQ(res.provider, Provider::LOCAL);
  EXPECT_EQ(res.error_class, std::nullopt);
}

TEST_F(ExecutionServiceTest, LocalResultFields) {
  process.handler = [](const RunRequest& req) { return Exited(req.input, 1, "ReferenceError: x is not defined", 30); };
  ExecuteCodeInput input;
  input.language = "JS";
  input.code = "console.log(x)";
  input.stdin_data = "in";
  ExecuteCodeResult res = service.RunCode(input);
  EXPECT_EQ(res.stdout_data, "in");
  EXPECT_EQ(res.exit_code, 1);
  EXPECT_EQ(res.runtime_ms, 30);
  EXPECT_EQ(res.memory_kb, 0);
  EXPECT_EQ(res.error_class, ErrorClass::RUNTIME);
  EXPECT_EQ(remote.calls, 0);

  json body = res.ToJson();
  EXPECT_EQ(body["provider"], "local");
  EXPECT_EQ(body["error_class"], "runtime");
  EXPECT_EQ(body["truncated"], false);
}

TEST_F(ExecutionServiceTest, LimitsClampedToFloors) {
  ExecuteCodeInput input;
  input.language = "python";
  input.code = "pass";
  input.limits.timeout_ms = 10;
  input.limits.memory_mb = 1;
  service.RunCode(input);
  ASSERT_EQ(process.requests.size(), 1u);
  EXPECT_EQ(process.requests[0].timeout_ms, kMinTimeoutMs);
}

TEST_F(ExecutionServiceTest, ValidationBeforeExecution) {
  ExecuteCodeInput input;
  input.language = "python";
  input.code = std::string(kMaxCodeBytes + 1, 'x');
  EXPECT_THROW(service.RunCode(input), ValidationError);

  input.code = "pass";
  input.stdin_data = std::string(kMaxStdinBytes + 1, 'x');
  EXPECT_THROW(service.RunCode(input), ValidationError);

  input.stdin_data.reset();
  input.language = "cobol";
  EXPECT_THROW(service.RunCode(input), ValidationError);

  EXPECT_TRUE(process.requests.empty());
  EXPECT_EQ(remote.calls, 0);
}

TEST_F(ExecutionServiceTest, RemoteLanguage) {
  ExecuteCodeInput input;
  input.language = "c++";
  input.code = "int main() {}";
  input.stdin_data = "5";
  input.limits.timeout_ms = 3000;
  std::optional<RemoteRequest> seen;
  remote.responses = {[&](const RemoteRequest& req) {
    seen = req;
    return RemoteOk("ok\n");
  }};
  ExecuteCodeResult res = service.RunCode(input);
  ASSERT_TRUE(seen.has_value());
  EXPECT_EQ(seen->language, Language::CPP);
  EXPECT_EQ(seen->stdin_data, "5");
  EXPECT_EQ(seen->timeout_ms, 3000);
  EXPECT_EQ(res.provider, Provider::REMOTE);
  EXPECT_EQ(res.stdout_data, "ok\n");
  EXPECT_EQ(res.memory_kb, 2048);
  EXPECT_TRUE(process.requests.empty());
}

TEST_F(ExecutionServiceTest, RemoteRetriesOnceOnServerError) {
  remote.responses = {
    [](const RemoteRequest&) -> ProviderResult { throw ProviderError("unavailable", 503); },
    [](const RemoteRequest&) { return RemoteOk("second\n"); },
  };
  ExecuteCodeInput input{"go", "package main", std::nullopt, {}};
  ExecuteCodeResult res = service.RunCode(input);
  EXPECT_EQ(remote.calls, 2);
  EXPECT_EQ(res.stdout_data, "second\n");
}

TEST_F(ExecutionServiceTest, RemoteGivesUpAfterSecondFailure) {
  remote.responses = {[](const RemoteRequest&) -> ProviderResult { throw ProviderError("refused", 0); }};
  ExecuteCodeInput input{"java", "class Main {}", std::nullopt, {}};
  EXPECT_THROW(service.RunCode(input), ProviderError);
  EXPECT_EQ(remote.calls, 2);
}

TEST_F(ExecutionServiceTest, RemoteClientErrorNotRetried) {
  remote.responses = {[](const RemoteRequest&) -> ProviderResult { throw ProviderError("bad request", 400); }};
  ExecuteCodeInput input{"csharp", "class P {}", std::nullopt, {}};
  try {
    service.RunCode(input);
    FAIL() << "expected ProviderError";
  } catch (const ProviderError& err) {
    EXPECT_EQ(err.Status(), 400);
  }
  EXPECT_EQ(remote.calls, 1);
}

TEST_F(ExecutionServiceTest, RemoteEmptyPayloadNotRetried) {
  remote.responses = {[](const RemoteRequest&) -> ProviderResult { return ParseProviderResponse(json::object()); }};
  ExecuteCodeInput input{"java", "class Main {}", std::nullopt, {}};
  EXPECT_THROW(service.RunCode(input), InfrastructureError);
  EXPECT_EQ(remote.calls, 1);
}
