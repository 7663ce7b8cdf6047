#ifndef INCLUDE_JUDGEBOX_EXECUTION_H_
#define INCLUDE_JUDGEBOX_EXECUTION_H_

#include <string>
#include <optional>

#include <nlohmann/json_fwd.hpp>
#include "config.h"
#include "language.h"
#include "runner_service.h"

#define ENUM_ERROR_CLASS_ \
  X(COMPILE, "compile") \
  X(RUNTIME, "runtime") \
  X(TIMEOUT, "timeout") \
  X(INFRASTRUCTURE, "infrastructure")
enum class ErrorClass {
#define X(name, str) name,
  ENUM_ERROR_CLASS_
#undef X
};

#define ENUM_PROVIDER_ \
  X(LOCAL, "local") \
  X(REMOTE, "remote")
enum class Provider {
#define X(name, str) name,
  ENUM_PROVIDER_
#undef X
};

const char* ErrorClassName(ErrorClass);
const char* ProviderName(Provider);

struct ExecuteCodeInput {
  std::string language; // any accepted alias
  std::string code;
  std::optional<std::string> stdin_data;
  LimitOverrides limits;
};

struct ExecuteCodeResult {
  std::string stdout_data, stderr_data;
  int exit_code;
  bool timed_out;
  long runtime_ms;
  long memory_kb;
  bool truncated;
  Provider provider;
  std::optional<ErrorClass> error_class;

  nlohmann::json ToJson() const;
};

struct RemoteRequest {
  Language language;
  std::string code;
  std::string stdin_data;
  long timeout_ms;
};

// Provider output before truncation
struct ProviderResult {
  std::string stdout_data, stderr_data;
  int exit_code;
  bool timed_out;
  long runtime_ms;
  long memory_kb;
};

// Remote execution provider for languages without a local runner.
// Throws ProviderError for HTTP / connection failures, InfrastructureError for anything else.
class RemoteExecutor {
 public:
  virtual ~RemoteExecutor() = default;
  virtual ProviderResult Execute(const RemoteRequest&) = 0;
};

class HttpRemoteExecutor : public RemoteExecutor {
 public:
  static constexpr long kTimeoutSlackMs = 5000;

  HttpRemoteExecutor(std::string base_url, std::string access_token, std::string api_key, long timeout_ms);
  ProviderResult Execute(const RemoteRequest&) override;

  // request body sent to the provider
  static nlohmann::json BuildPayload(const RemoteRequest&);

 private:
  std::string base_url_;
  std::string access_token_;
  std::string api_key_;
  long timeout_ms_;
};

// Tolerates the field spellings of the provider's response variants.
// Throws InfrastructureError if the payload carries no execution outcome at all.
// elapsed_ms is reported when the payload has no runtime field.
ProviderResult ParseProviderResponse(const nlohmann::json&, long elapsed_ms = 0);

struct TruncatedOutput {
  std::string stdout_data, stderr_data;
  bool truncated;
};

constexpr char kTruncationMarker[] = "\n[output truncated]";

// stdout is kept in preference to stderr; the result never exceeds max_bytes in total
TruncatedOutput TruncateOutput(const std::string& stdout_data, const std::string& stderr_data, size_t max_bytes);

std::optional<ErrorClass> InferErrorClass(int exit_code, bool timed_out, const std::string& stderr_data,
                                          bool infrastructure = false);

class ExecutionService {
 public:
  ExecutionService(RunnerService& runner, RemoteExecutor& remote);

  // Throws ValidationError for oversized payloads or unknown languages (before running anything),
  // ProviderError / InfrastructureError when the remote provider fails
  ExecuteCodeResult RunCode(const ExecuteCodeInput&);

 private:
  ProviderResult RunRemote(const RemoteRequest&);

  RunnerService& runner_;
  RemoteExecutor& remote_;
};

#endif  // INCLUDE_JUDGEBOX_EXECUTION_H_
