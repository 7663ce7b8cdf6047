#include "judgebox/execution.h"

#include <cmath>
#include <limits>
#include <cstdlib>
#include <cstring>
#include <algorithm>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "judgebox/errors.h"
#include "judgebox/utils.h"
#include "http_utils.h"

namespace {

const char* kErrorClassTable[] = {
#define X(name, str) str,
  ENUM_ERROR_CLASS_
#undef X
};
const char* kProviderTable[] = {
#define X(name, str) str,
  ENUM_PROVIDER_
#undef X
};

constexpr char kProviderUnavailable[] = "Execution provider temporarily unavailable. Please retry.";

using nlohmann::json;

std::string PickString(const json& obj, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) return it->get<std::string>();
  }
  return "";
}

// numbers, or strings holding nothing but a number
// non-finite values count as absent
std::optional<double> PickNumber(const json& obj, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = obj.find(key);
    if (it == obj.end()) continue;
    if (it->is_number()) {
      double val = it->get<double>();
      if (std::isfinite(val)) return val;
    } else if (it->is_string()) {
      std::string str = Trim(it->get<std::string>());
      if (str.empty()) continue;
      char* end = nullptr;
      double val = strtod(str.c_str(), &end);
      if (*end == '\0' && std::isfinite(val)) return val;
    }
  }
  return std::nullopt;
}

template <class T>
T ClampTo(double val) {
  if (val <= (double)std::numeric_limits<T>::min()) return std::numeric_limits<T>::min();
  if (val >= (double)std::numeric_limits<T>::max()) return std::numeric_limits<T>::max();
  return (T)val;
}

std::optional<bool> PickBool(const json& obj, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_boolean()) return it->get<bool>();
  }
  return std::nullopt;
}

std::string ExceptionText(const json& obj) {
  auto it = obj.find("exception");
  if (it == obj.end() || it->is_null()) return "";
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

// "https://host:port/prefix" -> {"https://host:port", "/prefix"}
std::pair<std::string, std::string> SplitBaseUrl(const std::string& url) {
  std::string trimmed = url;
  while (trimmed.size() && trimmed.back() == '/') trimmed.pop_back();
  size_t scheme = trimmed.find("://");
  size_t path = trimmed.find('/', scheme == std::string::npos ? 0 : scheme + 3);
  if (path == std::string::npos) return {trimmed, ""};
  return {trimmed.substr(0, path), trimmed.substr(path)};
}

} // namespace

const char* ErrorClassName(ErrorClass cls) {
  return kErrorClassTable[(int)cls];
}

const char* ProviderName(Provider provider) {
  return kProviderTable[(int)provider];
}

json ExecuteCodeResult::ToJson() const {
  return {
    {"stdout", stdout_data},
    {"stderr", stderr_data},
    {"exit_code", exit_code},
    {"timed_out", timed_out},
    {"runtime_ms", runtime_ms},
    {"memory_kb", memory_kb},
    {"truncated", truncated},
    {"provider", ProviderName(provider)},
    {"error_class", error_class ? json(ErrorClassName(*error_class)) : json(nullptr)},
  };
}

TruncatedOutput TruncateOutput(const std::string& stdout_data, const std::string& stderr_data, size_t max_bytes) {
  if (stdout_data.size() + stderr_data.size() <= max_bytes) return {stdout_data, stderr_data, false};
  const size_t marker = strlen(kTruncationMarker);
  const size_t allowed = max_bytes > marker ? max_bytes - marker : 0;
  if (stdout_data.size() >= allowed) {
    return {Utf8Prefix(stdout_data, allowed) + kTruncationMarker, "", true};
  }
  return {stdout_data, Utf8Prefix(stderr_data, allowed - stdout_data.size()) + kTruncationMarker, true};
}

std::optional<ErrorClass> InferErrorClass(int exit_code, bool timed_out, const std::string& stderr_data,
                                          bool infrastructure) {
  if (timed_out) return ErrorClass::TIMEOUT;
  if (exit_code == 0) return std::nullopt;
  if (infrastructure) return ErrorClass::INFRASTRUCTURE;
  std::string err = ToLower(stderr_data);
  if (ContainsAny(err, {"error:", "exception", "traceback"}) &&
      ContainsAny(err, {"syntax", "compile", "cannot find symbol"})) {
    return ErrorClass::COMPILE;
  }
  return ErrorClass::RUNTIME;
}

ProviderResult ParseProviderResponse(const json& body, long elapsed_ms) {
  static const json kEmpty = json::object();
  const json& obj = body.is_object() ? body : kEmpty;

  std::string status = ToLower(Trim(PickString(obj, {"status", "resultStatus", "executionStatus"})));
  std::string out = PickString(obj, {"stdout", "output", "result", "runOutput"});
  std::string err = PickString(obj, {"stderr", "error", "errors", "compile_output", "compileOutput"});
  std::string exception = ExceptionText(obj);
  if (exception.size()) err = err.empty() ? exception : err + '\n' + exception;
  err = Trim(err);
  std::optional<bool> success = PickBool(obj, {"success", "ok"});
  std::optional<double> exit_code = PickNumber(obj, {"exitCode", "exit_code", "code", "statusCode"});

  if (status.empty() && out.empty() && err.empty() && !exit_code && !success) {
    throw InfrastructureError("Execution provider returned an empty response payload.");
  }

  ProviderResult ret;
  std::string status_text = ToLower(status + '\n' + err);
  ret.timed_out = status == "timeout" ||
      ContainsAny(status_text, {"timed out", "timedout", "time out", "timeout", "time limit"});
  if (exit_code) {
    ret.exit_code = ClampTo<int>(*exit_code);
  } else if ((success && !*success) || ret.timed_out || err.size()) {
    ret.exit_code = 1;
  } else if (status.size() && status != "success" && status != "ok" && status != "completed" &&
             status != "done" && status != "passed") {
    ret.exit_code = 1;
  } else {
    ret.exit_code = 0;
  }
  ret.stdout_data = std::move(out);
  ret.stderr_data = std::move(err);
  auto runtime = PickNumber(obj, {"executionTime", "execution_time", "runtimeMs", "runtime_ms"});
  ret.runtime_ms = runtime ? std::max(0L, ClampTo<long>(*runtime)) : elapsed_ms;
  ret.memory_kb = std::max(0L, ClampTo<long>(PickNumber(obj, {"memoryKb", "memory_kb", "memory"}).value_or(0)));
  return ret;
}

HttpRemoteExecutor::HttpRemoteExecutor(
    std::string base_url, std::string access_token, std::string api_key, long timeout_ms) :
    base_url_(std::move(base_url)), access_token_(Trim(access_token)), api_key_(Trim(api_key)),
    timeout_ms_(timeout_ms) {}

json HttpRemoteExecutor::BuildPayload(const RemoteRequest& req) {
  return {
    {"language", LanguageRemoteId(req.language)},
    {"files", json::array({{{"name", LanguageFileName(req.language)}, {"content", req.code}}})},
    {"stdin", req.stdin_data},
  };
}

ProviderResult HttpRemoteExecutor::Execute(const RemoteRequest& req) {
  if (access_token_.empty() && api_key_.empty()) {
    throw InfrastructureError("Remote execution provider credentials are not configured.");
  }
  if (!IsRemoteLanguage(req.language)) {
    throw ValidationError(std::string("No remote provider language for ") + LanguageName(req.language));
  }
  auto [host, prefix] = SplitBaseUrl(base_url_);
  httplib::Client cli(host);
  const auto timeout = std::chrono::milliseconds(std::max(timeout_ms_, req.timeout_ms + kTimeoutSlackMs));
  cli.set_connection_timeout(timeout);
  cli.set_read_timeout(timeout);
  cli.set_write_timeout(timeout);

  std::string endpoint = prefix + "/run";
  if (access_token_.size()) endpoint += "?access_token=" + httplib::detail::encode_query_param(access_token_);
  httplib::Headers headers;
  if (api_key_.size()) headers.emplace("X-API-Key", api_key_);

  int64_t start = MonotonicMs();
  auto res = HTTPRequest<HTTPPost>(cli, endpoint, headers, BuildPayload(req).dump(), "application/json");
  if (!res) {
    spdlog::warn("Remote provider request failed: {}", httplib::to_string(res.error()));
    throw ProviderError(kProviderUnavailable, 0);
  }
  int status = res->status;
  if (!http_utils::IsSuccess(status)) {
    spdlog::warn("Remote provider answered status {}", status);
    if (status >= 500) throw ProviderError(kProviderUnavailable, status);
    if (status >= 400) throw ProviderError(fmt::format("Execution rejected by provider (status {}).", status), status);
    throw ProviderError("Execution provider unavailable", status);
  }
  // a body that is not a JSON object counts as empty
  json body = json::parse(res->body, nullptr, false);
  return ParseProviderResponse(body, MonotonicMs() - start);
}

ExecutionService::ExecutionService(RunnerService& runner, RemoteExecutor& remote) :
    runner_(runner), remote_(remote) {}

ProviderResult ExecutionService::RunRemote(const RemoteRequest& req) {
  try {
    return remote_.Execute(req);
  } catch (const ProviderError& err) {
    if (!err.IsRetryable()) throw;
    spdlog::info("Remote provider failed (status {}), retrying once", err.Status());
  }
  return remote_.Execute(req);
}

ExecuteCodeResult ExecutionService::RunCode(const ExecuteCodeInput& input) {
  if (input.code.size() > (size_t)kMaxCodeBytes) {
    throw ValidationError(fmt::format("code payload exceeds {} bytes", kMaxCodeBytes));
  }
  const std::string stdin_data = input.stdin_data.value_or("");
  if (stdin_data.size() > (size_t)kMaxStdinBytes) {
    throw ValidationError(fmt::format("stdin payload exceeds {} bytes", kMaxStdinBytes));
  }
  Language lang = NormalizeLanguage(input.language);
  ExecutionLimits limits = ResolveLimits(input.limits);

  ExecuteCodeResult ret;
  bool infrastructure = false;
  std::string full_stderr;
  if (IsLocalLanguage(lang)) {
    AdhocResult run = runner_.RunAdhoc(lang, input.code, stdin_data, limits.timeout_ms, limits.memory_mb);
    TruncatedOutput out = TruncateOutput(run.stdout_data, run.stderr_data, limits.max_output_bytes);
    ret.stdout_data = std::move(out.stdout_data);
    ret.stderr_data = std::move(out.stderr_data);
    ret.truncated = out.truncated;
    ret.exit_code = run.exit_code;
    ret.timed_out = run.timed_out;
    ret.runtime_ms = run.runtime_ms;
    ret.memory_kb = run.memory_mb * 1024;
    ret.provider = Provider::LOCAL;
    infrastructure = run.infrastructure_error;
    full_stderr = std::move(run.stderr_data);
  } else {
    ProviderResult run = RunRemote({lang, input.code, stdin_data, limits.timeout_ms});
    TruncatedOutput out = TruncateOutput(run.stdout_data, run.stderr_data, limits.max_output_bytes);
    ret.stdout_data = std::move(out.stdout_data);
    ret.stderr_data = std::move(out.stderr_data);
    ret.truncated = out.truncated;
    ret.exit_code = run.exit_code;
    ret.timed_out = run.timed_out;
    ret.runtime_ms = run.runtime_ms;
    ret.memory_kb = run.memory_kb;
    ret.provider = Provider::REMOTE;
    full_stderr = std::move(run.stderr_data);
  }
  ret.error_class = InferErrorClass(ret.exit_code, ret.timed_out, full_stderr, infrastructure);
  return ret;
}
