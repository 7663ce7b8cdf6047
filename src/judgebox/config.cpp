#include "judgebox/config.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <algorithm>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include "judgebox/utils.h"

ExecutionMode kExecutionMode = ExecutionMode::AUTO;
long kDefaultTimeoutMs = 5000;
long kDefaultMemoryMb = 256;
long kMaxOutputBytes = 64 * 1024;
long kMaxCodeBytes = 100 * 1024;
long kMaxStdinBytes = 64 * 1024;
double kContainerCpus = 0.5;
fs::path kWorkRoot = "/tmp/judgebox";
fs::path kDatabasePath = "/var/lib/judgebox/judgebox.db";
fs::path kQueuePath = "/var/lib/judgebox/queue.db";
bool kJudgeEnabled = true;
long kEnqueueTimeoutMs = 5000;
std::string kRemoteBaseUrl = "https://onecompiler-apis.p.rapidapi.com/api/v1";
std::string kRemoteAccessToken;
std::string kRemoteApiKey;
long kRemoteTimeoutMs = 15000;

ExecutionLimits ResolveLimits(const LimitOverrides& overrides) {
  ExecutionLimits ret;
  ret.timeout_ms = std::max(kMinTimeoutMs, overrides.timeout_ms.value_or(kDefaultTimeoutMs));
  ret.memory_mb = std::max(kMinMemoryMb, overrides.memory_mb.value_or(kDefaultMemoryMb));
  ret.max_output_bytes = std::max(kMinOutputBytes, overrides.max_output_bytes.value_or(kMaxOutputBytes));
  return ret;
}

namespace {

bool SetExecutionMode(const std::string& str) {
  if (auto mode = ParseExecutionMode(str)) {
    kExecutionMode = *mode;
    return true;
  }
  spdlog::error("Invalid execution_mode \"{}\" (expected local, container or auto)", str);
  return false;
}

bool ParseLong(const char* name, const char* str, long& out) {
  char* end = nullptr;
  errno = 0;
  long val = strtol(str, &end, 10);
  if (errno || end == str || *end) {
    spdlog::error("Invalid integer for {}: \"{}\"", name, str);
    return false;
  }
  out = val;
  return true;
}

bool ParseDouble(const char* name, const char* str, double& out) {
  char* end = nullptr;
  errno = 0;
  double val = strtod(str, &end);
  if (errno || end == str || *end) {
    spdlog::error("Invalid number for {}: \"{}\"", name, str);
    return false;
  }
  out = val;
  return true;
}

bool ParseBool(const char* name, const std::string& str, bool& out) {
  std::string val = ToLower(Trim(str));
  if (val == "1" || val == "true" || val == "yes" || val == "on") {
    out = true;
  } else if (val == "0" || val == "false" || val == "no" || val == "off") {
    out = false;
  } else {
    spdlog::error("Invalid boolean for {}: \"{}\"", name, str);
    return false;
  }
  return true;
}

} // namespace

bool LoadConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string mode = ini[""]["execution_mode"] | "";
  if (mode.size() && !SetExecutionMode(mode)) return false;
  kDefaultTimeoutMs = ini[""]["timeout_ms"] | kDefaultTimeoutMs;
  kDefaultMemoryMb = ini[""]["memory_mb"] | kDefaultMemoryMb;
  kMaxOutputBytes = ini[""]["max_output_bytes"] | kMaxOutputBytes;
  kMaxCodeBytes = ini[""]["max_code_bytes"] | kMaxCodeBytes;
  kMaxStdinBytes = ini[""]["max_stdin_bytes"] | kMaxStdinBytes;
  kContainerCpus = ini[""]["container_cpus"] | kContainerCpus;
  std::string work_root = ini[""]["work_root"] | "";
  std::string database = ini[""]["database"] | "";
  std::string queue = ini[""]["queue"] | "";
  if (work_root.size()) kWorkRoot = work_root;
  if (database.size()) kDatabasePath = database;
  if (queue.size()) kQueuePath = queue;
  kJudgeEnabled = ini[""]["judge_enabled"] | kJudgeEnabled;
  kEnqueueTimeoutMs = ini[""]["enqueue_timeout_ms"] | kEnqueueTimeoutMs;
  kRemoteBaseUrl = ini[""]["remote_base_url"] | kRemoteBaseUrl;
  kRemoteAccessToken = ini[""]["remote_access_token"] | kRemoteAccessToken;
  kRemoteApiKey = ini[""]["remote_api_key"] | kRemoteApiKey;
  kRemoteTimeoutMs = ini[""]["remote_timeout_ms"] | kRemoteTimeoutMs;
  return true;
}

bool LoadEnvironment() {
  bool ok = true;
  auto get = [](const char* name) -> const char* {
    const char* val = getenv(name);
    return val && *val ? val : nullptr;
  };
  if (auto val = get("JUDGEBOX_EXECUTION_MODE")) ok &= SetExecutionMode(val);
  if (auto val = get("JUDGEBOX_TIMEOUT_MS")) ok &= ParseLong("JUDGEBOX_TIMEOUT_MS", val, kDefaultTimeoutMs);
  if (auto val = get("JUDGEBOX_MEMORY_MB")) ok &= ParseLong("JUDGEBOX_MEMORY_MB", val, kDefaultMemoryMb);
  if (auto val = get("JUDGEBOX_MAX_OUTPUT_BYTES")) {
    ok &= ParseLong("JUDGEBOX_MAX_OUTPUT_BYTES", val, kMaxOutputBytes);
  }
  if (auto val = get("JUDGEBOX_MAX_CODE_BYTES")) ok &= ParseLong("JUDGEBOX_MAX_CODE_BYTES", val, kMaxCodeBytes);
  if (auto val = get("JUDGEBOX_MAX_STDIN_BYTES")) ok &= ParseLong("JUDGEBOX_MAX_STDIN_BYTES", val, kMaxStdinBytes);
  if (auto val = get("JUDGEBOX_CONTAINER_CPUS")) ok &= ParseDouble("JUDGEBOX_CONTAINER_CPUS", val, kContainerCpus);
  if (auto val = get("JUDGEBOX_WORK_ROOT")) kWorkRoot = val;
  if (auto val = get("JUDGEBOX_DATABASE")) kDatabasePath = val;
  if (auto val = get("JUDGEBOX_QUEUE")) kQueuePath = val;
  if (auto val = get("JUDGEBOX_JUDGE_ENABLED")) ok &= ParseBool("JUDGEBOX_JUDGE_ENABLED", val, kJudgeEnabled);
  if (auto val = get("JUDGEBOX_ENQUEUE_TIMEOUT_MS")) {
    ok &= ParseLong("JUDGEBOX_ENQUEUE_TIMEOUT_MS", val, kEnqueueTimeoutMs);
  }
  if (auto val = get("JUDGEBOX_REMOTE_BASE_URL")) kRemoteBaseUrl = val;
  if (auto val = get("JUDGEBOX_REMOTE_ACCESS_TOKEN")) kRemoteAccessToken = val;
  if (auto val = get("JUDGEBOX_REMOTE_API_KEY")) kRemoteApiKey = val;
  if (auto val = get("JUDGEBOX_REMOTE_TIMEOUT_MS")) {
    ok &= ParseLong("JUDGEBOX_REMOTE_TIMEOUT_MS", val, kRemoteTimeoutMs);
  }
  return ok;
}
