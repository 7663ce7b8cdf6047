#ifndef INCLUDE_JUDGEBOX_CONFIG_H_
#define INCLUDE_JUDGEBOX_CONFIG_H_

#include <string>
#include <optional>
#include <filesystem>

#include "language.h"

namespace fs = std::filesystem;

extern ExecutionMode kExecutionMode;
// default execution limits
extern long kDefaultTimeoutMs;
extern long kDefaultMemoryMb;
extern long kMaxOutputBytes;
// hard payload ceilings for ad-hoc runs
extern long kMaxCodeBytes;
extern long kMaxStdinBytes;
extern double kContainerCpus;
// per-execution temporary directories are created under here
extern fs::path kWorkRoot;
// submission / run store; also holds the read-only challenge tables
extern fs::path kDatabasePath;
// queue broker location
extern fs::path kQueuePath;
extern bool kJudgeEnabled;
extern long kEnqueueTimeoutMs;
// remote execution provider
extern std::string kRemoteBaseUrl;
extern std::string kRemoteAccessToken;
extern std::string kRemoteApiKey;
extern long kRemoteTimeoutMs;

struct ExecutionLimits {
  long timeout_ms;
  long memory_mb;
  long max_output_bytes;
};

// Per-call overrides; unset fields take the configured defaults
struct LimitOverrides {
  std::optional<long> timeout_ms;
  std::optional<long> memory_mb;
  std::optional<long> max_output_bytes;
};

constexpr long kMinTimeoutMs = 1000;
constexpr long kMinMemoryMb = 32;
constexpr long kMinOutputBytes = 2048;

// Overrides are clamped to the floors above
ExecutionLimits ResolveLimits(const LimitOverrides& = {});

// INI file (tortellini); returns false if the file cannot be opened or has an invalid value
bool LoadConfig(const fs::path&);
// JUDGEBOX_* environment variables, applied after the file
bool LoadEnvironment();

#endif  // INCLUDE_JUDGEBOX_CONFIG_H_
