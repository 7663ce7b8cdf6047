#include "judgebox/probe.h"

#include <spdlog/spdlog.h>
#include "judgebox/utils.h"

SystemProbe::SystemProbe(Runner& runner, std::string container_binary) :
    runner_(runner), binary_(std::move(container_binary)), container_available_(false) {}

bool SystemProbe::ContainerRuntimeAvailable() {
  std::call_once(container_flag_, [this]() { container_available_ = DetectContainerRuntime(); });
  return container_available_;
}

std::optional<std::string> SystemProbe::Interpreter(Language lang) {
  size_t idx = (size_t)lang;
  std::call_once(interpreter_flags_[idx], [this, lang, idx]() { interpreters_[idx] = DetectInterpreter(lang); });
  return interpreters_[idx];
}

bool SystemProbe::ContainerImageUsable(const std::string& image) {
  RunRequest req;
  req.command = binary_;
  req.args = {"image", "inspect", "--format", "{{.Id}}", image};
  req.timeout_ms = kProbeTimeoutMs;
  ProcessResult res = runner_.Run(req);
  if (res.timed_out || res.exit_code != 0 || Trim(res.stdout_data).empty()) {
    spdlog::warn("Container image {} unusable (exit={} timed_out={}): {}",
                 image, res.exit_code, res.timed_out, Trim(res.stderr_data));
    return false;
  }
  return true;
}

bool SystemProbe::DetectContainerRuntime() {
  RunRequest req;
  req.command = binary_;
  req.args = {"version", "--format", "{{.Server.Version}}"};
  req.timeout_ms = kProbeTimeoutMs;
  ProcessResult res = runner_.Run(req);
  std::string version = Trim(res.stdout_data);
  std::string err = ToLower(res.stderr_data);
  if (res.timed_out || res.exit_code != 0 || version.empty() ||
      ContainsAny(err, {"cannot connect", "not found", "permission denied", "error during connect"})) {
    spdlog::info("Container runtime unavailable (exit={} timed_out={}): {}",
                 res.exit_code, res.timed_out, Trim(res.stderr_data));
    return false;
  }
  spdlog::info("Container runtime available, server version {}", version);
  return true;
}

std::optional<std::string> SystemProbe::DetectInterpreter(Language lang) {
  if (!IsLocalLanguage(lang)) return std::nullopt;
  for (const char* cmd : {InterpreterCommand(lang), InterpreterAlias(lang)}) {
    RunRequest req;
    req.command = cmd;
    req.args = {"--version"};
    req.timeout_ms = kProbeTimeoutMs;
    ProcessResult res = runner_.Run(req);
    if (!res.timed_out && res.exit_code == 0) {
      spdlog::info("{} interpreter: {} ({})", LanguageDisplayName(lang), cmd,
                   Trim(res.stdout_data + res.stderr_data));
      return std::string(cmd);
    }
  }
  spdlog::warn("No {} interpreter found on host", LanguageDisplayName(lang));
  return std::nullopt;
}
