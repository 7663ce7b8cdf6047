#ifndef INCLUDE_JUDGEBOX_PROBE_H_
#define INCLUDE_JUDGEBOX_PROBE_H_

#include <mutex>
#include <string>
#include <optional>

#include "language.h"
#include "runner.h"

// Answers what the host can execute. Constructed once and injected into the runner service.
class CapabilityProbe {
 public:
  virtual ~CapabilityProbe() = default;
  virtual bool ContainerRuntimeAvailable() = 0;
  // uncached: the runtime answers and the image is present locally
  virtual bool ContainerImageUsable(const std::string& image) = 0;
  // host interpreter command for a local language; nullopt if none is installed
  virtual std::optional<std::string> Interpreter(Language) = 0;
};

class SystemProbe : public CapabilityProbe {
 public:
  static constexpr long kProbeTimeoutMs = 3000;

  // runner executes the probe commands; it must outlive the probe
  explicit SystemProbe(Runner& runner, std::string container_binary = "docker");

  // both results are computed once per probe object
  bool ContainerRuntimeAvailable() override;
  bool ContainerImageUsable(const std::string& image) override;
  std::optional<std::string> Interpreter(Language) override;

 private:
  static constexpr size_t kLanguages = 0
#define X(...) + 1
    ENUM_LANGUAGE_
#undef X
    ;

  bool DetectContainerRuntime();
  std::optional<std::string> DetectInterpreter(Language);

  Runner& runner_;
  std::string binary_;
  std::once_flag container_flag_;
  bool container_available_;
  std::once_flag interpreter_flags_[kLanguages];
  std::optional<std::string> interpreters_[kLanguages];
};

#endif  // INCLUDE_JUDGEBOX_PROBE_H_
