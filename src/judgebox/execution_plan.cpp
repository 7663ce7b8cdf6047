#include "judgebox/execution_plan.h"

#include "judgebox/utils.h"

namespace {

const char* kBackendNameTable[] = {
#define X(name, str) str,
  ENUM_BACKEND_
#undef X
};

} // namespace

const char* BackendName(Backend backend) {
  return kBackendNameTable[(int)backend];
}

ExecutionPlan::ExecutionPlan(std::vector<Backend> backends) :
    backends_(std::move(backends)), cursor_(0) {
  if (backends_.empty()) backends_.push_back(Backend::LOCAL);
}

ExecutionPlan ExecutionPlan::Build(ExecutionMode mode, bool container_available) {
  switch (mode) {
    case ExecutionMode::LOCAL:
      return ExecutionPlan({Backend::LOCAL});
    case ExecutionMode::CONTAINER:
      return ExecutionPlan({container_available ? Backend::CONTAINER : Backend::LOCAL});
    case ExecutionMode::AUTO:
      if (!container_available) return ExecutionPlan({Backend::LOCAL});
      return ExecutionPlan({Backend::CONTAINER, Backend::LOCAL});
  }
  __builtin_unreachable();
}

bool ExecutionPlan::Fallback() {
  if (!CanFallback()) return false;
  cursor_++;
  return true;
}

bool IsInfrastructureErrorText(const std::string& text) {
  std::string str = ToLower(text);
  return ContainsAny(str, {
      "cannot connect to the docker daemon",
      "is the docker daemon running",
      "error during connect",
      "permission denied while trying to connect",
      "unable to find image",
      "command not found",
      "executable file not found",
      "is not recognized as an internal or external command",
      "context canceled",
      "interpreter not found",
      "failed to spawn process",
      "failed to prepare sandbox",
  });
}
