#ifndef INCLUDE_JUDGEBOX_EXECUTION_PLAN_H_
#define INCLUDE_JUDGEBOX_EXECUTION_PLAN_H_

#include <string>
#include <vector>

#include "language.h"

#define ENUM_BACKEND_ \
  X(LOCAL, "local") \
  X(CONTAINER, "container")
enum class Backend {
#define X(name, str) name,
  ENUM_BACKEND_
#undef X
};

const char* BackendName(Backend);

// Ordered backends for one execution; the cursor only moves forward
class ExecutionPlan {
  std::vector<Backend> backends_;
  size_t cursor_;

 public:
  explicit ExecutionPlan(std::vector<Backend> backends);

  // local: [local]
  // container: [container] if the runtime is available, else [local]
  // auto: [container, local] if the runtime is available, else [local]
  static ExecutionPlan Build(ExecutionMode mode, bool container_available);

  Backend Current() const { return backends_[cursor_]; }
  bool CanFallback() const { return cursor_ + 1 < backends_.size(); }
  // move to the next backend; false if there is none
  bool Fallback();
  const std::vector<Backend>& Backends() const { return backends_; }
};

// Whether an error text reads like a message of the container runtime or of our own runners.
// Only phrases those produce; never sufficient on its own to leave the sandbox.
bool IsInfrastructureErrorText(const std::string&);

#endif  // INCLUDE_JUDGEBOX_EXECUTION_PLAN_H_
