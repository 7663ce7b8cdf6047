#ifndef INCLUDE_JUDGEBOX_ERRORS_H_
#define INCLUDE_JUDGEBOX_ERRORS_H_

#include <stdexcept>
#include <string>

class JudgeboxError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// oversized payload, unsupported language; rejected before any execution
class ValidationError : public JudgeboxError {
 public:
  using JudgeboxError::JudgeboxError;
};

// challenge not judge-ready; retrying cannot fix it
class ConfigurationError : public JudgeboxError {
 public:
  using JudgeboxError::JudgeboxError;
};

// sandbox / runner / provider unavailable; transient
class InfrastructureError : public JudgeboxError {
 public:
  using JudgeboxError::JudgeboxError;
};

class ProviderError : public InfrastructureError {
 public:
  // status = 0 for connection-level failures (no HTTP response)
  ProviderError(const std::string& what, int status) :
      InfrastructureError(what), status_(status) {}

  int Status() const { return status_; }
  bool IsConnectionError() const { return status_ == 0; }
  bool IsRetryable() const { return status_ == 0 || status_ >= 500; }

 private:
  int status_;
};

#endif  // INCLUDE_JUDGEBOX_ERRORS_H_
