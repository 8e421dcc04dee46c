#pragma once
#include <stdexcept>
#include <string>

namespace prsync {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &msg) : std::runtime_error(msg) {}

  // state-machine step in which the error surfaced ("resolve", "push", ...)
  const std::string &step() const { return step_; }
  void set_step(std::string step) {
    if (step_.empty())
      step_ = std::move(step);
  }

  virtual bool retryable() const { return false; }

private:
  std::string step_;
};

class VersionControlFailure : public Error {
public:
  VersionControlFailure(std::string command, int exit_code, std::string output)
      : Error("git command failed (rc=" + std::to_string(exit_code) +
              "): " + command + (output.empty() ? "" : "\n" + output)),
        command_(std::move(command)), exit_code_(exit_code),
        output_(std::move(output)) {}

  const std::string &command() const { return command_; }
  int exit_code() const { return exit_code_; }
  const std::string &output() const { return output_; }

private:
  std::string command_;
  int exit_code_;
  std::string output_;
};

class ConflictUnresolved : public Error {
public:
  explicit ConflictUnresolved(const std::string &details)
      : Error("unresolved conflict: " + details) {}
};

class ConcurrentUpdateRejected : public Error {
public:
  ConcurrentUpdateRejected(const std::string &ref, const std::string &output)
      : Error("push of " + ref + " rejected, remote moved: " + output),
        ref_(ref) {}

  bool retryable() const override { return true; }
  const std::string &ref() const { return ref_; }

private:
  std::string ref_;
};

class ConfigRestoreFailure : public Error {
public:
  explicit ConfigRestoreFailure(const std::string &msg)
      : Error("config restore failed: " + msg) {}
};

class InvalidBaseReference : public Error {
public:
  explicit InvalidBaseReference(const std::string &base)
      : Error("base reference does not resolve: " + base), base_(base) {}

  const std::string &base() const { return base_; }

private:
  std::string base_;
};

class ConfigurationError : public Error {
public:
  ConfigurationError(const std::string &parameter, const std::string &msg)
      : Error("invalid configuration for '" + parameter + "': " + msg),
        parameter_(parameter) {}

  const std::string &parameter() const { return parameter_; }

private:
  std::string parameter_;
};

class HostingServiceError : public Error {
public:
  HostingServiceError(const std::string &operation, long status,
                      const std::string &msg)
      : Error("hosting service error during " + operation +
              (status ? " (HTTP " + std::to_string(status) + ")" : "") +
              ": " + msg),
        operation_(operation), status_(status) {}

  const std::string &operation() const { return operation_; }
  long status() const { return status_; }

private:
  std::string operation_;
  long status_;
};

class AuthenticationError : public HostingServiceError {
public:
  explicit AuthenticationError(const std::string &msg)
      : HostingServiceError("authentication", 401, msg) {}
};

} // namespace prsync
