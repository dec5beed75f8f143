#pragma once

#include "pipeaudit/core/result.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace pipeaudit::process {

struct SubprocessRequest {
  std::string program;  // resolved through PATH
  std::vector<std::string> args;
  std::optional<std::string> working_directory;
  // Bounded wait; the child is killed with SIGKILL once it elapses.
  std::chrono::milliseconds timeout{std::chrono::seconds{120}};
};

struct SubprocessResult {
  int exit_code{0};  // 128 + signal number when the child was killed by a signal
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out{false};
};

// ISubprocessRunner runs one external command to completion and captures its output.
// Returns an error only when the command could not be started at all.
class ISubprocessRunner {
 public:
  virtual ~ISubprocessRunner() = default;

  [[nodiscard]] virtual core::Result<SubprocessResult, std::string> run(
      const SubprocessRequest& request) = 0;

 protected:
  ISubprocessRunner() = default;
  ISubprocessRunner(const ISubprocessRunner&) = default;
  ISubprocessRunner& operator=(const ISubprocessRunner&) = default;
  ISubprocessRunner(ISubprocessRunner&&) = default;
  ISubprocessRunner& operator=(ISubprocessRunner&&) = default;
};

// PosixSubprocessRunner forks and execs the program, drains stdout and stderr through
// pipes with poll(2), and enforces the request timeout.
class PosixSubprocessRunner final : public ISubprocessRunner {
 public:
  [[nodiscard]] core::Result<SubprocessResult, std::string> run(
      const SubprocessRequest& request) override;
};

}  // namespace pipeaudit::process
