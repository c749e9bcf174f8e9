#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "customio/console_output.hpp"
#include "update_error.hpp"

namespace updatectrl {

struct CommandSpec {
  std::filesystem::path program;
  std::vector<std::string> args;
  // Added on top of the inherited environment; later entries win.
  std::vector<std::pair<std::string, std::string>> env;
  std::optional<std::filesystem::path> cwd;
  bool capture_output{false};
};

struct CommandResult {
  int exit_code{-1};
  std::optional<int> term_signal;
  std::string stdout_data;
  std::string stderr_data;
  // Launch, wait or pipe failure. When set, exit_code is meaningless.
  std::optional<Error> error;
  bool dry_run{false};

  [[nodiscard]] bool completed() const { return !error.has_value(); }
};

// Renders "K=V program arg..." with shell quoting, for traces and errors.
std::string describe(const CommandSpec &spec);

class ICommandExecutor {
public:
  using Ptr = std::shared_ptr<ICommandExecutor>;

  virtual ~ICommandExecutor() = default;
  // Blocks until the process exits. Never throws for process-level failures;
  // those are reported through CommandResult::error.
  virtual CommandResult run(const CommandSpec &spec) = 0;
};

// fork/execvpe based executor. Children inherit the terminal unless
// capture_output is set, in which case stdin is /dev/null and both output
// streams are collected.
class PosixCommandExecutor : public ICommandExecutor {
public:
  CommandResult run(const CommandSpec &spec) override;
};

// Never spawns. Prints "Dry running: <command>" and keeps the trace.
class DryRunCommandExecutor : public ICommandExecutor {
public:
  explicit DryRunCommandExecutor(customio::ConsoleOutput &output)
      : output_(output) {}

  CommandResult run(const CommandSpec &spec) override;

  std::vector<std::string> traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
  }

private:
  customio::ConsoleOutput &output_;
  mutable std::mutex mutex_;
  std::vector<std::string> traces_;
};

} // namespace updatectrl
