#pragma once

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "exec/command_executor.hpp"
#include "update_error.hpp"

namespace updatectrl {

// Builder for one external invocation, bound to the executor that will run
// it (real or dry-run). Cheap to copy; nothing happens until one of the
// *_checked methods is called.
class Command {
public:
  Command(ICommandExecutor &executor, std::filesystem::path program);

  Command &arg(std::string value);
  Command &args(std::initializer_list<std::string> values);
  Command &args(const std::vector<std::string> &values);
  Command &env(std::string key, std::string value);
  Command &current_dir(std::filesystem::path dir);

  const CommandSpec &spec() const { return spec_; }
  std::string describe() const { return updatectrl::describe(spec_); }

  // Success is exit code 0. Output is not captured.
  [[nodiscard]] std::optional<Error> status_checked() const;
  // Success is exit code 0 or one of `accepted`.
  [[nodiscard]] std::optional<Error>
  status_checked_with_codes(const std::vector<int> &accepted) const;

  // Captures stdout/stderr. result.error is set when the process could not
  // run or exited non-zero.
  [[nodiscard]] CommandResult output_checked() const;
  // As output_checked, additionally failing when stdout is not UTF-8.
  [[nodiscard]] CommandResult output_checked_utf8() const;

private:
  ICommandExecutor *executor_;
  CommandSpec spec_;
};

} // namespace updatectrl
