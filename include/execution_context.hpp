#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "customio/console_output.hpp"
#include "exec/command.hpp"
#include "exec/command_executor.hpp"
#include "exec/requirement_resolver.hpp"
#include "exec/run_type.hpp"
#include "exec/sudo.hpp"
#include "util/path_util.hpp"

namespace updatectrl {

namespace git {
class IGitClient;
}
using git::IGitClient;

// Lifetime: built once by the entrypoint before the first step and shared
// by reference with every step until the report is printed. Collaborators
// are borrowed and must outlive the context. Nothing here changes after
// construction except the resolver's internal cache.
class ExecutionContext {
public:
  ExecutionContext(RunType run_type, BaseDirs base_dirs, Environment env,
                   RequirementResolver &resolver, ICommandExecutor &executor,
                   IGitClient &git, std::optional<Sudo> sudo,
                   customio::ConsoleOutput &output);

  ExecutionContext(const ExecutionContext &) = delete;
  ExecutionContext &operator=(const ExecutionContext &) = delete;

  RunType run_type() const { return run_type_; }
  const BaseDirs &base_dirs() const { return base_dirs_; }
  const Environment &environment() const { return env_; }
  std::optional<std::string> env(std::string_view name) const {
    return env_.get(name);
  }

  std::optional<std::filesystem::path> require(std::string_view name) const {
    return resolver_.require(name);
  }

  // Mutating command: traced instead of spawned in dry-run mode.
  Command execute(std::filesystem::path program) const;
  // Read-only query (e.g. asking the shell for a variable). Output is
  // captured by the caller; under dry-run it is traced and yields nothing.
  Command probe(std::filesystem::path program) const;

  IGitClient &git() const { return git_; }
  const std::optional<Sudo> &sudo() const { return sudo_; }
  customio::ConsoleOutput &output() const { return output_; }
  const DryRunCommandExecutor &dry_run_tracer() const { return *dry_run_; }

private:
  RunType run_type_;
  BaseDirs base_dirs_;
  Environment env_;
  RequirementResolver &resolver_;
  ICommandExecutor &executor_;
  IGitClient &git_;
  std::optional<Sudo> sudo_;
  customio::ConsoleOutput &output_;
  std::unique_ptr<DryRunCommandExecutor> dry_run_;
};

} // namespace updatectrl
