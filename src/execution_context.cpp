#include "execution_context.hpp"

#include <utility>

#include "util/my_logging.hpp"

namespace updatectrl {

ExecutionContext::ExecutionContext(RunType run_type, BaseDirs base_dirs,
                                   Environment env,
                                   RequirementResolver &resolver,
                                   ICommandExecutor &executor, IGitClient &git,
                                   std::optional<Sudo> sudo,
                                   customio::ConsoleOutput &output)
    : run_type_(run_type), base_dirs_(std::move(base_dirs)),
      env_(std::move(env)), resolver_(resolver), executor_(executor),
      git_(git), sudo_(std::move(sudo)), output_(output),
      dry_run_(std::make_unique<DryRunCommandExecutor>(output)) {
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << "Execution context: mode=" << to_string(run_type_)
      << " home=" << base_dirs_.home_dir.string()
      << " sudo=" << (sudo_ ? std::string(sudo_->name()) : "none");
}

Command ExecutionContext::execute(std::filesystem::path program) const {
  if (is_dry(run_type_)) {
    return Command(*dry_run_, std::move(program));
  }
  return Command(executor_, std::move(program));
}

Command ExecutionContext::probe(std::filesystem::path program) const {
  if (is_dry(run_type_)) {
    return Command(*dry_run_, std::move(program));
  }
  return Command(executor_, std::move(program));
}

} // namespace updatectrl
