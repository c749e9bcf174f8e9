#include "steps/step_runner.hpp"

#include <algorithm>
#include <exception>
#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"

namespace updatectrl::steps {

Outcome StepRunner::classify(const StepStatus &status,
                             const std::vector<int> &accepted_exit_codes) {
  if (!status) {
    return Outcome::succeeded();
  }
  const Error &err = *status;
  switch (err.kind()) {
  case ErrorKind::RequirementMissing:
  case ErrorKind::NotApplicable:
    return Outcome::skipped(err.what);
  case ErrorKind::NonZeroExit:
    // A signal death is never an accepted exit, whatever 128+n maps to.
    if (err.code == my_errors::EXEC::NON_ZERO_EXIT && err.exit_code &&
        std::find(accepted_exit_codes.begin(), accepted_exit_codes.end(),
                  *err.exit_code) != accepted_exit_codes.end()) {
      return Outcome::ignored(err.what);
    }
    return Outcome::failed(err.what);
  case ErrorKind::SpawnFailure:
  case ErrorKind::IOFailure:
  case ErrorKind::Unexpected:
    return Outcome::failed(err.what);
  }
  return Outcome::failed(err.what);
}

Outcome StepRunner::run(IStep &step) {
  const std::string name = step.name();
  ctx_.output().separator(name);
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << "Running step '" << name << "' (" << to_string(ctx_.run_type())
      << ")";

  StepStatus status;
  try {
    status = step.run(ctx_);
  } catch (const std::exception &ex) {
    status = make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                        fmt::format("step threw: {}", ex.what()));
  }

  Outcome outcome = classify(status, step.accepted_exit_codes());
  switch (outcome.kind) {
  case OutcomeKind::Succeeded:
    BOOST_LOG_SEV(app_logger(), trivial::info) << "Step '" << name << "' OK";
    break;
  case OutcomeKind::Skipped:
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Step '" << name << "' skipped: " << outcome.detail;
    break;
  case OutcomeKind::Ignored:
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << "Step '" << name << "' ignored: " << outcome.detail;
    break;
  case OutcomeKind::Failed:
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Step '" << name << "' failed: " << outcome.detail;
    break;
  }

  report_.push(name, outcome);
  return outcome;
}

void StepRunner::run_all(const std::vector<IStep::Ptr> &steps) {
  for (const auto &step : steps) {
    if (!step) {
      continue;
    }
    run(*step);
  }
}

} // namespace updatectrl::steps
