#pragma once

#include <vector>

#include "execution_context.hpp"
#include "steps/report.hpp"
#include "steps/step.hpp"

namespace updatectrl::steps {

// Runs steps one after another in the given order. Every step yields exactly
// one report entry; nothing a step does (error or exception) stops the run.
class StepRunner {
public:
  StepRunner(const ExecutionContext &ctx, Report &report)
      : ctx_(ctx), report_(report) {}

  Outcome run(IStep &step);
  void run_all(const std::vector<IStep::Ptr> &steps);

  static Outcome classify(const StepStatus &status,
                          const std::vector<int> &accepted_exit_codes);

private:
  const ExecutionContext &ctx_;
  Report &report_;
};

} // namespace updatectrl::steps
