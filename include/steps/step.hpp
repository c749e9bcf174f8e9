#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "execution_context.hpp"
#include "update_error.hpp"

namespace updatectrl::steps {

// nullopt on success. RequirementMissing and NotApplicable errors mean the
// step does not apply here and are reported as skipped.
using StepStatus = std::optional<Error>;

// Minimal common contract for update steps
struct IStep {
  using Ptr = std::shared_ptr<IStep>;

  virtual ~IStep() = default;
  // Identifier used by --only/--disable and the label of its separator
  virtual std::string name() const = 0;
  virtual StepStatus run(const ExecutionContext &ctx) = 0;
  // Non-zero exit codes that the runner reports as ignored for this step
  virtual std::vector<int> accepted_exit_codes() const { return {}; }
};

class FunctionStep : public IStep {
public:
  using Body = std::function<StepStatus(const ExecutionContext &)>;

  FunctionStep(std::string name, Body body,
               std::vector<int> accepted_exit_codes = {})
      : name_(std::move(name)), body_(std::move(body)),
        accepted_(std::move(accepted_exit_codes)) {}

  std::string name() const override { return name_; }

  StepStatus run(const ExecutionContext &ctx) override {
    if (!body_) {
      return make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                        "step '" + name_ + "' has no body");
    }
    return body_(ctx);
  }

  std::vector<int> accepted_exit_codes() const override { return accepted_; }

private:
  std::string name_;
  Body body_;
  std::vector<int> accepted_;
};

inline IStep::Ptr make_step(std::string name, FunctionStep::Body body,
                            std::vector<int> accepted_exit_codes = {}) {
  return std::make_shared<FunctionStep>(std::move(name), std::move(body),
                                        std::move(accepted_exit_codes));
}

} // namespace updatectrl::steps
