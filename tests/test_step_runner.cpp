#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "my_error_codes.hpp"
#include "steps/report.hpp"
#include "steps/step.hpp"
#include "steps/step_registry.hpp"
#include "steps/step_runner.hpp"
#include "test_support.hpp"

using updatectrl::ExecutionContext;
using updatectrl::make_error;
using updatectrl::steps::make_step;
using updatectrl::steps::OutcomeKind;
using updatectrl::steps::Report;
using updatectrl::steps::StepRegistry;
using updatectrl::steps::StepRunner;
using updatectrl::steps::StepStatus;

namespace {

// Step body that requires `tool` and then runs it.
updatectrl::steps::FunctionStep::Body run_tool(const std::string &tool) {
  return [tool](const ExecutionContext &ctx) -> StepStatus {
    auto path = ctx.require(tool);
    if (!path) {
      return updatectrl::requirement_missing(tool);
    }
    return ctx.execute(*path).arg("update").status_checked();
  };
}

std::vector<OutcomeKind> kinds(const Report &report) {
  std::vector<OutcomeKind> out;
  for (const auto &e : report.entries()) {
    out.push_back(e.outcome.kind);
  }
  return out;
}

} // namespace

TEST(StepRunnerTest, ClassifiesEveryErrorKind) {
  using updatectrl::Error;
  EXPECT_EQ(StepRunner::classify(std::nullopt, {}).kind, OutcomeKind::Succeeded);
  EXPECT_EQ(StepRunner::classify(updatectrl::requirement_missing("x"), {}).kind,
            OutcomeKind::Skipped);
  EXPECT_EQ(StepRunner::classify(
                make_error(my_errors::REQUIREMENT::PATH_MISSING, "gone"), {})
                .kind,
            OutcomeKind::Skipped);
  EXPECT_EQ(StepRunner::classify(updatectrl::exited_with(80, "restart"), {80})
                .kind,
            OutcomeKind::Ignored);
  EXPECT_EQ(StepRunner::classify(updatectrl::exited_with(1, "bad"), {80}).kind,
            OutcomeKind::Failed);
  EXPECT_EQ(StepRunner::classify(
                make_error(my_errors::EXEC::SPAWN_FAILED, "no exec"), {})
                .kind,
            OutcomeKind::Failed);
  EXPECT_EQ(StepRunner::classify(
                make_error(my_errors::IO::TRAVERSAL_FAILED, "walk"), {})
                .kind,
            OutcomeKind::Failed);
  EXPECT_EQ(StepRunner::classify(
                make_error(my_errors::GENERAL::UNEXPECTED_RESULT, "??"), {})
                .kind,
            OutcomeKind::Failed);
}

TEST(StepRunnerTest, KilledStepIsFailedEvenWhenCodeIsAccepted) {
  updatectrl::Error killed =
      make_error(my_errors::EXEC::KILLED_BY_SIGNAL, "killed by signal 2");
  killed.exit_code = 128 + 2;
  EXPECT_EQ(StepRunner::classify(killed, {130}).kind, OutcomeKind::Failed);
  EXPECT_EQ(StepRunner::classify(updatectrl::exited_with(130, "exit"), {130})
                .kind,
            OutcomeKind::Ignored);
}

TEST(StepRunnerTest, SkipReasonIsKept) {
  auto outcome = StepRunner::classify(updatectrl::requirement_missing("zr"), {});
  EXPECT_EQ(outcome.detail, "cannot find zr in PATH");
}

TEST(StepRunnerTest, OneFailingStepDoesNotStopTheRest) {
  testinfra::ContextHarness h;
  auto &ctx = h.build();
  Report report;
  StepRunner runner(ctx, report);

  constexpr int kSteps = 6;
  constexpr int kFailing = 2;
  int ran = 0;
  std::vector<updatectrl::steps::IStep::Ptr> steps;
  for (int i = 0; i < kSteps; ++i) {
    steps.push_back(make_step(
        "step" + std::to_string(i),
        [i, &ran](const ExecutionContext &) -> StepStatus {
          ++ran;
          if (i == kFailing) {
            return make_error(my_errors::GENERAL::UNEXPECTED_RESULT, "boom");
          }
          return std::nullopt;
        }));
  }
  runner.run_all(steps);

  EXPECT_EQ(ran, kSteps);
  ASSERT_EQ(report.size(), static_cast<std::size_t>(kSteps));
  for (int i = 0; i < kSteps; ++i) {
    EXPECT_EQ(report.entries()[i].step, "step" + std::to_string(i));
    EXPECT_EQ(report.entries()[i].outcome.kind,
              i == kFailing ? OutcomeKind::Failed : OutcomeKind::Succeeded);
  }
  EXPECT_EQ(report.exit_code(), 1);
}

TEST(StepRunnerTest, ThrowingStepIsFailedAndRunContinues) {
  testinfra::ContextHarness h;
  auto &ctx = h.build();
  Report report;
  StepRunner runner(ctx, report);

  runner.run_all(
      {make_step("thrower",
                 [](const ExecutionContext &) -> StepStatus {
                   throw std::runtime_error("exploded");
                 }),
       make_step("after",
                 [](const ExecutionContext &) -> StepStatus {
                   return std::nullopt;
                 })});

  ASSERT_EQ(report.size(), 2u);
  EXPECT_EQ(report.entries()[0].outcome.kind, OutcomeKind::Failed);
  EXPECT_NE(report.entries()[0].outcome.detail.find("exploded"),
            std::string::npos);
  EXPECT_EQ(report.entries()[1].outcome.kind, OutcomeKind::Succeeded);
}

TEST(StepRunnerTest, PresentAbsentAndAcceptedCodeEndToEnd) {
  testinfra::ContextHarness h;
  h.install("tool-a");
  h.install("tool-c");
  h.executor.on_program("tool-c", {80, "", ""});
  auto &ctx = h.build();

  Report report;
  StepRunner runner(ctx, report);
  runner.run_all({make_step("A", run_tool("tool-a")),
                  make_step("B", run_tool("tool-b")),
                  make_step("C", run_tool("tool-c"), {80})});

  EXPECT_EQ(kinds(report),
            (std::vector<OutcomeKind>{OutcomeKind::Succeeded,
                                      OutcomeKind::Skipped,
                                      OutcomeKind::Ignored}));
  EXPECT_EQ(report.exit_code(), 0);
  // B never reached the executor.
  EXPECT_EQ(h.executor.invocation_count(), 2u);
}

TEST(StepRunnerTest, RejectedExitCodeFailsTheRun) {
  testinfra::ContextHarness h;
  h.install("tool-a");
  h.install("tool-b");
  h.executor.on_program("tool-b", {1, "", ""});
  auto &ctx = h.build();

  Report report;
  StepRunner runner(ctx, report);
  runner.run_all({make_step("A", run_tool("tool-a")),
                  make_step("B", run_tool("tool-b"))});

  EXPECT_EQ(kinds(report), (std::vector<OutcomeKind>{OutcomeKind::Succeeded,
                                                     OutcomeKind::Failed}));
  EXPECT_NE(report.exit_code(), 0);
}

TEST(StepRunnerTest, DryRunInvokesNothing) {
  testinfra::ContextHarness h;
  h.install("tool-a");
  h.install("tool-b");
  h.executor.on_program("tool-b", {1, "", ""});
  auto &ctx = h.build(updatectrl::RunType::DryRun);

  Report report;
  StepRunner runner(ctx, report);
  runner.run_all({make_step("A", run_tool("tool-a")),
                  make_step("B", run_tool("tool-b"))});

  EXPECT_EQ(h.executor.invocation_count(), 0u);
  EXPECT_EQ(kinds(report), (std::vector<OutcomeKind>{OutcomeKind::Succeeded,
                                                     OutcomeKind::Succeeded}));
  EXPECT_EQ(ctx.dry_run_tracer().traces().size(), 2u);
  EXPECT_NE(h.console_buffer.str().find("Dry running:"), std::string::npos);
}

TEST(StepRunnerTest, SeparatorAnnouncesEachStep) {
  testinfra::ContextHarness h;
  auto &ctx = h.build();
  Report report;
  StepRunner runner(ctx, report);
  runner.run_all({make_step("antidote", [](const ExecutionContext &) -> StepStatus {
    return std::nullopt;
  })});
  EXPECT_NE(h.console_buffer.str().find("antidote"), std::string::npos);
}

TEST(ReportTest, CountsAndSummary) {
  Report report;
  report.push("zr", updatectrl::steps::Outcome::succeeded());
  report.push("antibody", updatectrl::steps::Outcome::skipped(
                              "cannot find antibody in PATH"));
  report.push("oh-my-zsh", updatectrl::steps::Outcome::ignored("exit 80"));
  report.push("zinit", updatectrl::steps::Outcome::failed("exit code 1"));

  EXPECT_EQ(report.count(OutcomeKind::Succeeded), 1u);
  EXPECT_EQ(report.count(OutcomeKind::Skipped), 1u);
  EXPECT_EQ(report.count(OutcomeKind::Ignored), 1u);
  EXPECT_EQ(report.count(OutcomeKind::Failed), 1u);
  EXPECT_TRUE(report.has_failures());
  EXPECT_EQ(report.exit_code(), 1);

  std::ostringstream buffer;
  customio::ConsoleOutput output(buffer, false);
  report.print(output);
  const auto text = buffer.str();
  EXPECT_NE(text.find("Summary"), std::string::npos);
  EXPECT_NE(text.find("zr: OK\n"), std::string::npos);
  EXPECT_NE(text.find("antibody: SKIPPED (cannot find antibody in PATH)"),
            std::string::npos);
  EXPECT_NE(text.find("oh-my-zsh: IGNORED (exit 80)"), std::string::npos);
  EXPECT_NE(text.find("zinit: FAILED (exit code 1)"), std::string::npos);
  EXPECT_NE(text.find("1 succeeded, 1 failed, 1 skipped, 1 ignored"),
            std::string::npos);
}

TEST(ReportTest, SkippedAndIgnoredDoNotFail) {
  Report report;
  report.push("a", updatectrl::steps::Outcome::skipped("absent"));
  report.push("b", updatectrl::steps::Outcome::ignored("accepted"));
  EXPECT_EQ(report.exit_code(), 0);
}

TEST(ReportTest, SilentOutputPrintsNothing) {
  Report report;
  report.push("a", updatectrl::steps::Outcome::succeeded());
  std::ostringstream buffer;
  customio::ConsoleOutput output(buffer, false);
  output.set_silent(true);
  report.print(output);
  EXPECT_TRUE(buffer.str().empty());
}

TEST(StepRegistryTest, SelectKeepsRegistrationOrder) {
  StepRegistry registry;
  auto noop = [](const ExecutionContext &) -> StepStatus { return std::nullopt; };
  registry.add(make_step("zr", noop));
  registry.add(make_step("zinit", noop));
  registry.add(make_step("zim", noop));

  auto names = [](const std::vector<updatectrl::steps::IStep::Ptr> &steps) {
    std::vector<std::string> out;
    for (const auto &s : steps) {
      out.push_back(s->name());
    }
    return out;
  };

  EXPECT_EQ(names(registry.select({}, {})),
            (std::vector<std::string>{"zr", "zinit", "zim"}));
  EXPECT_EQ(names(registry.select({"zim", "zr"}, {})),
            (std::vector<std::string>{"zr", "zim"}));
  EXPECT_EQ(names(registry.select({}, {"zinit"})),
            (std::vector<std::string>{"zr", "zim"}));
  EXPECT_EQ(names(registry.select({"zr", "zim"}, {"zim"})),
            (std::vector<std::string>{"zr"}));
}

TEST(StepRegistryTest, DuplicateNamesAreRejected) {
  StepRegistry registry;
  auto noop = [](const ExecutionContext &) -> StepStatus { return std::nullopt; };
  registry.add(make_step("zr", noop));
  EXPECT_THROW(registry.add(make_step("zr", noop)), std::invalid_argument);
  EXPECT_THROW(registry.add(nullptr), std::invalid_argument);
}

TEST(StepRegistryTest, UnknownNamesAreReported) {
  StepRegistry registry;
  registry.add(make_step("zr", [](const ExecutionContext &) -> StepStatus {
    return std::nullopt;
  }));
  EXPECT_EQ(registry.unknown({"zr", "nope"}), std::vector<std::string>{"nope"});
  EXPECT_TRUE(registry.unknown({"zr"}).empty());
}
