#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "customio/console_output.hpp"

namespace updatectrl::steps {

enum class OutcomeKind { Succeeded, Skipped, Failed, Ignored };

std::string_view to_string(OutcomeKind kind);

struct Outcome {
  OutcomeKind kind{OutcomeKind::Succeeded};
  // Skip reason, or the underlying cause for Failed/Ignored
  std::string detail;

  static Outcome succeeded() { return {OutcomeKind::Succeeded, {}}; }
  static Outcome skipped(std::string reason) {
    return {OutcomeKind::Skipped, std::move(reason)};
  }
  static Outcome failed(std::string cause) {
    return {OutcomeKind::Failed, std::move(cause)};
  }
  static Outcome ignored(std::string cause) {
    return {OutcomeKind::Ignored, std::move(cause)};
  }
};

// Append-only, in run order.
class Report {
public:
  struct Entry {
    std::string step;
    Outcome outcome;
  };

  void push(std::string step, Outcome outcome) {
    entries_.push_back(Entry{std::move(step), std::move(outcome)});
  }

  const std::vector<Entry> &entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  std::size_t count(OutcomeKind kind) const;
  bool has_failures() const { return count(OutcomeKind::Failed) > 0; }

  // 0 unless some step failed
  int exit_code() const { return has_failures() ? 1 : 0; }

  void print(customio::ConsoleOutput &output) const;

private:
  std::vector<Entry> entries_;
};

} // namespace updatectrl::steps
