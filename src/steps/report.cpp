#include "steps/report.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace updatectrl::steps {

std::string_view to_string(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::Succeeded:
    return "OK";
  case OutcomeKind::Skipped:
    return "SKIPPED";
  case OutcomeKind::Failed:
    return "FAILED";
  case OutcomeKind::Ignored:
    return "IGNORED";
  }
  return "UNKNOWN";
}

std::size_t Report::count(OutcomeKind kind) const {
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(),
                    [kind](const Entry &e) { return e.outcome.kind == kind; }));
}

void Report::print(customio::ConsoleOutput &output) const {
  if (output.silent()) {
    return;
  }
  output.separator("Summary");
  auto &printer = output.printer();
  auto &os = printer.stream();
  for (const auto &entry : entries_) {
    os << entry.step << ": ";
    const auto label = to_string(entry.outcome.kind);
    switch (entry.outcome.kind) {
    case OutcomeKind::Succeeded:
      printer.green() << label;
      break;
    case OutcomeKind::Skipped:
      printer.cyan() << label;
      break;
    case OutcomeKind::Failed:
      printer.red() << label;
      break;
    case OutcomeKind::Ignored:
      printer.yellow() << label;
      break;
    }
    if (!entry.outcome.detail.empty()) {
      os << " (" << entry.outcome.detail << ")";
    }
    os << '\n';
  }
  os << fmt::format("\n{} succeeded, {} failed, {} skipped, {} ignored",
                    count(OutcomeKind::Succeeded), count(OutcomeKind::Failed),
                    count(OutcomeKind::Skipped), count(OutcomeKind::Ignored))
     << std::endl;
}

} // namespace updatectrl::steps
