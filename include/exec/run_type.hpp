#pragma once

#include <string_view>

namespace updatectrl {

// Chosen once per run; every step observes the same value.
enum class RunType { DryRun, Execute };

inline constexpr bool is_dry(RunType run_type) {
  return run_type == RunType::DryRun;
}

inline constexpr std::string_view to_string(RunType run_type) {
  return run_type == RunType::DryRun ? "dry-run" : "execute";
}

} // namespace updatectrl
