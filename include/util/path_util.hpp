#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "update_error.hpp"

namespace updatectrl {

namespace fs = std::filesystem;

// Snapshot of the process environment taken once per run, so every lookup
// during the run sees the same values.
class Environment {
public:
  Environment() = default;
  explicit Environment(std::map<std::string, std::string> vars)
      : vars_(vars.begin(), vars.end()) {}

  static Environment from_process();

  // nullopt when unset or empty.
  std::optional<std::string> get(std::string_view name) const;
  void set(std::string name, std::string value) {
    vars_[std::move(name)] = std::move(value);
  }

private:
  std::map<std::string, std::string, std::less<>> vars_;
};

struct BaseDirs {
  fs::path home_dir;
  fs::path config_dir;
  fs::path data_dir;

  // HOME, falling back to the password database. XDG_CONFIG_HOME and
  // XDG_DATA_HOME are honored when absolute.
  // Throws std::runtime_error when no home directory can be determined.
  static BaseDirs from_environment(const Environment &env);
};

using PathProbe = std::function<std::optional<std::string>()>;

// First non-empty of: the explicit value, the probe's answer, the fallback.
fs::path resolve_path(const std::optional<std::string> &explicit_value,
                      const PathProbe &probe, fs::path fallback);

// nullopt when `path` exists; otherwise a NotApplicable error.
std::optional<Error> require_path(const fs::path &path);

} // namespace updatectrl
