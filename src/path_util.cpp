#include "util/path_util.hpp"

#include <stdexcept>
#include <system_error>

#include <pwd.h>
#include <unistd.h>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"

extern char **environ;

namespace updatectrl {

Environment Environment::from_process() {
  std::map<std::string, std::string> vars;
  for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
    std::string entry(*e);
    auto eq = entry.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    vars.emplace(entry.substr(0, eq), entry.substr(eq + 1));
  }
  return Environment(std::move(vars));
}

std::optional<std::string> Environment::get(std::string_view name) const {
  auto it = vars_.find(name);
  if (it == vars_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

namespace {

fs::path xdg_or(const Environment &env, std::string_view var,
                const fs::path &fallback) {
  if (auto value = env.get(var)) {
    fs::path p(*value);
    if (p.is_absolute()) {
      return p;
    }
  }
  return fallback;
}

} // namespace

BaseDirs BaseDirs::from_environment(const Environment &env) {
  fs::path home;
  if (auto value = env.get("HOME")) {
    home = *value;
  } else if (const struct passwd *pw = ::getpwuid(::getuid());
             pw != nullptr && pw->pw_dir != nullptr && *pw->pw_dir) {
    home = pw->pw_dir;
  } else {
    throw std::runtime_error("Cannot determine the home directory");
  }

  BaseDirs dirs;
  dirs.home_dir = home;
  dirs.config_dir = xdg_or(env, "XDG_CONFIG_HOME", home / ".config");
  dirs.data_dir = xdg_or(env, "XDG_DATA_HOME", home / ".local" / "share");
  return dirs;
}

fs::path resolve_path(const std::optional<std::string> &explicit_value,
                      const PathProbe &probe, fs::path fallback) {
  if (explicit_value && !explicit_value->empty()) {
    return fs::path(*explicit_value);
  }
  if (probe) {
    if (auto probed = probe(); probed && !probed->empty()) {
      return fs::path(*probed);
    }
  }
  return fallback;
}

std::optional<Error> require_path(const fs::path &path) {
  std::error_code ec;
  if (fs::exists(path, ec)) {
    return std::nullopt;
  }
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << "Path " << path.string() << " doesn't exist";
  return make_error(my_errors::REQUIREMENT::PATH_MISSING,
                    path.string() + " does not exist");
}

} // namespace updatectrl
