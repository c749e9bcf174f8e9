#pragma once

#include <algorithm>
#include <boost/program_options.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common_macros.hpp"
#include "conf/updatectrl_config.hpp"

namespace updatectrl {

namespace fs = std::filesystem;
namespace po = boost::program_options;

struct CliParams {
  bool dry_run = false;
  std::vector<std::string> only;
  std::vector<std::string> disable;
  std::optional<fs::path> config_file;
  std::string verbose; // trace|debug|info|warning|error or vvvv
  bool silent = false;
  std::size_t git_threads = 0;
  bool no_log_file = false;
  bool list_steps = false;
};

struct CliCtx {
  po::variables_map vm;
  CliParams params;

  CliCtx(po::variables_map &&vm, CliParams &&params_)
      : vm(std::move(vm)), params(std::move(params_)) {}
  CliCtx(CliCtx &&) = default;
  CliCtx &operator=(CliCtx &&) = default;

  // True iff the option exists in the variables_map and was not defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }

  // Severity name matching verbosity_level(), for the log filter.
  std::string log_level() const {
    switch (verbosity_level()) {
    case 0:
    case 1:
      return "error";
    case 2:
      return "warning";
    case 3:
      return "info";
    case 4:
      return "debug";
    default:
      return "trace";
    }
  }

  // Log threshold: an explicit verbosity (command line or misc.verbose)
  // wins over logging.level.
  std::string effective_log_level(const UpdatectrlConfig &cfg) const {
    if (is_specified_by_user("verbose") || !cfg.verbose.empty()) {
      return log_level();
    }
    return cfg.logging.level;
  }

  // Command-line values win over the configuration file when given.
  void merge_config(const UpdatectrlConfig &cfg) {
    if (!is_specified_by_user("dry-run")) {
      params.dry_run = cfg.dry_run;
    }
    if (!is_specified_by_user("only")) {
      params.only = cfg.only;
    }
    if (!is_specified_by_user("disable")) {
      params.disable = cfg.disable;
    }
    if (!is_specified_by_user("verbose") && !cfg.verbose.empty()) {
      params.verbose = cfg.verbose;
    }
    if (!is_specified_by_user("git-threads")) {
      params.git_threads = cfg.git_max_concurrency;
    }
  }

  ~CliCtx() { DEBUG_PRINT("CliCtx destroyed"); }
};

// Options shown by --help, bound to `params`.
po::options_description cli_options(CliParams &params);

// Parses the command line into a CliCtx. Unknown options and positional
// arguments are rejected with po::error.
CliCtx parse_cli(int argc, const char *const argv[]);

} // namespace updatectrl
