#pragma once

#include <boost/program_options.hpp>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "util/my_logging.hpp"
#include "util/path_util.hpp"

namespace updatectrl {

namespace fs = std::filesystem;
namespace po = boost::program_options;

struct UpdatectrlConfig {
  bool dry_run{false};
  std::vector<std::string> disable;
  std::vector<std::string> only;
  // Empty when the file does not set misc.verbose
  std::string verbose;
  // 0 means one worker per CPU, capped at 8
  std::size_t git_max_concurrency{0};
  LoggingConfig logging;
};

// INI keys understood in the configuration file, bound to `cfg`.
po::options_description config_file_options(UpdatectrlConfig &cfg);

// Parses INI content. Unknown keys are rejected.
// Throws std::runtime_error naming `source_name` on malformed input.
UpdatectrlConfig parse_config(std::istream &is, const std::string &source_name);

// Commented default written when no configuration file exists yet.
std::string default_config_text();

// <config_dir>/update-ctrl/update-ctrl.conf, or
// $UPDATECTRL_CONFIG_DIR/update-ctrl.conf when `env` sets that variable.
fs::path default_config_file(const fs::path &config_dir, const Environment &env);

class IUpdatectrlConfigProvider {
public:
  virtual ~IUpdatectrlConfigProvider() = default;

  virtual const UpdatectrlConfig &get() const = 0;
  virtual UpdatectrlConfig &get() = 0;
};

class UpdatectrlConfigProviderFile : public IUpdatectrlConfigProvider {
private:
  fs::path file_;
  UpdatectrlConfig config_;
  bool bootstrapped_{false};

public:
  // Loads `file`. When it is missing the defaults apply, and with
  // `bootstrap` set the commented default file is written first.
  // Throws std::runtime_error when the file cannot be written or parsed.
  explicit UpdatectrlConfigProviderFile(fs::path file, bool bootstrap = true);

  const UpdatectrlConfig &get() const override { return config_; }
  UpdatectrlConfig &get() override { return config_; }

  const fs::path &path() const { return file_; }
  bool bootstrapped() const { return bootstrapped_; }
};

} // namespace updatectrl
