#include "conf/updatectrl_config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace updatectrl {

po::options_description config_file_options(UpdatectrlConfig &cfg) {
  po::options_description desc("update-ctrl configuration");
  desc.add_options() //
      ("misc.dry_run", po::value<bool>(&cfg.dry_run)->default_value(false),
       "print commands instead of running them") //
      ("misc.disable", po::value<std::vector<std::string>>(&cfg.disable)
                           ->composing(),
       "steps never to run") //
      ("misc.only", po::value<std::vector<std::string>>(&cfg.only)->composing(),
       "run only these steps") //
      ("misc.verbose", po::value<std::string>(&cfg.verbose),
       "verbosity level") //
      ("git.max_concurrency",
       po::value<std::size_t>(&cfg.git_max_concurrency)->default_value(0),
       "parallel git pulls, 0 for automatic") //
      ("logging.enabled",
       po::value<bool>(&cfg.logging.enabled)->default_value(true),
       "write a log file") //
      ("logging.level",
       po::value<std::string>(&cfg.logging.level)->default_value("info"),
       "log severity threshold") //
      ("logging.log_dir",
       po::value<std::string>()->notifier(
           [&cfg](const std::string &dir) { cfg.logging.log_dir = dir; }),
       "log directory") //
      ("logging.log_file",
       po::value<std::string>(&cfg.logging.log_file)
           ->default_value("update-ctrl"),
       "log file stem") //
      ("logging.rotation_size",
       po::value<std::size_t>(&cfg.logging.rotation_size)
           ->default_value(10 * 1024 * 1024),
       "bytes per log file before rotating");
  return desc;
}

UpdatectrlConfig parse_config(std::istream &is,
                              const std::string &source_name) {
  UpdatectrlConfig cfg;
  auto desc = config_file_options(cfg);
  try {
    po::variables_map vm;
    po::store(po::parse_config_file(is, desc, false), vm);
    po::notify(vm);
  } catch (const po::error &ex) {
    throw std::runtime_error("invalid configuration in " + source_name + ": " +
                             ex.what());
  }
  return cfg;
}

std::string default_config_text() {
  std::ostringstream oss;
  oss << "# update-ctrl configuration\n"
      << "# Command-line options take precedence over values in this file.\n"
      << "\n"
      << "[misc]\n"
      << "# Print the commands instead of running them.\n"
      << "# dry_run = false\n"
      << "\n"
      << "# Steps to skip. Repeat the key for more than one.\n"
      << "# disable = oh-my-zsh\n"
      << "\n"
      << "# When set, run only the listed steps.\n"
      << "# only = zinit\n"
      << "\n"
      << "# trace, debug, info, warning or error\n"
      << "# verbose = info\n"
      << "\n"
      << "[git]\n"
      << "# Parallel repository pulls. 0 uses one per CPU, at most 8.\n"
      << "# max_concurrency = 0\n"
      << "\n"
      << "[logging]\n"
      << "# enabled = true\n"
      << "# level = info\n"
      << "# log_dir = ~/.local/share/update-ctrl/logs\n"
      << "# log_file = update-ctrl\n"
      << "# rotation_size = 10485760\n";
  return oss.str();
}

fs::path default_config_file(const fs::path &config_dir,
                             const Environment &env) {
  if (auto dir = env.get("UPDATECTRL_CONFIG_DIR")) {
    return fs::path(*dir) / "update-ctrl.conf";
  }
  return config_dir / "update-ctrl" / "update-ctrl.conf";
}

UpdatectrlConfigProviderFile::UpdatectrlConfigProviderFile(fs::path file,
                                                           bool bootstrap)
    : file_(std::move(file)) {
  if (!fs::exists(file_) && !bootstrap) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "No configuration at " << file_.string() << ", using defaults";
    std::istringstream defaults(default_config_text());
    config_ = parse_config(defaults, "built-in defaults");
    return;
  }
  if (!fs::exists(file_)) {
    std::error_code ec;
    if (file_.has_parent_path()) {
      fs::create_directories(file_.parent_path(), ec);
    }
    if (ec && !fs::exists(file_.parent_path())) {
      throw std::runtime_error("Failed to create directory '" +
                               file_.parent_path().string() +
                               "': " + ec.message());
    }
    std::ofstream ofs(file_);
    if (!ofs) {
      throw std::runtime_error("Unable to write default config file: " +
                               file_.string());
    }
    ofs << default_config_text();
    bootstrapped_ = true;
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Wrote default configuration to " << file_.string();
  }

  std::ifstream ifs(file_);
  if (!ifs) {
    throw std::runtime_error("Unable to read config file: " + file_.string());
  }
  config_ = parse_config(ifs, file_.string());
}

} // namespace updatectrl
