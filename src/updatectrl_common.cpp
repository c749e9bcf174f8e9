#include "updatectrl_common.hpp"

namespace updatectrl {

po::options_description cli_options(CliParams &params) {
  po::options_description generic_desc("update-ctrl: keep shell plugin "
                                       "managers up to date");
  generic_desc.add_options() //
      ("dry-run,n", po::bool_switch(&params.dry_run)->default_value(false),
       "print the commands that would run without running them.") //
      ("only", po::value<std::vector<std::string>>(&params.only)->multitoken(),
       "run only the named steps.") //
      ("disable",
       po::value<std::vector<std::string>>(&params.disable)->multitoken(),
       "skip the named steps.") //
      ("config-file",
       po::value<std::string>()->value_name("PATH")->notifier(
           [&params](const std::string &value) {
             params.config_file = fs::path(value);
           }),
       "configuration file to use instead of the default.") //
      ("verbose", po::value<std::string>(&params.verbose)->default_value("info"),
       "verbosity level, like info, trace, vvvv.") //
      ("silent", po::bool_switch(&params.silent)->default_value(false),
       "suppress all output.") //
      ("git-threads",
       po::value<std::size_t>(&params.git_threads)->default_value(0),
       "parallel git pulls, 0 for automatic.") //
      ("no-log-file", po::bool_switch(&params.no_log_file)->default_value(false),
       "do not write a log file for this run.") //
      ("list-steps", po::bool_switch(&params.list_steps)->default_value(false),
       "print the known steps in run order and exit.") //
      ("version", "print the version and exit.") //
      ("help,h", "Print help");
  return generic_desc;
}

CliCtx parse_cli(int argc, const char *const argv[]) {
  CliParams params;
  po::variables_map vm;
  auto desc = cli_options(params);
  auto parsed = po::command_line_parser(argc, argv).options(desc).run();
  auto stray = po::collect_unrecognized(parsed.options, po::include_positional);
  if (!stray.empty()) {
    throw po::error("unexpected argument '" + stray.front() + "'");
  }
  po::store(parsed, vm);
  if (!vm.count("help")) {
    po::notify(vm);
  }
  return CliCtx(std::move(vm), std::move(params));
}

} // namespace updatectrl
