#include "update_ctrl_entry.hpp"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "common_macros.hpp"
#include "conf/updatectrl_config.hpp"
#include "customio/console_output.hpp"
#include "exec/command_executor.hpp"
#include "exec/requirement_resolver.hpp"
#include "exec/sudo.hpp"
#include "execution_context.hpp"
#include "git/git_client.hpp"
#include "steps/report.hpp"
#include "steps/step_runner.hpp"
#include "steps/zsh_steps.hpp"
#include "updatectrl_common.hpp"
#include "util/my_logging.hpp"
#include "util/path_util.hpp"
#include "util/string_util.hpp"

namespace {

constexpr int kExitUsage = 2;

void print_usage(std::ostream &os) {
  updatectrl::CliParams scratch;
  os << "Usage: update-ctrl [options]\n\n"
     << updatectrl::cli_options(scratch) << std::endl;
  os << "Steps:" << std::endl;
  for (const auto &name : updatectrl::make_default_registry().names()) {
    os << "  " << name << std::endl;
  }
}

// Names in --only/--disable that match no step.
std::vector<std::string>
unknown_step_names(const updatectrl::steps::StepRegistry &registry,
                   const updatectrl::CliParams &params) {
  auto unknown = registry.unknown(params.only);
  for (auto &name : registry.unknown(params.disable)) {
    unknown.push_back(std::move(name));
  }
  return unknown;
}

std::filesystem::path resolve_log_dir(const updatectrl::LoggingConfig &logging_config,
                         const updatectrl::BaseDirs &base_dirs) {
  if (!logging_config.log_dir.empty()) {
    return logging_config.log_dir;
  }
  return base_dirs.data_dir / "update-ctrl" / "logs";
}

} // namespace

namespace updatectrl {

steps::StepRegistry make_default_registry() {
  steps::StepRegistry registry;
  steps::register_zsh_steps(registry);
  return registry;
}

} // namespace updatectrl

int RunUpdateCtrlApplication(int argc, char *argv[]) {
  using namespace updatectrl;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i] ? std::string_view(argv[i])
                                         : std::string_view{};
    if (arg == "--version") {
      std::cout << UPDATECTRL_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  suspend_logging();

  try {
    std::optional<CliCtx> cli_ctx;
    try {
      cli_ctx.emplace(parse_cli(argc, argv));
    } catch (const po::error &ex) {
      std::cerr << "update-ctrl: " << ex.what() << "\n\n";
      print_usage(std::cerr);
      return kExitUsage;
    }

    if (cli_ctx->vm.count("help")) {
      print_usage(std::cout);
      return EXIT_SUCCESS;
    }

    Environment env = Environment::from_process();
    BaseDirs base_dirs;
    try {
      base_dirs = BaseDirs::from_environment(env);
    } catch (const std::runtime_error &ex) {
      std::cerr << "update-ctrl: " << ex.what() << std::endl;
      return EXIT_FAILURE;
    }

    fs::path config_file = cli_ctx->params.config_file.value_or(
        default_config_file(base_dirs.config_dir, env));
    if (cli_ctx->params.config_file && !fs::exists(config_file)) {
      std::cerr << "Config file does not exist: " << config_file.string()
                << std::endl;
      return EXIT_FAILURE;
    }

    std::optional<UpdatectrlConfigProviderFile> config_provider;
    try {
      // A dry run leaves the filesystem alone, default config included.
      config_provider.emplace(config_file, !cli_ctx->params.dry_run);
    } catch (const std::runtime_error &ex) {
      std::cerr << "Failed to load configuration: " << ex.what() << std::endl;
      return EXIT_FAILURE;
    }
    const UpdatectrlConfig &config = config_provider->get();
    cli_ctx->merge_config(config);
    const CliParams &params = cli_ctx->params;

    {
      LoggingConfig logging_config = config.logging;
      logging_config.level = cli_ctx->effective_log_level(config);
      logging_config.enabled = logging_config.enabled && !params.no_log_file;
      logging_config.console = !params.silent;
      logging_config.log_dir = resolve_log_dir(config.logging, base_dirs);
      if (logging_config.enabled) {
        std::error_code ec;
        fs::create_directories(logging_config.log_dir, ec);
        if (ec && !fs::exists(logging_config.log_dir)) {
          std::cerr << "Warning: unable to create log directory '"
                    << logging_config.log_dir.string() << "': " << ec.message()
                    << std::endl;
          logging_config.enabled = false;
        }
      }
      DEBUG_PRINT("log dir: " << logging_config.log_dir);
      init_my_log(logging_config);
    }
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Configuration loaded from " << config_provider->path().string()
        << (config_provider->bootstrapped() ? " (bootstrapped)" : "");

    steps::StepRegistry registry = make_default_registry();

    if (params.list_steps) {
      for (const auto &name : registry.names()) {
        std::cout << name << std::endl;
      }
      return EXIT_SUCCESS;
    }

    if (auto unknown = unknown_step_names(registry, params); !unknown.empty()) {
      std::cerr << "Unknown step(s): " << stringutil::join(unknown, ", ")
                << "\nKnown steps: " << stringutil::join(registry.names(), ", ")
                << std::endl;
      return kExitUsage;
    }

    RequirementResolver resolver(env.get("PATH").value_or(""));
    PosixCommandExecutor executor;
    git::GitClient git_client(resolver.require("git"), params.git_threads);
    std::optional<Sudo> sudo = Sudo::detect(resolver);

    customio::ConsoleOutput output;
    output.set_silent(params.silent);

    const RunType run_type = params.dry_run ? RunType::DryRun : RunType::Execute;
    ExecutionContext ctx(run_type, base_dirs, env, resolver, executor,
                         git_client, std::move(sudo), output);

    steps::Report report;
    steps::StepRunner runner(ctx, report);
    runner.run_all(registry.select(params.only, params.disable));
    report.print(output);

    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "Run finished: " << report.count(steps::OutcomeKind::Failed)
        << " failed of " << report.size() << " steps";
    return report.exit_code();
  } catch (const std::exception &e) {
    std::cerr << "error catched on main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunUpdateCtrlApplication(argc, argv); }
