#include "steps/zsh_steps.hpp"

#include <fmt/format.h>
#include <optional>
#include <string>

#include "git/git_client.hpp"
#include "git/repositories.hpp"
#include "util/my_logging.hpp"
#include "util/path_util.hpp"
#include "util/string_util.hpp"

namespace updatectrl::steps {

namespace zsh {

namespace {

// Asks zsh for a value; nullopt when the shell fails or prints nothing.
// Empty under dry-run, so the caller's default applies and nothing spawns.
PathProbe shell_probe(const ExecutionContext &ctx, fs::path zsh,
                      std::string script) {
  if (is_dry(ctx.run_type())) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Dry run: not asking zsh for '" << script << "'";
    return nullptr;
  }
  return [&ctx, zsh = std::move(zsh),
          script = std::move(script)]() -> std::optional<std::string> {
    auto result = ctx.probe(zsh).args({"-c", script}).output_checked_utf8();
    if (result.error) {
      BOOST_LOG_SEV(app_logger(), trivial::debug)
          << "zsh probe '" << script << "' failed: " << result.error->what;
      return std::nullopt;
    }
    std::string value = result.stdout_data;
    stringutil::trim(value);
    if (value.empty()) {
      return std::nullopt;
    }
    return value;
  };
}

fs::path env_or_home(const ExecutionContext &ctx, std::string_view var,
                     const char *home_relative) {
  if (auto v = ctx.env(var)) {
    return fs::path(*v);
  }
  return ctx.base_dirs().home_dir / home_relative;
}

// Requires zsh, an existing .zshrc and the manager's own directory, then
// runs `zsh <mode> -c <script>`.
StepStatus run_zshrc_script(const ExecutionContext &ctx, const fs::path &dir,
                            const char *mode, const std::string &script) {
  auto zsh = ctx.require("zsh");
  if (!zsh) {
    return requirement_missing("zsh");
  }
  const auto rc = zshrc(ctx);
  if (auto err = require_path(rc)) {
    return err;
  }
  if (auto err = require_path(dir)) {
    return err;
  }
  return ctx.execute(*zsh)
      .args({mode, "-c",
             fmt::format("source {} && {}", stringutil::shell_quote(rc.string()),
                         script)})
      .status_checked();
}

} // namespace

fs::path zdotdir(const ExecutionContext &ctx) {
  if (auto dir = ctx.env("ZDOTDIR")) {
    return fs::path(*dir);
  }
  return ctx.base_dirs().home_dir;
}

fs::path zshrc(const ExecutionContext &ctx) { return zdotdir(ctx) / ".zshrc"; }

StepStatus run_zr(const ExecutionContext &ctx) {
  auto zsh = ctx.require("zsh");
  if (!zsh) {
    return requirement_missing("zsh");
  }
  if (!ctx.require("zr")) {
    return requirement_missing("zr");
  }
  const auto script = fmt::format(
      "source {} && zr --update", stringutil::shell_quote(zshrc(ctx).string()));
  return ctx.execute(*zsh).args({"-l", "-c", script}).status_checked();
}

StepStatus run_antibody(const ExecutionContext &ctx) {
  if (!ctx.require("zsh")) {
    return requirement_missing("zsh");
  }
  auto antibody = ctx.require("antibody");
  if (!antibody) {
    return requirement_missing("antibody");
  }
  return ctx.execute(*antibody).arg("update").status_checked();
}

StepStatus run_antidote(const ExecutionContext &ctx) {
  auto zsh = ctx.require("zsh");
  if (!zsh) {
    return requirement_missing("zsh");
  }
  const auto dir = zdotdir(ctx) / ".antidote";
  if (auto err = require_path(dir)) {
    return err;
  }
  const auto script = fmt::format(
      "source {} && antidote update",
      stringutil::shell_quote((dir / "antidote.zsh").string()));
  return ctx.execute(*zsh).args({"-c", script}).status_checked();
}

StepStatus run_antigen(const ExecutionContext &ctx) {
  return run_zshrc_script(ctx, env_or_home(ctx, "ADOTDIR", "antigen.zsh"),
                          "-l", "(antigen selfupdate ; antigen update)");
}

StepStatus run_zgenom(const ExecutionContext &ctx) {
  return run_zshrc_script(ctx, env_or_home(ctx, "ZGEN_SOURCE", ".zgenom"),
                          "-l", "zgenom selfupdate && zgenom update");
}

StepStatus run_zplug(const ExecutionContext &ctx) {
  auto zsh = ctx.require("zsh");
  if (!zsh) {
    return requirement_missing("zsh");
  }
  if (auto err = require_path(zshrc(ctx))) {
    return err;
  }
  if (auto err = require_path(env_or_home(ctx, "ZPLUG_HOME", ".zplug"))) {
    return err;
  }
  return ctx.execute(*zsh).args({"-i", "-c", "zplug update"}).status_checked();
}

StepStatus run_zinit(const ExecutionContext &ctx) {
  return run_zshrc_script(ctx, env_or_home(ctx, "ZINIT_HOME", ".zinit"), "-i",
                          "zinit self-update && zinit update --all");
}

StepStatus run_zi(const ExecutionContext &ctx) {
  return run_zshrc_script(ctx, ctx.base_dirs().home_dir / ".zi", "-i",
                          "zi self-update && zi update --all");
}

StepStatus run_zim(const ExecutionContext &ctx) {
  auto zsh = ctx.require("zsh");
  if (!zsh) {
    return requirement_missing("zsh");
  }
  const auto zim_home = resolve_path(
      ctx.env("ZIM_HOME"),
      shell_probe(ctx, *zsh, "[[ -n ${ZIM_HOME} ]] && print -n ${ZIM_HOME}"),
      ctx.base_dirs().home_dir / ".zim");
  if (auto err = require_path(zim_home)) {
    return err;
  }
  return ctx.execute(*zsh)
      .args({"-i", "-c", "zimfw upgrade && zimfw update"})
      .status_checked();
}

StepStatus run_oh_my_zsh(const ExecutionContext &ctx) {
  auto zsh = ctx.require("zsh");
  if (!zsh) {
    return requirement_missing("zsh");
  }
  const auto oh_my_zsh = ctx.base_dirs().home_dir / ".oh-my-zsh";
  if (auto err = require_path(oh_my_zsh)) {
    return err;
  }

  const auto custom_dir = resolve_path(
      ctx.env("ZSH_CUSTOM"),
      shell_probe(ctx, *zsh, "test $ZSH_CUSTOM && echo -n $ZSH_CUSTOM"),
      oh_my_zsh / "custom");
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << "oh-my-zsh custom dir: " << custom_dir.string();

  git::Repositories custom_repos;
  if (auto err = custom_repos.discover(custom_dir)) {
    return err;
  }
  custom_repos.remove(oh_my_zsh);

  if (!custom_repos.empty()) {
    ctx.output().line("Pulling custom plugins and themes");
    auto summary = ctx.git().multi_pull(custom_repos, ctx);
    if (auto err = summary.to_error()) {
      return err;
    }
  }

  return ctx.execute(*zsh)
      .env("ZSH", oh_my_zsh.string())
      .arg((oh_my_zsh / "tools" / "upgrade.sh").string())
      .status_checked();
}

} // namespace zsh

void register_zsh_steps(StepRegistry &registry) {
  registry.add(make_step("zr", zsh::run_zr));
  registry.add(make_step("antibody", zsh::run_antibody));
  registry.add(make_step("antidote", zsh::run_antidote));
  registry.add(make_step("antigen", zsh::run_antigen));
  registry.add(make_step("zgenom", zsh::run_zgenom));
  registry.add(make_step("zplug", zsh::run_zplug));
  registry.add(make_step("zinit", zsh::run_zinit));
  registry.add(make_step("zi", zsh::run_zi));
  registry.add(make_step("zim", zsh::run_zim));
  registry.add(make_step("oh-my-zsh", zsh::run_oh_my_zsh,
                         {zsh::kOhMyZshRestartCode}));
}

} // namespace updatectrl::steps
