#pragma once

#include <filesystem>

#include "execution_context.hpp"
#include "steps/step.hpp"
#include "steps/step_registry.hpp"

namespace updatectrl::steps {

namespace zsh {

// $ZDOTDIR, else the home directory.
std::filesystem::path zdotdir(const ExecutionContext &ctx);
std::filesystem::path zshrc(const ExecutionContext &ctx);

StepStatus run_zr(const ExecutionContext &ctx);
StepStatus run_antibody(const ExecutionContext &ctx);
StepStatus run_antidote(const ExecutionContext &ctx);
StepStatus run_antigen(const ExecutionContext &ctx);
StepStatus run_zgenom(const ExecutionContext &ctx);
StepStatus run_zplug(const ExecutionContext &ctx);
StepStatus run_zinit(const ExecutionContext &ctx);
StepStatus run_zi(const ExecutionContext &ctx);
StepStatus run_zim(const ExecutionContext &ctx);
StepStatus run_oh_my_zsh(const ExecutionContext &ctx);

// Exit code of tools/upgrade.sh when oh-my-zsh asks for a shell restart.
inline constexpr int kOhMyZshRestartCode = 80;

} // namespace zsh

void register_zsh_steps(StepRegistry &registry);

} // namespace updatectrl::steps
