#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "exec/command_executor.hpp"
#include "exec/requirement_resolver.hpp"
#include "execution_context.hpp"
#include "git/git_client.hpp"
#include "util/path_util.hpp"

namespace testinfra {

namespace fs = std::filesystem;

// Unique scratch directory, removed with its content on destruction.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    for (int attempt = 0; attempt < 16; ++attempt) {
      auto candidate = fs::temp_directory_path() /
                       ("update-ctrl-test-" + std::to_string(gen()));
      std::error_code ec;
      if (fs::create_directory(candidate, ec)) {
        path_ = fs::canonical(candidate);
        return;
      }
    }
    throw std::runtime_error("Failed to create temporary directory");
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }

  fs::path make_dir(const fs::path &rel) const {
    auto p = path_ / rel;
    fs::create_directories(p);
    return p;
  }

  // Directory holding a .git marker directory.
  fs::path make_repo(const fs::path &rel) const {
    auto p = make_dir(rel);
    fs::create_directories(p / ".git");
    return p;
  }

  fs::path write_file(const fs::path &rel, const std::string &content,
                      bool executable = false) const {
    auto p = path_ / rel;
    if (p.has_parent_path()) {
      fs::create_directories(p.parent_path());
    }
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("Failed to write " + p.string());
    }
    ofs << content;
    ofs.close();
    if (executable) {
      fs::permissions(p,
                      fs::perms::owner_all | fs::perms::group_read |
                          fs::perms::group_exec | fs::perms::others_read |
                          fs::perms::others_exec,
                      fs::perm_options::replace);
    }
    return p;
  }

  // /bin/sh script under bin/ so the directory can act as a search path.
  fs::path write_script(const std::string &name, const std::string &body) const {
    return write_file(fs::path("bin") / name, "#!/bin/sh\n" + body + "\n", true);
  }

private:
  fs::path path_;
};

// Sets or unsets a process environment variable for the guard's lifetime.
class EnvVarGuard {
public:
  EnvVarGuard(std::string name, const std::optional<std::string> &value)
      : name_(std::move(name)) {
    if (const char *old = std::getenv(name_.c_str())) {
      previous_ = std::string(old);
    }
    if (value) {
      ::setenv(name_.c_str(), value->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

  ~EnvVarGuard() {
    if (previous_) {
      ::setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

  EnvVarGuard(const EnvVarGuard &) = delete;
  EnvVarGuard &operator=(const EnvVarGuard &) = delete;

private:
  std::string name_;
  std::optional<std::string> previous_;
};

// Records every spec it is asked to run and answers with scripted results.
// Unscripted invocations exit 0 with empty output.
class FakeCommandExecutor : public updatectrl::ICommandExecutor {
public:
  struct Reply {
    int exit_code{0};
    std::string stdout_data;
    std::string stderr_data;
  };
  using Responder = std::function<std::optional<Reply>(
      const updatectrl::CommandSpec &)>;

  // Reply for every invocation whose program file name is `program`.
  void on_program(const std::string &program, Reply reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    by_program_[program] = std::move(reply);
  }

  // Consulted before the per-program replies.
  void on(Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    responders_.push_back(std::move(responder));
  }

  updatectrl::CommandResult run(const updatectrl::CommandSpec &spec) override {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(spec);
    Reply reply;
    bool matched = false;
    for (const auto &responder : responders_) {
      if (auto r = responder(spec)) {
        reply = *r;
        matched = true;
        break;
      }
    }
    if (!matched) {
      if (auto it = by_program_.find(spec.program.filename().string());
          it != by_program_.end()) {
        reply = it->second;
      }
    }
    updatectrl::CommandResult result;
    result.exit_code = reply.exit_code;
    if (spec.capture_output) {
      result.stdout_data = reply.stdout_data;
      result.stderr_data = reply.stderr_data;
    }
    return result;
  }

  std::vector<updatectrl::CommandSpec> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  std::size_t invocation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
  }

  // Calls whose arguments include `needle`.
  std::size_t count_with_arg(const std::string &needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto &c : calls_) {
      for (const auto &a : c.args) {
        if (a == needle) {
          ++n;
          break;
        }
      }
    }
    return n;
  }

private:
  mutable std::mutex mutex_;
  std::vector<updatectrl::CommandSpec> calls_;
  std::map<std::string, Reply> by_program_;
  std::vector<Responder> responders_;
};

// Everything an ExecutionContext borrows, rooted in a temporary home.
// Programs are "installed" by creating executables in home/bin, which is the
// resolver's only search directory.
struct ContextHarness {
  TempDir home;
  updatectrl::Environment env;
  std::ostringstream console_buffer;
  customio::ConsoleOutput output{console_buffer, false};
  FakeCommandExecutor executor;
  std::unique_ptr<updatectrl::RequirementResolver> resolver;
  std::unique_ptr<updatectrl::git::GitClient> git;
  std::unique_ptr<updatectrl::ExecutionContext> ctx;

  fs::path install(const std::string &program) {
    return home.write_script(program, "exit 0");
  }

  // Builds the context. Call after installing programs and setting env vars.
  updatectrl::ExecutionContext &
  build(updatectrl::RunType run_type = updatectrl::RunType::Execute,
        std::size_t git_threads = 2) {
    home.make_dir("bin");
    resolver = std::make_unique<updatectrl::RequirementResolver>(
        (home.path() / "bin").string());
    git = std::make_unique<updatectrl::git::GitClient>(resolver->require("git"),
                                                       git_threads);
    updatectrl::BaseDirs dirs{home.path(), home.path() / ".config",
                              home.path() / ".local" / "share"};
    ctx = std::make_unique<updatectrl::ExecutionContext>(
        run_type, dirs, env, *resolver, executor, *git, std::nullopt, output);
    return *ctx;
  }
};

inline std::string joined_args(const updatectrl::CommandSpec &spec) {
  std::string out;
  for (const auto &a : spec.args) {
    if (!out.empty()) {
      out += ' ';
    }
    out += a;
  }
  return out;
}

} // namespace testinfra
