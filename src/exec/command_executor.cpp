#include "exec/command_executor.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <map>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

extern char **environ;

namespace updatectrl {

std::string describe(const CommandSpec &spec) {
  std::vector<std::string> parts;
  parts.reserve(spec.env.size() + spec.args.size() + 1);
  for (const auto &[key, value] : spec.env) {
    parts.push_back(key + "=" + stringutil::shell_quote(value));
  }
  parts.push_back(stringutil::shell_quote(spec.program.string()));
  for (const auto &arg : spec.args) {
    parts.push_back(stringutil::shell_quote(arg));
  }
  std::string rendered = stringutil::join(parts, " ");
  if (spec.cwd) {
    rendered += fmt::format(" (in {})", spec.cwd->string());
  }
  return rendered;
}

namespace {

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct Pipe {
  int read_end{-1};
  int write_end{-1};

  bool open(int flags) {
    int fds[2];
    if (::pipe2(fds, flags) == -1) {
      return false;
    }
    read_end = fds[0];
    write_end = fds[1];
    return true;
  }

  ~Pipe() {
    close_fd(read_end);
    close_fd(write_end);
  }
};

// Inherited environment merged with the overrides, prepared before fork so
// the child does not allocate.
std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::map<std::string, std::string> merged;
  for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
    std::string entry(*e);
    auto eq = entry.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    merged[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  for (const auto &[key, value] : overrides) {
    merged[key] = value;
  }

  std::vector<std::string> envp;
  envp.reserve(merged.size());
  for (const auto &[key, value] : merged) {
    envp.push_back(key + "=" + value);
  }
  return envp;
}

// Drains both pipes until EOF without letting either one fill up.
std::optional<Error> read_both(int &out_fd, int &err_fd, std::string &out,
                               std::string &err) {
  char buffer[4096];
  while (out_fd >= 0 || err_fd >= 0) {
    struct pollfd fds[2];
    nfds_t count = 0;
    int *owners[2] = {nullptr, nullptr};
    std::string *targets[2] = {nullptr, nullptr};
    if (out_fd >= 0) {
      fds[count] = {out_fd, POLLIN, 0};
      owners[count] = &out_fd;
      targets[count] = &out;
      ++count;
    }
    if (err_fd >= 0) {
      fds[count] = {err_fd, POLLIN, 0};
      owners[count] = &err_fd;
      targets[count] = &err;
      ++count;
    }

    if (::poll(fds, count, -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      return make_error(my_errors::EXEC::PIPE_FAILED,
                        std::string("poll failed: ") + std::strerror(errno));
    }

    for (nfds_t i = 0; i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        targets[i]->append(buffer, static_cast<std::size_t>(n));
      } else if (n == 0) {
        close_fd(*owners[i]);
      } else if (errno != EINTR) {
        close_fd(*owners[i]);
        return make_error(my_errors::EXEC::PIPE_FAILED,
                          std::string("read failed: ") + std::strerror(errno));
      }
    }
  }
  return std::nullopt;
}

} // namespace

CommandResult PosixCommandExecutor::run(const CommandSpec &spec) {
  CommandResult result;
  const std::string program = spec.program.string();
  const std::string rendered = describe(spec);

  if (program.empty()) {
    result.error = make_error(my_errors::EXEC::SPAWN_FAILED,
                              "cannot run a command without a program");
    return result;
  }

  std::vector<std::string> argv_storage;
  argv_storage.reserve(spec.args.size() + 1);
  argv_storage.push_back(program);
  argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
  std::vector<char *> argv;
  argv.reserve(argv_storage.size() + 1);
  for (auto &s : argv_storage) {
    argv.push_back(s.data());
  }
  argv.push_back(nullptr);

  std::vector<std::string> env_storage = build_environment(spec.env);
  std::vector<char *> envp;
  envp.reserve(env_storage.size() + 1);
  for (auto &s : env_storage) {
    envp.push_back(s.data());
  }
  envp.push_back(nullptr);

  // The child reports a failed exec by writing errno here; a successful exec
  // closes it through O_CLOEXEC.
  Pipe exec_status;
  Pipe stdout_pipe;
  Pipe stderr_pipe;
  if (!exec_status.open(O_CLOEXEC) ||
      (spec.capture_output &&
       (!stdout_pipe.open(O_CLOEXEC) || !stderr_pipe.open(O_CLOEXEC)))) {
    result.error = make_error(
        my_errors::EXEC::PIPE_FAILED,
        fmt::format("failed to create pipes for '{}': {}", rendered,
                    std::strerror(errno)));
    return result;
  }

  int dev_null = -1;
  if (spec.capture_output) {
    dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  }
  const std::string cwd = spec.cwd ? spec.cwd->string() : std::string{};

  BOOST_LOG_SEV(app_logger(), trivial::debug) << "Executing: " << rendered;

  pid_t pid = ::fork();
  if (pid < 0) {
    close_fd(dev_null);
    result.error = make_error(
        my_errors::EXEC::SPAWN_FAILED,
        fmt::format("fork failed for '{}': {}", rendered, std::strerror(errno)));
    return result;
  }

  if (pid == 0) {
    // child: async-signal-safe calls only
    int child_errno = 0;
    if (spec.capture_output) {
      if ((dev_null >= 0 && ::dup2(dev_null, STDIN_FILENO) == -1) ||
          ::dup2(stdout_pipe.write_end, STDOUT_FILENO) == -1 ||
          ::dup2(stderr_pipe.write_end, STDERR_FILENO) == -1) {
        child_errno = errno;
      }
    }
    if (child_errno == 0 && !cwd.empty() && ::chdir(cwd.c_str()) == -1) {
      child_errno = errno;
    }
    if (child_errno == 0) {
      ::execvpe(argv[0], argv.data(), envp.data());
      child_errno = errno;
    }
    ssize_t ignored =
        ::write(exec_status.write_end, &child_errno, sizeof(child_errno));
    (void)ignored;
    ::_exit(127);
  }

  // parent
  close_fd(dev_null);
  close_fd(exec_status.write_end);
  close_fd(stdout_pipe.write_end);
  close_fd(stderr_pipe.write_end);

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_status.read_end, &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);

  std::optional<Error> pipe_error;
  if (n <= 0 && spec.capture_output) {
    pipe_error = read_both(stdout_pipe.read_end, stderr_pipe.read_end,
                           result.stdout_data, result.stderr_data);
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      result.error = make_error(
          my_errors::EXEC::WAIT_FAILED,
          fmt::format("waitpid failed for '{}': {}", rendered,
                      std::strerror(errno)));
      return result;
    }
  }

  if (n > 0) {
    result.error = make_error(
        my_errors::EXEC::SPAWN_FAILED,
        fmt::format("failed to run '{}': {}", rendered,
                    std::strerror(child_errno)));
    return result;
  }
  if (pipe_error) {
    result.error = std::move(pipe_error);
    return result;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + WTERMSIG(status);
  }

  BOOST_LOG_SEV(app_logger(), trivial::trace)
      << "'" << rendered << "' exited with " << result.exit_code;
  return result;
}

CommandResult DryRunCommandExecutor::run(const CommandSpec &spec) {
  std::string rendered = describe(spec);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(rendered);
  }
  output_.line("Dry running: " + rendered);
  BOOST_LOG_SEV(app_logger(), trivial::debug) << "Dry running: " << rendered;

  CommandResult result;
  result.exit_code = 0;
  result.dry_run = true;
  return result;
}

} // namespace updatectrl
