#include "exec/command.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <utility>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace updatectrl {

namespace {

constexpr std::size_t kStderrExcerpt = 512;

std::optional<Error> check_status(const CommandResult &result,
                                  const std::string &rendered,
                                  const std::vector<int> &accepted) {
  if (result.error) {
    return result.error;
  }
  if (result.dry_run || result.exit_code == 0) {
    return std::nullopt;
  }
  if (!result.term_signal &&
      std::find(accepted.begin(), accepted.end(), result.exit_code) !=
          accepted.end()) {
    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "'" << rendered << "' exited with accepted code "
        << result.exit_code;
    return std::nullopt;
  }

  if (result.term_signal) {
    Error e = make_error(
        my_errors::EXEC::KILLED_BY_SIGNAL,
        fmt::format("'{}' was killed by signal {}", rendered,
                    *result.term_signal));
    e.exit_code = result.exit_code;
    return e;
  }
  std::string what = fmt::format("'{}' failed with exit code {}", rendered,
                                 result.exit_code);
  if (!result.stderr_data.empty()) {
    std::string excerpt = result.stderr_data.size() > kStderrExcerpt
                              ? result.stderr_data.substr(
                                    result.stderr_data.size() - kStderrExcerpt)
                              : result.stderr_data;
    stringutil::trim(excerpt);
    if (!excerpt.empty()) {
      what += ": " + excerpt;
    }
  }
  return exited_with(result.exit_code, std::move(what));
}

} // namespace

Command::Command(ICommandExecutor &executor, std::filesystem::path program)
    : executor_(&executor) {
  spec_.program = std::move(program);
}

Command &Command::arg(std::string value) {
  spec_.args.push_back(std::move(value));
  return *this;
}

Command &Command::args(std::initializer_list<std::string> values) {
  spec_.args.insert(spec_.args.end(), values.begin(), values.end());
  return *this;
}

Command &Command::args(const std::vector<std::string> &values) {
  spec_.args.insert(spec_.args.end(), values.begin(), values.end());
  return *this;
}

Command &Command::env(std::string key, std::string value) {
  spec_.env.emplace_back(std::move(key), std::move(value));
  return *this;
}

Command &Command::current_dir(std::filesystem::path dir) {
  spec_.cwd = std::move(dir);
  return *this;
}

std::optional<Error> Command::status_checked() const {
  return status_checked_with_codes({});
}

std::optional<Error>
Command::status_checked_with_codes(const std::vector<int> &accepted) const {
  CommandSpec spec = spec_;
  spec.capture_output = false;
  return check_status(executor_->run(spec), describe(), accepted);
}

CommandResult Command::output_checked() const {
  CommandSpec spec = spec_;
  spec.capture_output = true;
  CommandResult result = executor_->run(spec);
  if (!result.error) {
    result.error = check_status(result, describe(), {});
  }
  return result;
}

CommandResult Command::output_checked_utf8() const {
  CommandResult result = output_checked();
  if (!result.error && !result.dry_run &&
      !stringutil::is_valid_utf8(result.stdout_data)) {
    result.error = make_error(
        my_errors::EXEC::OUTPUT_NOT_UTF8,
        fmt::format("'{}' produced output that is not valid UTF-8",
                    describe()));
  }
  return result;
}

} // namespace updatectrl
