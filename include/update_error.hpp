#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include "my_error_codes.hpp"

namespace updatectrl {

enum class ErrorKind {
  RequirementMissing,
  NotApplicable,
  SpawnFailure,
  NonZeroExit,
  IOFailure,
  Unexpected,
};

struct Error {
  int code{my_errors::GENERAL::UNEXPECTED_RESULT};
  std::string what;
  // Set when a process ran to completion with a rejected status.
  std::optional<int> exit_code;

  ErrorKind kind() const {
    switch (code) {
    case my_errors::REQUIREMENT::MISSING:
      return ErrorKind::RequirementMissing;
    case my_errors::REQUIREMENT::PATH_MISSING:
    case my_errors::REQUIREMENT::NOT_APPLICABLE:
      return ErrorKind::NotApplicable;
    case my_errors::EXEC::SPAWN_FAILED:
      return ErrorKind::SpawnFailure;
    case my_errors::EXEC::NON_ZERO_EXIT:
    case my_errors::EXEC::KILLED_BY_SIGNAL:
      return ErrorKind::NonZeroExit;
    case my_errors::EXEC::OUTPUT_NOT_UTF8:
    case my_errors::EXEC::WAIT_FAILED:
    case my_errors::EXEC::PIPE_FAILED:
    case my_errors::IO::TRAVERSAL_FAILED:
    case my_errors::IO::CANONICALIZE_FAILED:
    case my_errors::GENERAL::FILE_NOT_FOUND:
    case my_errors::GENERAL::FILE_READ_WRITE:
      return ErrorKind::IOFailure;
    default:
      return ErrorKind::Unexpected;
    }
  }
};

inline Error make_error(int code, std::string what) {
  return Error{code, std::move(what), std::nullopt};
}

inline Error requirement_missing(const std::string &name) {
  return make_error(my_errors::REQUIREMENT::MISSING,
                    "cannot find " + name + " in PATH");
}

inline Error exited_with(int exit_code, std::string what) {
  return Error{my_errors::EXEC::NON_ZERO_EXIT, std::move(what), exit_code};
}

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::RequirementMissing:
    return "requirement missing";
  case ErrorKind::NotApplicable:
    return "not applicable";
  case ErrorKind::SpawnFailure:
    return "spawn failure";
  case ErrorKind::NonZeroExit:
    return "non-zero exit";
  case ErrorKind::IOFailure:
    return "io failure";
  case ErrorKind::Unexpected:
    return "unexpected";
  }
  return "unknown";
}

inline std::ostream &operator<<(std::ostream &os, const Error &e) {
  os << e.what << " (code " << e.code << ")";
  return os;
}

} // namespace updatectrl
