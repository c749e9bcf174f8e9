// Auto-generated from error_codes.ini
#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
constexpr int CONFIG_INVALID = 5023;  // Configuration file rejected
}  // namespace GENERAL

namespace REQUIREMENT {  // Requirement errors

constexpr int MISSING = 6000;  // Program not found on the search path
constexpr int PATH_MISSING = 6001;  // Required file or directory absent
constexpr int NOT_APPLICABLE = 6002;  // Step does not apply to this system
}  // namespace REQUIREMENT

namespace EXEC {  // Process execution errors

constexpr int SPAWN_FAILED = 7000;  // Program could not be launched
constexpr int NON_ZERO_EXIT = 7001;  // Program exited with an unexpected status
constexpr int KILLED_BY_SIGNAL = 7002;  // Program terminated by a signal
constexpr int OUTPUT_NOT_UTF8 = 7003;  // Captured output is not valid UTF-8
constexpr int WAIT_FAILED = 7004;  // waitpid failed
constexpr int PIPE_FAILED = 7005;  // Pipe creation or read failed
}  // namespace EXEC

namespace IO {  // Filesystem errors

constexpr int TRAVERSAL_FAILED = 8000;  // Directory walk failed
constexpr int CANONICALIZE_FAILED = 8001;  // Path could not be canonicalized
}  // namespace IO

namespace GIT {  // Git errors

constexpr int PULL_FAILED = 8100;  // One or more repositories failed to update
}  // namespace GIT

}  // namespace my_errors
