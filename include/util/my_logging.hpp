#pragma once

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <cstddef>
#include <filesystem>
#include <fmt/format.h>
#include <iostream>
#include <string>

#include "common_macros.hpp"

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace sinks = boost::log::sinks;
namespace trivial = logging::trivial;

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(
    app_logger_storage, src::severity_logger_mt<trivial::severity_level>)

inline src::severity_logger_mt<trivial::severity_level> &app_logger() {
  return app_logger_storage::get();
}

namespace updatectrl {

struct LoggingConfig {
  bool enabled{true};
  std::string level{"info"};
  std::filesystem::path log_dir;
  std::string log_file{"update-ctrl"};
  std::size_t rotation_size{10 * 1024 * 1024};
  // stderr sink at debug/trace; off under --silent
  bool console{true};
};

inline trivial::severity_level parse_severity(const std::string &level) {
  if (level == "trace") {
    return trivial::trace;
  } else if (level == "debug") {
    return trivial::debug;
  } else if (level == "info") {
    return trivial::info;
  } else if (level == "warning") {
    return trivial::warning;
  } else if (level == "error") {
    return trivial::error;
  } else if (level == "fatal") {
    return trivial::fatal;
  }
  return trivial::info;
}

// Until init_my_log runs, records would reach Boost.Log's default clog sink.
inline void suspend_logging() {
  logging::core::get()->set_logging_enabled(false);
}

// Core stays disabled when no sink is installed, so nothing falls through to
// the default sink.
inline void init_my_log(const LoggingConfig &loggingConfig) {
  logging::add_common_attributes();
  bool has_sink = false;

  if (loggingConfig.enabled && !loggingConfig.log_dir.empty()) {
    std::string logfile = fmt::format("{}/{}_%N.log",
                                      loggingConfig.log_dir.string(),
                                      loggingConfig.log_file);

    auto sink = logging::add_file_log(
        logging::keywords::file_name = logfile,
        logging::keywords::rotation_size = loggingConfig.rotation_size,
        logging::keywords::format =
            "[%TimeStamp%] [%Severity%]: %Message%" /*< log record format >*/,
        logging::keywords::auto_flush = true,
        logging::keywords::open_mode = std::ios_base::app);
    // Set file collector with maximum total size or max number of files
    sink->locked_backend()->set_file_collector(
        logging::sinks::file::make_collector(
            logging::keywords::target =
                loggingConfig.log_dir.string(), // directory to store logs
            logging::keywords::max_size = loggingConfig.rotation_size * 10,
            logging::keywords::max_files =
                10 // <== limit number of rotated log files
            ));

    sink->locked_backend()->scan_for_files();
    has_sink = true;
  }

  auto severity = parse_severity(loggingConfig.level);
  if (loggingConfig.console && severity <= trivial::debug) {
    logging::add_console_log(
        std::clog, logging::keywords::format = "[%Severity%] %Message%");
    has_sink = true;
  }
  logging::core::get()->set_filter(trivial::severity >= severity);
  logging::core::get()->set_logging_enabled(has_sink);
}

} // namespace updatectrl
