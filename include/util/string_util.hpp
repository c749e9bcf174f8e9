#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace updatectrl {
namespace stringutil {

// Trim leading and trailing whitespace from a string
inline void trim(std::string &str) {
  const char *ws = " \t\r\n";
  auto first = str.find_first_not_of(ws);
  if (first == std::string::npos) {
    str.clear();
    return;
  }
  auto last = str.find_last_not_of(ws);
  str = str.substr(first, last - first + 1);
}

/**
 * @brief Strict UTF-8 validation (rejects overlongs, surrogates and code
 * points above U+10FFFF).
 */
bool is_valid_utf8(std::string_view data);

/**
 * @brief Quote an argument the way a POSIX shell would need it, leaving
 * plain words untouched. Used to render commands for humans.
 */
std::string shell_quote(std::string_view arg);

std::string join(const std::vector<std::string> &parts, std::string_view sep);

/**
 * @brief Split a PATH-style list on ':'. Empty entries are dropped.
 */
std::vector<std::string> split_path_list(std::string_view list);

} // namespace stringutil
} // namespace updatectrl
