#include "util/string_util.hpp"

#include <cctype>
#include <cstdint>

namespace updatectrl {
namespace stringutil {

bool is_valid_utf8(std::string_view data) {
  std::size_t i = 0;
  const std::size_t n = data.size();
  while (i < n) {
    const auto c = static_cast<unsigned char>(data[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }

    std::size_t len = 0;
    std::uint32_t cp = 0;
    std::uint32_t min = 0;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
      min = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
      min = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
      min = 0x10000;
    } else {
      return false;
    }

    if (i + len > n) {
      return false;
    }
    for (std::size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(data[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += len;
  }
  return true;
}

std::string shell_quote(std::string_view arg) {
  if (arg.empty()) {
    return "''";
  }
  bool plain = true;
  for (char ch : arg) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) || ch == '-' || ch == '_' || ch == '.' ||
          ch == '/' || ch == '=' || ch == ':' || ch == ',' || ch == '+' ||
          ch == '@' || ch == '%')) {
      plain = false;
      break;
    }
  }
  if (plain) {
    return std::string(arg);
  }

  std::string out;
  out.reserve(arg.size() + 2);
  out.push_back('\'');
  for (char ch : arg) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(sep);
    }
    out += parts[i];
  }
  return out;
}

std::vector<std::string> split_path_list(std::string_view list) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (start <= list.size()) {
    auto colon = list.find(':', start);
    if (colon == std::string_view::npos) {
      colon = list.size();
    }
    if (colon > start) {
      parts.emplace_back(list.substr(start, colon - start));
    }
    start = colon + 1;
  }
  return parts;
}

} // namespace stringutil
} // namespace updatectrl
