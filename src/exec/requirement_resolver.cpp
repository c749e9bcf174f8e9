#include "exec/requirement_resolver.hpp"

#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include <sys/stat.h>

#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace updatectrl {

namespace fs = std::filesystem;

namespace {

bool is_executable(const std::string &p) {
  struct stat st {};
  if (::stat(p.c_str(), &st) != 0) {
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    return false;
  }
  return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

fs::path absolute_or_self(const fs::path &p) {
  std::error_code ec;
  auto abs = fs::absolute(p, ec);
  return ec ? p : abs.lexically_normal();
}

} // namespace

RequirementResolver::RequirementResolver(std::string_view search_path)
    : dirs_(stringutil::split_path_list(search_path)) {}

RequirementResolver RequirementResolver::from_environment() {
  const char *path_env = std::getenv("PATH");
  return RequirementResolver(path_env ? std::string_view(path_env)
                                      : std::string_view{});
}

std::optional<fs::path> RequirementResolver::require(std::string_view name) {
  if (name.empty()) {
    throw std::invalid_argument("requirement name must not be empty");
  }
  std::string key(name);

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = cache_.find(key); it != cache_.end()) {
    return it->second;
  }

  auto found = lookup(key);
  if (found) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Detected " << key << " as " << found->string();
  } else {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Cannot find " << key << " in PATH";
  }
  cache_.emplace(std::move(key), found);
  return found;
}

std::size_t RequirementResolver::cached_lookups() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

std::optional<fs::path>
RequirementResolver::lookup(const std::string &name) const {
  if (name.find('/') != std::string::npos) {
    if (is_executable(name)) {
      return absolute_or_self(name);
    }
    return std::nullopt;
  }
  for (const auto &dir : dirs_) {
    std::string full = dir + '/' + name;
    if (is_executable(full)) {
      return absolute_or_self(full);
    }
  }
  return std::nullopt;
}

} // namespace updatectrl
