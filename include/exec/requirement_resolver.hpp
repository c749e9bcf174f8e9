#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace updatectrl {

// Locates programs on a search path fixed at construction and memoizes every
// answer, hits and misses alike, for the lifetime of the resolver (one run).
// Safe to call from several threads.
class RequirementResolver {
public:
  explicit RequirementResolver(std::string_view search_path);

  // Reads PATH once.
  static RequirementResolver from_environment();

  // Absolute path of `name`, or nullopt when it is not installed. A name
  // containing '/' is checked as a path instead of searched.
  // Throws std::invalid_argument for an empty name.
  std::optional<std::filesystem::path> require(std::string_view name);

  const std::vector<std::string> &search_dirs() const { return dirs_; }
  std::size_t cached_lookups() const;

private:
  std::vector<std::string> dirs_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::optional<std::filesystem::path>> cache_;

  std::optional<std::filesystem::path> lookup(const std::string &name) const;
};

} // namespace updatectrl
