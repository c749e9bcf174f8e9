#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "update_error.hpp"

namespace updatectrl::git {

namespace fs = std::filesystem;

// Canonical form of `path` used as the set key; falls back to the lexically
// normalized absolute path when the target does not resolve.
std::string canonical_key(const fs::path &path);

// A deduplicated set of git working-tree roots, keyed by canonical path.
// Built for one step and dropped with it.
class Repositories {
public:
  static constexpr int kDefaultMaxDepth = 2;

  // Inserts `path` when it holds a .git marker. Returns true only when the
  // set grew.
  bool insert_if_repo(const fs::path &path);
  // Inserts unconditionally. Returns false for a duplicate.
  bool insert(const fs::path &path);
  bool remove(const fs::path &path);
  bool contains(const fs::path &path) const;

  // Walks `root` itself plus entries up to `max_depth` levels below it.
  // Errors while walking (missing or unreadable directories) stop the walk and
  // are returned as IOFailure; repositories found so far are kept.
  std::optional<Error> discover(const fs::path &root,
                                int max_depth = kDefaultMaxDepth);

  bool empty() const { return repos_.empty(); }
  std::size_t size() const { return repos_.size(); }

  // Sorted by key.
  std::vector<fs::path> paths() const;

private:
  std::map<std::string, fs::path> repos_;
};

} // namespace updatectrl::git
