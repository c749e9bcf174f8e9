#include "git/repositories.hpp"

#include <fmt/format.h>
#include <system_error>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"

namespace updatectrl::git {

std::string canonical_key(const fs::path &path) {
  std::error_code ec;
  auto canonical = fs::canonical(path, ec);
  if (!ec) {
    return canonical.string();
  }
  auto absolute = fs::absolute(path, ec);
  if (ec) {
    return path.lexically_normal().string();
  }
  auto normal = absolute.lexically_normal().string();
  if (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  return normal;
}

bool Repositories::insert_if_repo(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path / ".git", ec)) {
    return false;
  }
  BOOST_LOG_SEV(app_logger(), trivial::trace)
      << "Found git repository " << path.string();
  return insert(path);
}

bool Repositories::insert(const fs::path &path) {
  auto key = canonical_key(path);
  return repos_.emplace(key, fs::path(key)).second;
}

bool Repositories::remove(const fs::path &path) {
  return repos_.erase(canonical_key(path)) > 0;
}

bool Repositories::contains(const fs::path &path) const {
  return repos_.count(canonical_key(path)) > 0;
}

std::optional<Error> Repositories::discover(const fs::path &root,
                                            int max_depth) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return make_error(
        my_errors::IO::TRAVERSAL_FAILED,
        fmt::format("cannot walk {}: {}", root.string(),
                    ec ? ec.message() : "not a directory"));
  }

  insert_if_repo(root);
  if (max_depth <= 0) {
    return std::nullopt;
  }

  fs::recursive_directory_iterator it(root, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    // iterator depth 0 is one level below root
    if (it.depth() + 1 >= max_depth) {
      it.disable_recursion_pending();
    }
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      insert_if_repo(it->path());
    }
    it.increment(ec);
  }
  if (ec) {
    return make_error(my_errors::IO::TRAVERSAL_FAILED,
                      fmt::format("error walking {}: {}", root.string(),
                                  ec.message()));
  }
  return std::nullopt;
}

std::vector<fs::path> Repositories::paths() const {
  std::vector<fs::path> out;
  out.reserve(repos_.size());
  for (const auto &[key, path] : repos_) {
    out.push_back(path);
  }
  return out;
}

} // namespace updatectrl::git
