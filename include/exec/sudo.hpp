#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

#include "exec/requirement_resolver.hpp"

namespace updatectrl {

class Sudo {
public:
  enum class Kind { Sudo, Doas, Pkexec };

  Sudo(Kind kind, std::filesystem::path path)
      : kind_(kind), path_(std::move(path)) {}

  // First of sudo, doas, pkexec found on the search path.
  static std::optional<Sudo> detect(RequirementResolver &resolver);

  Kind kind() const { return kind_; }
  const std::filesystem::path &path() const { return path_; }
  std::string_view name() const;

private:
  Kind kind_;
  std::filesystem::path path_;
};

} // namespace updatectrl
