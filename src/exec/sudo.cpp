#include "exec/sudo.hpp"

#include <array>
#include <utility>

#include "util/my_logging.hpp"

namespace updatectrl {

std::optional<Sudo> Sudo::detect(RequirementResolver &resolver) {
  static constexpr std::array<std::pair<Kind, std::string_view>, 3> kCandidates{
      {{Kind::Sudo, "sudo"}, {Kind::Doas, "doas"}, {Kind::Pkexec, "pkexec"}}};

  for (const auto &[kind, name] : kCandidates) {
    if (auto path = resolver.require(name)) {
      return Sudo(kind, std::move(*path));
    }
  }
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << "No privilege escalation helper found";
  return std::nullopt;
}

std::string_view Sudo::name() const {
  switch (kind_) {
  case Kind::Sudo:
    return "sudo";
  case Kind::Doas:
    return "doas";
  case Kind::Pkexec:
    return "pkexec";
  }
  return "sudo";
}

} // namespace updatectrl
